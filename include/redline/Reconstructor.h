#ifndef REDLINE_RECONSTRUCTOR_H
#define REDLINE_RECONSTRUCTOR_H

#include <string>
#include <map>
#include <utility>
#include "pugixml.hpp"
#include "redline/Atom.h"

namespace redline {

struct Attribution {
    std::string author;
    // ISO 8601, see timestampToIso
    std::string date;
};

// Revision ids shared by every w:ins, w:del, w:moveFrom, w:moveTo and w:rPrChange of one output
class RevisionIdState
{
public:
    int allocate() {
        return nextId++;
    }
    // Source and destination range ids of a move, allocated on first use
    std::pair<int, int> moveRangeIds(const std::string& moveName);
    // Range end written last for one side of a move; empty before its first wrapper
    pugi::xml_node moveRangeEnd(const std::string& moveName, bool source) const;
    void setMoveRangeEnd(const std::string& moveName, bool source, pugi::xml_node end) {
        moveEnds[std::make_pair(moveName, source)] = end;
    }
private:
    int nextId = 1;
    std::map<std::string, std::pair<int, int> > moveIds;
    std::map<std::pair<std::string, bool>, pugi::xml_node> moveEnds;
};

// Wraps node in a revision element carrying a fresh id
pugi::xml_node wrap_revision(pugi::xml_node node, const char* name, RevisionIdState& ids, const Attribution& by);

// Wraps node in w:moveFrom (source) or w:moveTo. Each side of a move gets one range:
// the first wrapper is placed between the range start and end, later nodes join the wrapper
// right before the range end or get a wrapper of their own with the range end moved after it.
// Nodes of one move must be wrapped in document order.
pugi::xml_node wrap_move(pugi::xml_node node, bool source, const std::string& moveName, RevisionIdState& ids, const Attribution& by);

// Paragraph-mark revision: w:pPr/w:rPr/<marker>
void mark_paragraph(pugi::xml_node p, const char* marker, RevisionIdState& ids, const Attribution& by);

// w:t -> w:delText and w:instrText -> w:delInstrText under node
void convert_to_deleted(pugi::xml_node node);

// Adds w:rPrChange recording oldRPr to the run's properties
void add_format_change(pugi::xml_node run, const pugi::xml_node& oldRPr, RevisionIdState& ids, const Attribution& by);

// Appends the atoms' content to a run, coalescing adjacent text into one w:t
void append_atoms_to_run(pugi::xml_node run, const Atoms& atoms);

// Every non-whitespace atom has the status, and at least one atom does
bool is_entire_paragraph_with_status(const Atoms& atoms, CorrelationStatus status);
bool is_empty_paragraph_with_status(const Atoms& atoms, CorrelationStatus status);

// Copies the revised document into out with an empty body except its trailing w:sectPr,
// returned in sectPr. Returns the body.
pugi::xml_node copy_document_shell(const pugi::xml_node& revisedRoot, pugi::xml_document& out, pugi::xml_node& sectPr);

// Builds a new document from the merged atom list. The revised document provides
// the root element, its namespaces and the trailing section properties.
void rebuild_document(const Atoms& merged, const pugi::xml_node& revisedRoot, const Attribution& by, pugi::xml_document& out);

} // namespace redline

#endif // REDLINE_RECONSTRUCTOR_H
