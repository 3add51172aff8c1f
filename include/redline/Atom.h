#ifndef REDLINE_ATOM_H
#define REDLINE_ATOM_H

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include "pugixml.hpp"
#include <boost/uuid/uuid.hpp>
#include "redline/xml-utils.h"
#include "redline/utils.h"

namespace redline {

enum class CorrelationStatus {
    Unknown,
    Equal,
    Deleted,
    Inserted,
    MovedSource,
    MovedDestination,
    FormatChanged
};

// Pipeline phases in execution order; a status is written at most once per phase.
enum class Phase {
    Atomize = 1,
    Correlate,
    DetectMoves,
    DetectFormat
};

const std::string& statusName(CorrelationStatus status);

bool is_allowed_transition(Phase phase, CorrelationStatus from, CorrelationStatus to);

typedef boost::uuids::uuid Fingerprint;
typedef std::vector<std::pair<std::string, std::string> > Attributes;

Fingerprint make_fingerprint(const std::string& content);
// Attributes are sorted and xml:space is ignored
Fingerprint fingerprint_leaf(const std::string& tag, const Attributes& attrs, const std::string& text);
std::string fingerprint_string(const Fingerprint& f);

extern const char* const EMPTY_PARAGRAPH_TAG;

struct FormatChangeDetails {
    Words added;
    Words removed;
    Words changed;
};

class FormatChangeInfo
{
public:
    // Either may be empty when the run declares no properties
    pugi::xml_node oldRunProperties;
    pugi::xml_node newRunProperties;
    Words changedProperties;
    FormatChangeDetails details;
};

typedef std::shared_ptr<FormatChangeInfo> FormatChangeInfoP;

class Atom;
typedef std::shared_ptr<Atom> AtomP;
typedef std::vector<AtomP> Atoms;

class Atom
{
public:
    Atom() {}
    Atom(const pugi::xml_node& leaf, const xml_nodes& ancestors_, const std::string& part_);

    CorrelationStatus status() const {
        return _status;
    }
    // Throws Comparison/IllegalTransition
    void setStatus(Phase phase, CorrelationStatus status);

    // Empty when the leaf has no such attribute
    std::string attr(const std::string& name) const;
    bool isText() const {
        return tag=="w:t";
    }
    bool collapsedField() const {
        return !collapsedFieldAtoms.empty();
    }
    bool splitFragment() const {
        return static_cast<bool>(splitFrom);
    }
    // Nearest ancestor with the given name from the snapshot
    pugi::xml_node ancestor(const char* name) const;
    pugi::xml_node paragraph() const {
        return ancestor("w:p");
    }
    pugi::xml_node run() const {
        return ancestor("w:r");
    }
    // Outermost paragraph in the snapshot, used for paragraph numbering
    pugi::xml_node outerParagraph() const;
    std::string revisionTag() const {
        return revision?revision.name():std::string();
    }
    // Text as seen by a reader: breaks become newlines, tabs become tabs
    std::string visibleText() const;
    bool whitespaceOnly() const;
    void rehash();

    std::string tag;
    Attributes attrs;
    std::string text;
    // Leaf in the source tree; empty for synthetic atoms
    pugi::xml_node source;
    // Root-to-parent chain captured at creation
    xml_nodes ancestors;
    std::string part;
    pugi::xml_node revision;
    int paragraphIndex = -1;
    int unifiedParagraph = -1;
    int moveGroupId = 0;
    std::string moveName;
    FormatChangeInfoP formatChange;
    // Counterpart in the other version, set on both atoms of an Equal pair. Not owning: each list owns its atoms.
    Atom* counterpart = NULL;
    bool emptyParagraph = false;
    Atoms collapsedFieldAtoms;
    AtomP splitFrom;
    Fingerprint fingerprint;

private:
    CorrelationStatus _status = CorrelationStatus::Unknown;
    int _phase = 0;
};

std::ostream& operator<<(std::ostream& os, const Atom& atom);

} // namespace redline

#endif // REDLINE_ATOM_H
