#ifndef REDLINE_TRACK_CHANGES_H
#define REDLINE_TRACK_CHANGES_H

#include <string>
#include <vector>
#include "pugixml.hpp"
#include "redline/utils.h"

namespace redline {

// Both simulations edit the tree in place; callers work on a copy
void accept_all_changes(pugi::xml_node root);
void reject_all_changes(pugi::xml_node root);

// One line per w:p: its w:t text followed by its w:delText text
std::string extract_text_with_paragraphs(const pugi::xml_node& root);

std::string normalize_text(const std::string& text);

class TextComparison
{
public:
    bool identical = false;
    bool normalizedIdentical = false;
    size_t expectedLength = 0;
    size_t actualLength = 0;
    Words differences;
};

TextComparison compare_texts(const std::string& expected, const std::string& actual);

// Bookmark names referenced by REF and PAGEREF field instructions
Words referenced_bookmark_names(const std::string& instruction);

// All sets are sorted
class BookmarkDiagnostics
{
public:
    Words startIds;
    Words endIds;
    Words startNames;
    Words duplicateStartNames;
    Words referencedBookmarkNames;
    Words unresolvedReferenceNames;
    Words duplicateStartIds;
    Words duplicateEndIds;
    Words unmatchedStartIds;
    Words unmatchedEndIds;
};

BookmarkDiagnostics collect_bookmark_diagnostics(const pugi::xml_node& root);

// Everything except the raw id sets, which renumbering is free to change
bool bookmark_diagnostics_equal(const BookmarkDiagnostics& expected, const BookmarkDiagnostics& actual);

} // namespace redline

#endif // REDLINE_TRACK_CHANGES_H
