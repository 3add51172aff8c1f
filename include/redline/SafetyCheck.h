#ifndef REDLINE_SAFETY_CHECK_H
#define REDLINE_SAFETY_CHECK_H

#include <string>
#include <memory>
#include "pugixml.hpp"
#include "redline/TrackChanges.h"

namespace redline {

class TextMismatchDetails
{
public:
    size_t expectedLength = 0;
    size_t actualLength = 0;
    int firstDifferingParagraphIndex = -1;
    std::string expectedParagraph;
    std::string actualParagraph;
    Words differenceSample;
};

struct IdDelta {
    Words missing;
    Words unexpected;
};

class BookmarkMismatchDetails
{
public:
    IdDelta startNames;
    IdDelta referencedBookmarkNames;
    IdDelta unresolvedReferenceNames;
    IdDelta startIds;
    IdDelta endIds;
    BookmarkDiagnostics expected;
    BookmarkDiagnostics actual;
};

typedef std::shared_ptr<TextMismatchDetails> TextMismatchDetailsP;
typedef std::shared_ptr<BookmarkMismatchDetails> BookmarkMismatchDetailsP;

struct SafetyChecks {
    bool acceptText = true;
    bool rejectText = true;
    bool acceptBookmarks = true;
    bool rejectBookmarks = true;
};

class SafetyCheckResult
{
public:
    bool safe() const {
        return failedChecks.empty();
    }
    SafetyChecks checks;
    // Names of the failed checks in the order acceptText, rejectText, acceptBookmarks, rejectBookmarks
    Words failedChecks;
    TextMismatchDetailsP acceptText;
    TextMismatchDetailsP rejectText;
    BookmarkMismatchDetailsP acceptBookmarks;
    BookmarkMismatchDetailsP rejectBookmarks;
};

// What accept-all must reproduce (revised) and reject-all must reproduce (original)
class RoundTripBaseline
{
public:
    RoundTripBaseline(const pugi::xml_node& original, const pugi::xml_node& revised);

    std::string originalText;
    std::string revisedText;
    BookmarkDiagnostics originalBookmarks;
    BookmarkDiagnostics revisedBookmarks;
};

IdDelta diff_ids(const Words& expected, const Words& actual);
TextMismatchDetailsP text_mismatch_details(const std::string& expected, const std::string& actual);

SafetyCheckResult evaluate_safety_checks(const RoundTripBaseline& baseline, const pugi::xml_document& candidate);

} // namespace redline

#endif // REDLINE_SAFETY_CHECK_H
