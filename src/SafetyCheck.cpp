#include "redline/SafetyCheck.h"
#include <set>
#include <sstream>
#include <algorithm>

using namespace std;
using namespace pugi;

namespace redline {

RoundTripBaseline::RoundTripBaseline(const xml_node& original, const xml_node& revised):
    originalText(extract_text_with_paragraphs(original)),
    revisedText(extract_text_with_paragraphs(revised)),
    originalBookmarks(collect_bookmark_diagnostics(original)),
    revisedBookmarks(collect_bookmark_diagnostics(revised))
{
}

IdDelta diff_ids(const Words& expected, const Words& actual)
{
    IdDelta res;
    set<string> e(expected.begin(), expected.end());
    set<string> a(actual.begin(), actual.end());
    for (const string& id: expected) {
        if (!a.count(id)) {
            res.missing.push_back(id);
        }
    }
    for (const string& id: actual) {
        if (!e.count(id)) {
            res.unexpected.push_back(id);
        }
    }
    return res;
}

static Words split_lines(const string& text)
{
    Words res;
    istringstream is(text);
    string line;
    while (getline(is, line)) {
        res.push_back(line);
    }
    if (text.empty() || text[text.size()-1]=='\n') {
        res.push_back("");
    }
    return res;
}

TextMismatchDetailsP text_mismatch_details(const string& expected, const string& actual)
{
    TextComparison comparison = compare_texts(expected, actual);
    TextMismatchDetailsP res = make_shared<TextMismatchDetails>();
    res->expectedLength = comparison.expectedLength;
    res->actualLength = comparison.actualLength;
    Words e = split_lines(expected);
    Words a = split_lines(actual);
    size_t n = max(e.size(), a.size());
    for (size_t i=0;i<n;i++) {
        string ep = i<e.size()?e[i]:"";
        string ap = i<a.size()?a[i]:"";
        if (ep!=ap) {
            res->firstDifferingParagraphIndex = static_cast<int>(i);
            res->expectedParagraph = ep;
            res->actualParagraph = ap;
            break;
        }
    }
    for (size_t i=0;i<comparison.differences.size() && i<3;i++) {
        res->differenceSample.push_back(comparison.differences[i]);
    }
    return res;
}

static BookmarkMismatchDetailsP bookmark_mismatch_details(const BookmarkDiagnostics& expected, const BookmarkDiagnostics& actual)
{
    BookmarkMismatchDetailsP res = make_shared<BookmarkMismatchDetails>();
    res->startNames = diff_ids(expected.startNames, actual.startNames);
    res->referencedBookmarkNames = diff_ids(expected.referencedBookmarkNames, actual.referencedBookmarkNames);
    res->unresolvedReferenceNames = diff_ids(expected.unresolvedReferenceNames, actual.unresolvedReferenceNames);
    res->startIds = diff_ids(expected.startIds, actual.startIds);
    res->endIds = diff_ids(expected.endIds, actual.endIds);
    res->expected = expected;
    res->actual = actual;
    return res;
}

SafetyCheckResult evaluate_safety_checks(const RoundTripBaseline& baseline, const xml_document& candidate)
{
    xml_document accepted, rejected;
    accepted.reset(candidate);
    rejected.reset(candidate);
    accept_all_changes(accepted);
    reject_all_changes(rejected);

    string acceptedText = extract_text_with_paragraphs(accepted);
    string rejectedText = extract_text_with_paragraphs(rejected);
    BookmarkDiagnostics acceptedBookmarks = collect_bookmark_diagnostics(accepted);
    BookmarkDiagnostics rejectedBookmarks = collect_bookmark_diagnostics(rejected);

    SafetyCheckResult res;
    res.checks.acceptText = compare_texts(baseline.revisedText, acceptedText).normalizedIdentical;
    res.checks.rejectText = compare_texts(baseline.originalText, rejectedText).normalizedIdentical;
    res.checks.acceptBookmarks = bookmark_diagnostics_equal(baseline.revisedBookmarks, acceptedBookmarks);
    res.checks.rejectBookmarks = bookmark_diagnostics_equal(baseline.originalBookmarks, rejectedBookmarks);

    if (!res.checks.acceptText) {
        res.failedChecks.push_back("acceptText");
        res.acceptText = text_mismatch_details(baseline.revisedText, acceptedText);
    }
    if (!res.checks.rejectText) {
        res.failedChecks.push_back("rejectText");
        res.rejectText = text_mismatch_details(baseline.originalText, rejectedText);
    }
    if (!res.checks.acceptBookmarks) {
        res.failedChecks.push_back("acceptBookmarks");
        res.acceptBookmarks = bookmark_mismatch_details(baseline.revisedBookmarks, acceptedBookmarks);
    }
    if (!res.checks.rejectBookmarks) {
        res.failedChecks.push_back("rejectBookmarks");
        res.rejectBookmarks = bookmark_mismatch_details(baseline.originalBookmarks, rejectedBookmarks);
    }
    return res;
}

} // namespace redline
