#include "redline/Report.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/ostreamwrapper.h"

using namespace std;
using namespace rapidjson;

namespace redline {

typedef rapidjson::PrettyWriter<rapidjson::OStreamWrapper> JSONWriter;

static void write_words(JSONWriter& writer, const char* key, const Words& words)
{
    writer.Key(key);
    writer.StartArray();
    for (const string& w: words) {
        writer.String(w.c_str());
    }
    writer.EndArray();
}

static void write_text_mismatch(JSONWriter& writer, const char* key, const TextMismatchDetailsP& details)
{
    if (!details) {
        return;
    }
    writer.Key(key);
    writer.StartObject();
    writer.Key("expectedLength");
    writer.Uint64(details->expectedLength);
    writer.Key("actualLength");
    writer.Uint64(details->actualLength);
    writer.Key("firstDifferingParagraphIndex");
    writer.Int(details->firstDifferingParagraphIndex);
    writer.Key("expectedParagraph");
    writer.String(truncate_text(details->expectedParagraph, REPORT_TEXT_LIMIT).c_str());
    writer.Key("actualParagraph");
    writer.String(truncate_text(details->actualParagraph, REPORT_TEXT_LIMIT).c_str());
    writer.EndObject();
}

static void write_id_delta(JSONWriter& writer, const char* key, const IdDelta& delta)
{
    writer.Key(key);
    writer.StartObject();
    write_words(writer, "missing", delta.missing);
    write_words(writer, "unexpected", delta.unexpected);
    writer.EndObject();
}

static void write_bookmark_mismatch(JSONWriter& writer, const char* key, const BookmarkMismatchDetailsP& details)
{
    if (!details) {
        return;
    }
    writer.Key(key);
    writer.StartObject();
    write_id_delta(writer, "startNames", details->startNames);
    write_id_delta(writer, "referencedBookmarkNames", details->referencedBookmarkNames);
    write_id_delta(writer, "unresolvedReferenceNames", details->unresolvedReferenceNames);
    write_words(writer, "duplicateStartNames", details->actual.duplicateStartNames);
    write_words(writer, "unmatchedStartIds", details->actual.unmatchedStartIds);
    write_words(writer, "unmatchedEndIds", details->actual.unmatchedEndIds);
    writer.EndObject();
}

static void write_attempt(JSONWriter& writer, const ReconstructionAttempt& attempt)
{
    const SafetyCheckResult& checks = attempt.checks;
    writer.StartObject();
    writer.Key("pass");
    writer.String(attempt.pass.c_str());
    writer.Key("checks");
    writer.StartObject();
    writer.Key("acceptText");
    writer.Bool(checks.checks.acceptText);
    writer.Key("rejectText");
    writer.Bool(checks.checks.rejectText);
    writer.Key("acceptBookmarks");
    writer.Bool(checks.checks.acceptBookmarks);
    writer.Key("rejectBookmarks");
    writer.Bool(checks.checks.rejectBookmarks);
    writer.EndObject();
    write_words(writer, "failedChecks", checks.failedChecks);
    write_text_mismatch(writer, "acceptTextMismatch", checks.acceptText);
    write_text_mismatch(writer, "rejectTextMismatch", checks.rejectText);
    write_bookmark_mismatch(writer, "acceptBookmarkMismatch", checks.acceptBookmarks);
    write_bookmark_mismatch(writer, "rejectBookmarkMismatch", checks.rejectBookmarks);
    writer.EndObject();
}

void writeCompareReport(const CompareResult& result, ostream& os)
{
    OStreamWrapper osw(os);
    JSONWriter writer(osw);
    writer.StartObject();
    writer.Key("id");
    writer.String(result.comparisonId.c_str());
    writer.Key("engine");
    writer.String(engineName(result.engine).c_str());
    writer.Key("reconstructionModeRequested");
    writer.String(modeName(result.reconstructionModeRequested).c_str());
    writer.Key("reconstructionModeUsed");
    writer.String(modeName(result.reconstructionModeUsed).c_str());

    writer.Key("stats");
    writer.StartObject();
    writer.Key("insertions");
    writer.Int(result.stats.insertions);
    writer.Key("deletions");
    writer.Int(result.stats.deletions);
    writer.Key("moves");
    writer.Int(result.stats.moves);
    writer.Key("formatChanges");
    writer.Int(result.stats.formatChanges);
    writer.Key("modifications");
    writer.Int(result.stats.modifications);
    writer.EndObject();

    if (!result.fallbackReason.empty()) {
        writer.Key("fallbackReason");
        writer.String(result.fallbackReason.c_str());
        writer.Key("attempts");
        writer.StartArray();
        for (const ReconstructionAttempt& attempt: result.attempts) {
            write_attempt(writer, attempt);
        }
        writer.EndArray();
    }
    writer.EndObject();
    os<<endl;
}

} // namespace redline
