#include "redline/CompareOptions.h"
#include "redline/errors.h"
#include "rapidjson/document.h"
#include "rapidjson/filereadstream.h"
#include "rapidjson/error/en.h"
#include <cstdio>
#include <cmath>

using namespace std;
using namespace rapidjson;

namespace redline {

static const string rebuildName = "rebuild";
static const string inplaceName = "inplace";
static const string atomizerName = "atomizer";
static const string paragraphName = "paragraph";

const string& modeName(ReconstructionMode mode)
{
    return mode==ReconstructionMode::InPlace?inplaceName:rebuildName;
}

const string& engineName(Engine engine)
{
    return engine==Engine::Paragraph?paragraphName:atomizerName;
}

ReconstructionMode str_to_mode(const string& s)
{
    if (s==rebuildName) {
        return ReconstructionMode::Rebuild;
    } else if (s==inplaceName) {
        return ReconstructionMode::InPlace;
    }
    throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Unknown reconstruction mode '"+s+"'");
}

Engine str_to_engine(const string& s)
{
    if (s==atomizerName) {
        return Engine::Atomizer;
    } else if (s==paragraphName) {
        return Engine::Paragraph;
    }
    throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Unknown engine '"+s+"'");
}

MoveTieBreak str_to_tie_break(const string& s)
{
    if (s=="first") {
        return MoveTieBreak::First;
    } else if (s=="largest") {
        return MoveTieBreak::Largest;
    }
    throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Unknown move tie-break '"+s+"'");
}

static void bad_member(const char* name, const char* expected)
{
    throw RedlineException(ErrorKind::Config, ErrorType::BadConfig,
        string("Member '")+name+"' should be "+expected);
}

static bool read_bool(const Value& obj, const char* name, bool def)
{
    Value::ConstMemberIterator it = obj.FindMember(name);
    if (it==obj.MemberEnd()) {
        return def;
    }
    if (!it->value.IsBool()) {
        bad_member(name, "a boolean");
    }
    return it->value.GetBool();
}

static string read_string(const Value& obj, const char* name, const string& def)
{
    Value::ConstMemberIterator it = obj.FindMember(name);
    if (it==obj.MemberEnd()) {
        return def;
    }
    if (!it->value.IsString()) {
        bad_member(name, "a string");
    }
    return it->value.GetString();
}

static double read_number(const Value& obj, const char* name, double def)
{
    Value::ConstMemberIterator it = obj.FindMember(name);
    if (it==obj.MemberEnd()) {
        return def;
    }
    if (!it->value.IsNumber()) {
        bad_member(name, "a number");
    }
    return it->value.GetDouble();
}

// Whole number in [min, max]
static double read_integer(const Value& obj, const char* name, double def, double min, double max, const char* expected)
{
    double res = read_number(obj, name, def);
    if (res<min || res>max || floor(res)!=res) {
        bad_member(name, expected);
    }
    return res;
}

static CompareOptions options_from_json(const Document& json, const string& source)
{
    if (!json.IsObject()) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Configuration '"+source+"' is not a JSON object");
    }
    Value::ConstMemberIterator version = json.FindMember("config_version");
    if (version==json.MemberEnd() || !version->value.IsNumber()) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Configuration '"+source+"' has no config_version");
    }
    int major_version = static_cast<int>(floor(version->value.GetDouble()));
    if (major_version!=COMPARE_CONF_MAJOR_VERSION) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig,
            "Expected config_version "+to_string(COMPARE_CONF_MAJOR_VERSION)+".x in '"+source+"'");
    }

    CompareOptions res;
    res.author = read_string(json, "author", res.author);
    res.date = static_cast<time_t>(read_integer(json, "date", static_cast<double>(res.date), 0, MAX_REVISION_DATE,
        "a whole number of seconds since 1970 before year 10000"));
    res.ignoreFormatting = read_bool(json, "ignore_formatting", res.ignoreFormatting);
    res.premergeRuns = read_bool(json, "premerge_runs", res.premergeRuns);
    res.detectFormatChanges = read_bool(json, "detect_format_changes", res.detectFormatChanges);
    res.verbose = read_bool(json, "verbose", res.verbose);
    res.reconstructionMode = str_to_mode(read_string(json, "reconstruction_mode", modeName(res.reconstructionMode)));
    res.engine = str_to_engine(read_string(json, "engine", engineName(res.engine)));

    Value::ConstMemberIterator moves = json.FindMember("moves");
    if (moves!=json.MemberEnd()) {
        if (!moves->value.IsObject()) {
            bad_member("moves", "an object");
        }
        const Value& m = moves->value;
        MoveDetectionSettings& settings = res.moves;
        settings.detectMoves = read_bool(m, "detect", settings.detectMoves);
        settings.similarityThreshold = read_number(m, "similarity_threshold", settings.similarityThreshold);
        settings.minimumWordCount = static_cast<int>(read_integer(m, "minimum_word_count", settings.minimumWordCount, 0, 1000000,
            "a whole number between 0 and 1000000"));
        settings.caseInsensitive = read_bool(m, "case_insensitive", settings.caseInsensitive);
        if (m.HasMember("tie_break")) {
            settings.tieBreak = str_to_tie_break(read_string(m, "tie_break", "first"));
        }
        if (settings.similarityThreshold<0 || settings.similarityThreshold>1) {
            bad_member("similarity_threshold", "between 0 and 1");
        }
    }
    return res;
}

static void check_parse(const Document& json, const string& source)
{
    if (json.HasParseError()) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig,
            "Configuration '"+source+"' is not a valid JSON",
            "Error(offset "+to_string(json.GetErrorOffset())+"): "+GetParseError_En(json.GetParseError()));
    }
}

CompareOptions loadCompareOptions(const string& filename)
{
    FILE* fp = fopen(filename.c_str(), "r");
    if (!fp) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Cannot open "+filename+" for input");
    }
    Document json;
    char readBuffer[65536];
    FileReadStream jsonfile(fp, readBuffer, sizeof(readBuffer));
    json.ParseStream<kParseCommentsFlag>(jsonfile);
    fclose(fp);
    check_parse(json, filename);
    return options_from_json(json, filename);
}

CompareOptions parseCompareOptions(const string& text)
{
    Document json;
    json.Parse<kParseCommentsFlag>(text.c_str());
    check_parse(json, "<string>");
    return options_from_json(json, "<string>");
}

} // namespace redline
