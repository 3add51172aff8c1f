#include "redline/Compare.h"
#include "redline/Atomizer.h"
#include "redline/Correlator.h"
#include "redline/MoveDetector.h"
#include "redline/FormatDetector.h"
#include "redline/Reconstructor.h"
#include "redline/InPlaceModifier.h"
#include "redline/ParagraphEngine.h"
#include "redline/Premerge.h"
#include "redline/errors.h"
#include <iostream>
#include <map>
#include <set>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>

using namespace std;
using namespace pugi;

namespace redline {

static const char* const MAIN_PART = "word/document.xml";

// Trees and atoms of one pass over the inputs. Atoms point into the trees.
class ComparisonPass
{
public:
    xml_document original;
    xml_document revised;
    AtomizeResult originalAtoms;
    AtomizeResult revisedAtoms;
    LcsResult lcs;
    Atoms merged;
    int moves = 0;
    int formatChanges = 0;
};

typedef shared_ptr<ComparisonPass> ComparisonPassP;

class Tracer
{
public:
    Tracer(bool enabled_, const string& id_): enabled(enabled_), id(id_) {}

    void operator()(const string& msg) const {
        if (enabled) {
            cerr<<"[compare "<<id<<"] "<<msg<<endl;
        }
    }
private:
    bool enabled;
    string id;
};

static void copy_tree(const xml_node& from, xml_document& to)
{
    to.reset();
    if (from.type()==node_document) {
        for (xml_node child: from.children()) {
            to.append_copy(child);
        }
    } else {
        to.append_copy(from);
    }
}

static ComparisonPassP run_pass(const xml_node& original, const xml_node& revised, const CompareOptions& options,
    const AtomizeOptions& atomizeOptions, const Tracer& trace)
{
    ComparisonPassP pass = make_shared<ComparisonPass>();
    copy_tree(original, pass->original);
    copy_tree(revised, pass->revised);
    xml_node originalBody = find_body(pass->original);
    xml_node revisedBody = find_body(pass->revised);
    if (options.premergeRuns) {
        int merges = premerge_adjacent_runs(originalBody)+premerge_adjacent_runs(revisedBody);
        trace("premerged "+to_string(merges)+" runs");
    }

    pass->originalAtoms = atomize(originalBody, MAIN_PART, atomizeOptions);
    pass->revisedAtoms = atomize(revisedBody, MAIN_PART, atomizeOptions);
    Atoms& o = pass->originalAtoms.atoms;
    Atoms& r = pass->revisedAtoms.atoms;
    trace("atoms: original "+to_string(o.size())+", revised "+to_string(r.size()));

    pass->lcs = compute_hierarchical_lcs(o, r);
    mark_correlation(o, r, pass->lcs);
    trace("lcs: "+to_string(pass->lcs.matches.size())+" matched atoms");

    Atoms all = o;
    all.insert(all.end(), r.begin(), r.end());
    pass->moves = detect_moves(all, options.moves);
    trace("moves: "+to_string(pass->moves));

    if (options.formatDetectionEnabled()) {
        pass->formatChanges = detect_format_changes(r);
        trace("format changes: "+to_string(pass->formatChanges));
    }

    pass->merged = create_merged_atom_list(o, r, pass->lcs);
    assign_unified_paragraph_indices(o, r, pass->merged, pass->lcs);
    return pass;
}

CompareStats compute_stats(const Atoms& merged)
{
    CompareStats stats;
    int moved = 0;
    map<int, set<CorrelationStatus> > paragraphs;
    for (const AtomP& atom: merged) {
        switch (atom->status()) {
        case CorrelationStatus::Inserted:
            stats.insertions++;
            break;
        case CorrelationStatus::Deleted:
            stats.deletions++;
            break;
        case CorrelationStatus::MovedSource:
        case CorrelationStatus::MovedDestination:
            moved++;
            break;
        case CorrelationStatus::FormatChanged:
            stats.formatChanges++;
            break;
        default:
            break;
        }
        paragraphs[atom->unifiedParagraph].insert(atom->status());
    }
    stats.moves = moved/2;
    for (auto& entry: paragraphs) {
        if (entry.second.count(CorrelationStatus::Deleted) && entry.second.count(CorrelationStatus::Inserted)) {
            stats.modifications++;
        }
    }
    stats.modifications += stats.formatChanges;
    return stats;
}

static string checks_summary(const SafetyCheckResult& check)
{
    if (check.safe()) {
        return "all checks passed";
    }
    string res = "failed:";
    for (const string& name: check.failedChecks) {
        res += " "+name;
    }
    return res;
}

CompareResult compareDocuments(const xml_node& original, const xml_node& revised, const CompareOptions& options)
{
    if (options.engine==Engine::Paragraph && options.reconstructionMode==ReconstructionMode::InPlace) {
        throw RedlineException(ErrorKind::Comparison, ErrorType::UnsupportedCombination,
            "The paragraph engine supports rebuild reconstruction only");
    }
    find_body(original);
    find_body(revised);

    CompareResult res;
    res.comparisonId = boost::uuids::to_string(boost::uuids::random_generator()());
    res.engine = options.engine;
    res.reconstructionModeRequested = options.reconstructionMode;
    res.document = make_shared<xml_document>();
    Tracer trace(options.verbose, res.comparisonId);
    Attribution by;
    by.author = options.author;
    by.date = timestampToIso(options.date?options.date:time(NULL));
    trace("engine "+engineName(options.engine)+", mode "+modeName(options.reconstructionMode));

    if (options.engine==Engine::Paragraph) {
        ParagraphDiffStats diff = compare_paragraphs(original, revised, by, *res.document);
        res.stats.insertions = diff.insertions;
        res.stats.deletions = diff.deletions;
        res.stats.modifications = diff.modifications;
        trace("paragraphs: "+to_string(diff.equal)+" equal, "+to_string(diff.deletions)+" deleted, "
            +to_string(diff.insertions)+" inserted");
        res.reconstructionModeUsed = ReconstructionMode::Rebuild;
        res.documentXml = saveXML(*res.document);
        return res;
    }

    if (options.reconstructionMode==ReconstructionMode::InPlace) {
        RoundTripBaseline baseline(original, revised);
        AtomizeOptions wordSplit;
        wordSplit.cloneLeafNodes = true;
        wordSplit.mergeAcrossRuns = false;
        wordSplit.mergePunctuationAcrossRuns = false;
        wordSplit.splitTextIntoWords = true;
        AtomizeOptions runLevel = wordSplit;
        runLevel.splitTextIntoWords = false;
        vector<pair<string, AtomizeOptions> > passes = {
            {"inplace_word_split", wordSplit},
            {"inplace_run_level", runLevel}
        };
        for (auto& p: passes) {
            ComparisonPassP pass = run_pass(original, revised, options, p.second, trace);
            modify_revised_document(pass->revised, pass->merged, pass->original, by);
            ReconstructionAttempt attempt;
            attempt.pass = p.first;
            attempt.checks = evaluate_safety_checks(baseline, pass->revised);
            trace(p.first+": "+checks_summary(attempt.checks));
            if (attempt.checks.safe()) {
                res.document->reset(pass->revised);
                res.stats = compute_stats(pass->merged);
                res.reconstructionModeUsed = ReconstructionMode::InPlace;
                res.documentXml = saveXML(*res.document);
                return res;
            }
            res.attempts.push_back(attempt);
        }
        res.fallbackReason = FALLBACK_SAFETY_CHECK_FAILED;
        trace("falling back to rebuild");
    }

    ComparisonPassP pass = run_pass(original, revised, options, AtomizeOptions(), trace);
    rebuild_document(pass->merged, pass->revised, by, *res.document);
    res.stats = compute_stats(pass->merged);
    res.reconstructionModeUsed = ReconstructionMode::Rebuild;
    res.documentXml = saveXML(*res.document);
    return res;
}

CompareResult compareDocuments(const string& originalXml, const string& revisedXml, const CompareOptions& options)
{
    xml_document original, revised;
    loadXMLString(original, originalXml);
    loadXMLString(revised, revisedXml);
    return compareDocuments(original, revised, options);
}

} // namespace redline
