#define BOOST_TEST_MODULE reconstruction
#include <boost/test/unit_test.hpp>
#include <set>
#include "test_helpers.h"
#include "redline/Correlator.h"
#include "redline/MoveDetector.h"
#include "redline/FormatDetector.h"
#include "redline/Reconstructor.h"
#include "redline/InPlaceModifier.h"
#include "redline/Premerge.h"

using namespace std;
using namespace pugi;
using namespace redline;

static const string MOVED = "The quick brown fox jumps over the lazy dog";
static const string FIRST = "Alpha beta gamma delta epsilon zeta eta theta iota kappa";
static const string SECOND = "Lambda mu nu xi omicron pi rho sigma tau upsilon";

// Runs the comparison stages by hand and reconstructs in either mode. Without paragraph groups
// atoms are matched across paragraph boundaries.
class Pipeline
{
public:
    Pipeline(const string& originalBody, const string& revisedBody, bool inPlace_, bool paragraphGroups = true):
        inPlace(inPlace_) {
        test::load(original, originalBody);
        test::load(revised, revisedBody);
        originalText = test::plain_text(original);
        revisedText = test::plain_text(revised);
        AtomizeOptions options;
        if (inPlace) {
            options.cloneLeafNodes = true;
            options.mergeAcrossRuns = false;
            options.mergePunctuationAcrossRuns = false;
        }
        oa = atomize(find_body(original), "word/document.xml", options);
        ra = atomize(find_body(revised), "word/document.xml", options);
        LcsResult lcs = paragraphGroups?compute_hierarchical_lcs(oa.atoms, ra.atoms):compute_atom_lcs(oa.atoms, ra.atoms);
        mark_correlation(oa.atoms, ra.atoms, lcs);
        Atoms all = oa.atoms;
        all.insert(all.end(), ra.atoms.begin(), ra.atoms.end());
        detect_moves(all);
        detect_format_changes(ra.atoms);
        merged = create_merged_atom_list(oa.atoms, ra.atoms, lcs);
        assign_unified_paragraph_indices(oa.atoms, ra.atoms, merged, lcs);
        by.author = "Tester";
        by.date = "2024-01-01T00:00:00Z";
    }

    xml_node reconstruct() {
        if (inPlace) {
            modify_revised_document(revised, merged, original, by);
            return revised;
        }
        rebuild_document(merged, revised, by, output);
        return output;
    }

    bool inPlace;
    xml_document original, revised, output;
    string originalText, revisedText;
    AtomizeResult oa, ra;
    Atoms merged;
    Attribution by;
};

static void check_round_trip(const string& originalBody, const string& revisedBody)
{
    for (bool inPlace: {false, true}) {
        BOOST_TEST_CONTEXT((inPlace?"in place":"rebuild")) {
            Pipeline pipeline(originalBody, revisedBody, inPlace);
            xml_node result = pipeline.reconstruct();
            BOOST_CHECK_EQUAL(test::accepted_text(result), pipeline.revisedText);
            BOOST_CHECK_EQUAL(test::rejected_text(result), pipeline.originalText);
        }
    }
}

static string field(const string& instruction, const string& result)
{
    return "<w:r><w:fldChar w:fldCharType=\"begin\"/></w:r>"
        "<w:r><w:instrText xml:space=\"preserve\"> "+instruction+" </w:instrText></w:r>"
        "<w:r><w:fldChar w:fldCharType=\"separate\"/></w:r>"
        +test::run(result)+
        "<w:r><w:fldChar w:fldCharType=\"end\"/></w:r>";
}

static size_t count(const xml_node& root, const char* name)
{
    return find_all(root, name).size();
}

static void check_unique_revision_ids(const xml_node& root)
{
    set<string> seen;
    for (const char* tag: {"w:ins", "w:del", "w:moveFrom", "w:moveTo", "w:rPrChange"}) {
        for (const xml_node& n: find_all(root, tag)) {
            BOOST_CHECK(seen.insert(n.attribute("w:id").value()).second);
        }
    }
}

BOOST_AUTO_TEST_SUITE(round_trips)

BOOST_AUTO_TEST_CASE(word_replacement)
{
    check_round_trip(test::text_para("Hello World"), test::text_para("Hello Word"));
}

BOOST_AUTO_TEST_CASE(several_changes_in_one_paragraph)
{
    check_round_trip(test::text_para("The cat sat on the mat today."),
        test::text_para("A cat sat quietly on the red mat."));
}

BOOST_AUTO_TEST_CASE(inserted_paragraph)
{
    check_round_trip(test::text_para("one")+test::text_para("two"),
        test::text_para("one")+test::text_para("brand new paragraph")+test::text_para("two"));
}

BOOST_AUTO_TEST_CASE(deleted_paragraph)
{
    check_round_trip(test::text_para("one")+test::text_para("going away")+test::text_para("two"),
        test::text_para("one")+test::text_para("two"));
}

BOOST_AUTO_TEST_CASE(moved_paragraph)
{
    check_round_trip(test::text_para(MOVED)+test::text_para(FIRST)+test::text_para(SECOND),
        test::text_para(FIRST)+test::text_para(SECOND)+test::text_para(MOVED));
}

BOOST_AUTO_TEST_CASE(multi_run_paragraphs)
{
    check_round_trip(test::para(test::run("Plain start, ")+test::run("bold middle", "<w:b/>")+test::run(" and the end")),
        test::para(test::run("Plain start, ")+test::run("bold centre", "<w:b/>")+test::run(" and an end")));
}

BOOST_AUTO_TEST_CASE(format_only_change)
{
    check_round_trip(test::text_para("bold"), test::para(test::run("bold", "<w:b/>")));
}

BOOST_AUTO_TEST_CASE(paragraph_with_field)
{
    check_round_trip(test::para(test::run("See page ")+field("PAGEREF target", "3")+test::run(" of the report")),
        test::para(test::run("See page ")+field("PAGEREF target", "3")+test::run(" of this report")));
    check_round_trip(test::para(test::run("Page ")+field("PAGE", "3")), test::text_para("Page 3"));
    check_round_trip(test::para(test::run("Page ")+field("PAGE", "3")), test::para(test::run("Page ")+field("PAGE", "4")));
}

BOOST_AUTO_TEST_CASE(moved_section_of_two_paragraphs)
{
    string filler1 = "First filler paragraph holding eight words in total";
    string filler2 = "Second filler paragraph holding eight words in total";
    string filler3 = "Third filler paragraph holding eight words in total";
    check_round_trip(test::text_para("Alpha Beta Gamma")+test::text_para("Delta Epsilon Zeta")
        +test::text_para(filler1)+test::text_para(filler2)+test::text_para(filler3),
        test::text_para(filler1)+test::text_para(filler2)+test::text_para(filler3)
        +test::text_para("Alpha Beta Gamma")+test::text_para("Delta Epsilon Zeta"));
}

BOOST_AUTO_TEST_CASE(tabs_and_breaks)
{
    check_round_trip(test::para("<w:r><w:t>a</w:t><w:tab/><w:t>b</w:t></w:r>"),
        test::para("<w:r><w:t>a</w:t><w:tab/><w:t>c</w:t><w:br/><w:t>d</w:t></w:r>"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(rebuild)

BOOST_AUTO_TEST_CASE(word_replacement_markup)
{
    Pipeline pipeline(test::text_para("Hello World"), test::text_para("Hello Word"), false);
    xml_node result = pipeline.reconstruct();
    xml_nodes dels = find_all(result, "w:del");
    xml_nodes inss = find_all(result, "w:ins");
    BOOST_REQUIRE_EQUAL(dels.size(), 1u);
    BOOST_REQUIRE_EQUAL(inss.size(), 1u);
    BOOST_CHECK_EQUAL(getLeafText(find_all(dels[0], "w:delText").at(0)), "World");
    BOOST_CHECK(find_all(dels[0], "w:t").empty());
    BOOST_CHECK_EQUAL(getTextXML(inss[0]), "Word");
    BOOST_CHECK_EQUAL(dels[0].attribute("w:author").value(), string("Tester"));
    BOOST_CHECK_EQUAL(inss[0].attribute("w:date").value(), string("2024-01-01T00:00:00Z"));
    // Deletions come before insertions
    BOOST_CHECK(dels[0].next_sibling() == inss[0]);
    check_unique_revision_ids(result);
}

BOOST_AUTO_TEST_CASE(section_properties_stay_last)
{
    Pipeline pipeline(test::text_para("one"), test::text_para("one")+test::text_para("two"), false);
    xml_node body = find_body(pipeline.reconstruct());
    xml_nodes children = child_elements(body);
    BOOST_REQUIRE_EQUAL(children.size(), 3u);
    BOOST_CHECK(is_element(children.back(), "w:sectPr"));
    BOOST_CHECK(find_child(children.back(), "w:pgSz"));
}

BOOST_AUTO_TEST_CASE(inserted_paragraph_mark)
{
    Pipeline pipeline(test::text_para("one"), test::text_para("one")+test::text_para("two"), false);
    xml_nodes paras = find_all(pipeline.reconstruct(), "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 2u);
    xml_node pPr = find_child(paras[1], "w:pPr");
    BOOST_REQUIRE(pPr);
    BOOST_CHECK(paras[1].first_child() == pPr);
    BOOST_CHECK(find_child(find_child(pPr, "w:rPr"), "w:ins"));
    BOOST_CHECK(!find_child(paras[0], "w:pPr"));
}

BOOST_AUTO_TEST_CASE(move_markup)
{
    Pipeline pipeline(test::text_para(MOVED)+test::text_para(FIRST)+test::text_para(SECOND),
        test::text_para(FIRST)+test::text_para(SECOND)+test::text_para(MOVED), false);
    xml_node result = pipeline.reconstruct();
    BOOST_CHECK_EQUAL(find_all(result, "w:moveFrom").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:moveTo").size(), 1u);
    BOOST_CHECK(find_all(result, "w:ins").empty());
    xml_nodes starts = find_all(result, "w:moveFromRangeStart");
    BOOST_REQUIRE_EQUAL(starts.size(), 1u);
    BOOST_CHECK_EQUAL(starts[0].attribute("w:name").value(), string("move1"));
    BOOST_CHECK_EQUAL(find_all(result, "w:moveToRangeStart").at(0).attribute("w:name").value(), string("move1"));
    BOOST_CHECK_EQUAL(find_all(result, "w:moveFromRangeEnd").at(0).attribute("w:id").as_int(), starts[0].attribute("w:id").as_int());
    check_unique_revision_ids(result);
}

BOOST_AUTO_TEST_CASE(one_range_per_move)
{
    string moved = test::para(test::run("The quick brown ")+test::run("fox", "<w:b/>")+test::run(" jumps over the lazy dog"));
    for (bool inPlace: {false, true}) {
        BOOST_TEST_CONTEXT((inPlace?"in place":"rebuild")) {
            Pipeline pipeline(moved+test::text_para(FIRST)+test::text_para(SECOND),
                test::text_para(FIRST)+test::text_para(SECOND)+moved, inPlace);
            xml_node result = pipeline.reconstruct();
            BOOST_CHECK_EQUAL(count(result, "w:moveFromRangeStart"), 1u);
            BOOST_CHECK_EQUAL(count(result, "w:moveFromRangeEnd"), 1u);
            BOOST_CHECK_EQUAL(count(result, "w:moveToRangeStart"), 1u);
            BOOST_CHECK_EQUAL(count(result, "w:moveToRangeEnd"), 1u);
            BOOST_CHECK_EQUAL(count(result, "w:moveTo"), 1u);
            xml_node to = find_all(result, "w:moveTo").at(0);
            BOOST_CHECK_EQUAL(find_all(to, "w:r").size(), 3u);
            BOOST_CHECK(is_element(to.next_sibling(), "w:moveToRangeEnd"));
            check_unique_revision_ids(result);
            BOOST_CHECK_EQUAL(test::accepted_text(result), pipeline.revisedText);
            BOOST_CHECK_EQUAL(test::rejected_text(result), pipeline.originalText);
        }
    }
}

BOOST_AUTO_TEST_CASE(move_range_spans_paragraphs)
{
    string filler1 = "First filler paragraph holding eight words in total";
    string filler2 = "Second filler paragraph holding eight words in total";
    string filler3 = "Third filler paragraph holding eight words in total";
    Pipeline pipeline(test::text_para("Alpha Beta Gamma")+test::text_para("Delta Epsilon Zeta")
        +test::text_para(filler1)+test::text_para(filler2)+test::text_para(filler3),
        test::text_para(filler1)+test::text_para(filler2)+test::text_para(filler3)
        +test::text_para("Alpha Beta Gamma")+test::text_para("Delta Epsilon Zeta"), false);
    xml_node result = pipeline.reconstruct();
    xml_nodes paras = find_all(result, "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 7u);
    BOOST_CHECK_EQUAL(count(result, "w:moveFrom"), 2u);
    BOOST_CHECK_EQUAL(count(result, "w:moveTo"), 2u);
    BOOST_CHECK(find_all(result, "w:ins").empty());
    BOOST_CHECK(find_all(result, "w:del").empty());
    // The range opens in the first paragraph and closes in the second
    BOOST_CHECK_EQUAL(count(paras[0], "w:moveFromRangeStart"), 1u);
    BOOST_CHECK_EQUAL(count(paras[0], "w:moveFromRangeEnd"), 0u);
    BOOST_CHECK_EQUAL(count(paras[1], "w:moveFromRangeEnd"), 1u);
    BOOST_CHECK_EQUAL(count(paras[5], "w:moveToRangeStart"), 1u);
    BOOST_CHECK_EQUAL(count(paras[6], "w:moveToRangeEnd"), 1u);
    BOOST_CHECK_EQUAL(count(result, "w:moveToRangeStart"), 1u);
    BOOST_CHECK_EQUAL(count(result, "w:moveToRangeEnd"), 1u);
    check_unique_revision_ids(result);
}

BOOST_AUTO_TEST_CASE(split_paragraph)
{
    string original = test::para("<w:bookmarkStart w:id=\"5\" w:name=\"whole\"/>"+test::run("Alpha beta gamma delta")
        +"<w:bookmarkEnd w:id=\"5\"/>");
    string revised = test::text_para("Alpha beta")+test::text_para("gamma delta");
    for (bool paragraphGroups: {true, false}) {
        BOOST_TEST_CONTEXT((paragraphGroups?"paragraph groups":"atoms only")) {
            Pipeline pipeline(original, revised, false, paragraphGroups);
            xml_node result = pipeline.reconstruct();
            BOOST_CHECK_EQUAL(test::accepted_text(result), "Alpha beta\ngamma delta");
            BOOST_CHECK_EQUAL(test::rejected_text(result), "Alpha beta gamma delta");
            xml_document rejected;
            test::copy_tree(result, rejected);
            reject_all_changes(rejected);
            BookmarkDiagnostics d = collect_bookmark_diagnostics(rejected);
            BOOST_CHECK(d.startNames == Words({"whole"}));
            BOOST_CHECK(d.duplicateStartNames.empty());
            BOOST_CHECK(d.duplicateStartIds.empty());
            BOOST_CHECK(d.unmatchedStartIds.empty());
            BOOST_CHECK(d.unmatchedEndIds.empty());
            BOOST_CHECK_EQUAL(count(result, "w:bookmarkStart"), 1u);
            check_unique_revision_ids(result);
        }
    }
    Pipeline pipeline(original, revised, false, false);
    xml_nodes paras = find_all(pipeline.reconstruct(), "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 2u);
    BOOST_CHECK(find_child(find_child(find_child(paras[0], "w:pPr"), "w:rPr"), "w:ins"));
    BOOST_CHECK(!find_child(paras[1], "w:pPr"));
}

BOOST_AUTO_TEST_CASE(joined_paragraphs)
{
    string original = test::para("<w:pPr><w:jc w:val=\"right\"/></w:pPr>"+test::run("Alpha beta"))
        +test::para("<w:bookmarkStart w:id=\"2\" w:name=\"second\"/>"+test::run("gamma delta")+"<w:bookmarkEnd w:id=\"2\"/>");
    string revised = test::text_para("Alpha beta gamma delta");
    for (bool paragraphGroups: {true, false}) {
        BOOST_TEST_CONTEXT((paragraphGroups?"paragraph groups":"atoms only")) {
            Pipeline pipeline(original, revised, false, paragraphGroups);
            xml_node result = pipeline.reconstruct();
            BOOST_CHECK_EQUAL(test::accepted_text(result), "Alpha beta gamma delta");
            BOOST_CHECK_EQUAL(test::rejected_text(result), "Alpha beta\ngamma delta");
            xml_document rejected, accepted;
            test::copy_tree(result, rejected);
            test::copy_tree(result, accepted);
            reject_all_changes(rejected);
            accept_all_changes(accepted);
            BOOST_CHECK(collect_bookmark_diagnostics(rejected).startNames == Words({"second"}));
            BOOST_CHECK(collect_bookmark_diagnostics(rejected).unmatchedEndIds.empty());
            BOOST_CHECK(collect_bookmark_diagnostics(accepted).startNames.empty());
            BOOST_CHECK_EQUAL(find_all(accepted, "w:p").size(), 1u);
            check_unique_revision_ids(result);
        }
    }
    Pipeline pipeline(original, revised, false, false);
    xml_nodes paras = find_all(pipeline.reconstruct(), "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 2u);
    // The first part keeps the properties of its original paragraph
    xml_node pPr = find_child(paras[0], "w:pPr");
    BOOST_CHECK(find_child(pPr, "w:jc"));
    BOOST_CHECK(find_child(find_child(pPr, "w:rPr"), "w:del"));
    BOOST_CHECK(find_all(paras[1], "w:ins").empty());
}

BOOST_AUTO_TEST_CASE(format_change_markup)
{
    Pipeline pipeline(test::text_para("bold"), test::para(test::run("bold", "<w:b/>")), false);
    xml_node result = pipeline.reconstruct();
    xml_nodes changes = find_all(result, "w:rPrChange");
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    xml_node rPr = changes[0].parent();
    BOOST_CHECK(find_child(rPr, "w:b"));
    xml_node old = find_child(changes[0], "w:rPr");
    BOOST_REQUIRE(old);
    BOOST_CHECK(child_elements(old).empty());
    BOOST_CHECK(find_all(result, "w:ins").empty());
    BOOST_CHECK(find_all(result, "w:del").empty());
}

BOOST_AUTO_TEST_CASE(inserted_empty_paragraph)
{
    Pipeline pipeline(test::text_para("A")+test::text_para("B"),
        test::text_para("A")+"<w:p/>"+test::text_para("B"), false);
    xml_nodes paras = find_all(pipeline.reconstruct(), "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 3u);
    BOOST_CHECK(find_all(paras[1], "w:r").empty());
    BOOST_CHECK_EQUAL(find_all(paras[1], "w:ins").size(), 1u);
    BOOST_CHECK(find_child(find_child(paras[1], "w:pPr"), "w:rPr"));
}

BOOST_AUTO_TEST_CASE(bookmarks_kept)
{
    string body = test::para("<w:bookmarkStart w:id=\"3\" w:name=\"target\"/>"+test::run("Heading text")
        +"<w:bookmarkEnd w:id=\"3\"/>")+test::text_para("Body text");
    string revised = test::para("<w:bookmarkStart w:id=\"3\" w:name=\"target\"/>"+test::run("Heading text")
        +"<w:bookmarkEnd w:id=\"3\"/>")+test::text_para("Body copy");
    Pipeline pipeline(body, revised, false);
    xml_node result = pipeline.reconstruct();
    BookmarkDiagnostics d = collect_bookmark_diagnostics(result);
    BOOST_CHECK(d.startNames == Words({"target"}));
    BOOST_CHECK(d.unmatchedStartIds.empty());
    BOOST_CHECK(d.unmatchedEndIds.empty());
    BOOST_CHECK(d.duplicateStartNames.empty());
    BOOST_CHECK(find_all(find_all(result, "w:p").at(0), "w:ins").empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(in_place)

BOOST_AUTO_TEST_CASE(splits_mixed_runs)
{
    Pipeline pipeline(test::text_para("Hello World"), test::text_para("Hello Word"), true);
    BOOST_CHECK_EQUAL(split_mixed_runs(pipeline.merged), 1);
    xml_nodes runs = find_all(pipeline.revised, "w:r");
    BOOST_REQUIRE_EQUAL(runs.size(), 2u);
    BOOST_CHECK_EQUAL(getTextXML(runs[0]), "Hello ");
    BOOST_CHECK_EQUAL(getTextXML(runs[1]), "Word");
    for (const AtomP& atom: pipeline.ra.atoms) {
        BOOST_CHECK(atom->run().parent());
    }
}

BOOST_AUTO_TEST_CASE(keeps_revised_tree)
{
    string revised = test::para("<w:pPr><w:jc w:val=\"center\"/></w:pPr>"+test::run("Hello Word"))
        +"<w:customXml w:element=\"x\">"+test::text_para("kept untouched")+"</w:customXml>";
    string original = test::para("<w:pPr><w:jc w:val=\"center\"/></w:pPr>"+test::run("Hello World"))
        +"<w:customXml w:element=\"x\">"+test::text_para("kept untouched")+"</w:customXml>";
    Pipeline pipeline(original, revised, true);
    xml_node result = pipeline.reconstruct();
    BOOST_CHECK_EQUAL(find_all(result, "w:customXml").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:jc").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:del").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:ins").size(), 1u);
    BOOST_CHECK_EQUAL(test::accepted_text(result), "Hello Word\nkept untouched");
    BOOST_CHECK_EQUAL(test::rejected_text(result), "Hello World\nkept untouched");
}

BOOST_AUTO_TEST_CASE(deleted_paragraph_is_recreated)
{
    Pipeline pipeline(test::text_para("one")+test::text_para("going away")+test::text_para("two"),
        test::text_para("one")+test::text_para("two"), true);
    xml_node result = pipeline.reconstruct();
    xml_nodes paras = find_all(result, "w:p");
    BOOST_REQUIRE_EQUAL(paras.size(), 3u);
    BOOST_CHECK_EQUAL(getTextXML(paras[0]), "one");
    BOOST_CHECK(find_child(find_child(find_child(paras[1], "w:pPr"), "w:rPr"), "w:del"));
    // Adjacent deletions are merged into one wrapper
    BOOST_CHECK_EQUAL(find_all(paras[1], "w:del").size(), 2u);
    BOOST_CHECK_EQUAL(getTextXML(paras[2]), "two");
}

BOOST_AUTO_TEST_CASE(one_wrapper_per_move)
{
    Pipeline pipeline(test::text_para(MOVED)+test::text_para(FIRST)+test::text_para(SECOND),
        test::text_para(FIRST)+test::text_para(SECOND)+test::text_para(MOVED), true);
    xml_node result = pipeline.reconstruct();
    BOOST_CHECK_EQUAL(find_all(result, "w:moveFrom").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:moveTo").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(result, "w:moveFromRangeStart").size(), 1u);
    check_unique_revision_ids(result);
}

BOOST_AUTO_TEST_CASE(original_only_bookmark_survives_reject)
{
    string original = test::para("<w:bookmarkStart w:id=\"0\" w:name=\"old\"/>"+test::run("Some words here")
        +"<w:bookmarkEnd w:id=\"0\"/>");
    Pipeline pipeline(original, test::text_para("Some words there"), true);
    xml_node result = pipeline.reconstruct();
    xml_document rejected, accepted;
    test::copy_tree(result, rejected);
    test::copy_tree(result, accepted);
    reject_all_changes(rejected);
    accept_all_changes(accepted);
    BOOST_CHECK(collect_bookmark_diagnostics(rejected).startNames == Words({"old"}));
    BOOST_CHECK(collect_bookmark_diagnostics(rejected).unmatchedStartIds.empty());
    BOOST_CHECK(collect_bookmark_diagnostics(accepted).startNames.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(markup)

static xml_node first(xml_document& doc, const char* name)
{
    return find_all(doc, name).at(0);
}

BOOST_AUTO_TEST_CASE(revision_wrappers)
{
    xml_document doc;
    test::load(doc, test::para(test::run("x")+test::run("y")));
    RevisionIdState ids;
    Attribution by = {"A", "2024-05-06T07:08:09Z"};
    xml_node ins = wrap_revision(find_all(doc, "w:r").at(0), "w:ins", ids, by);
    BOOST_CHECK(is_element(ins, "w:ins"));
    BOOST_CHECK_EQUAL(ins.attribute("w:id").as_int(), 1);
    BOOST_CHECK_EQUAL(ins.attribute("w:author").value(), string("A"));
    BOOST_CHECK(is_element(ins.first_child(), "w:r"));
    BOOST_CHECK_EQUAL(ids.allocate(), 2);

    xml_node moveTo = wrap_move(find_all(doc, "w:r").at(1), false, "move7", ids, by);
    BOOST_CHECK(is_element(moveTo.previous_sibling(), "w:moveToRangeStart"));
    BOOST_CHECK(is_element(moveTo.next_sibling(), "w:moveToRangeEnd"));
    BOOST_CHECK_EQUAL(moveTo.previous_sibling().attribute("w:name").value(), string("move7"));
    BOOST_CHECK_EQUAL(moveTo.previous_sibling().attribute("w:id").as_int(), moveTo.next_sibling().attribute("w:id").as_int());
    BOOST_CHECK(ids.moveRangeIds("move7") == ids.moveRangeIds("move7"));
    BOOST_CHECK(ids.moveRangeIds("move7").first != ids.moveRangeIds("move7").second);
}

BOOST_AUTO_TEST_CASE(paragraph_marks)
{
    xml_document doc;
    test::load(doc, test::para(test::run("x"))+test::para("<w:pPr><w:sectPr/></w:pPr>"+test::run("y")));
    RevisionIdState ids;
    Attribution by = {"A", "D"};
    xml_nodes paras = find_all(doc, "w:p");
    mark_paragraph(paras[0], "w:ins", ids, by);
    mark_paragraph(paras[0], "w:ins", ids, by);
    BOOST_CHECK(is_element(paras[0].first_child(), "w:pPr"));
    BOOST_CHECK_EQUAL(find_all(paras[0], "w:ins").size(), 1u);

    mark_paragraph(paras[1], "w:del", ids, by);
    xml_node pPr = find_child(paras[1], "w:pPr");
    BOOST_CHECK(is_element(pPr.first_child(), "w:rPr"));
    BOOST_CHECK(is_element(pPr.last_child(), "w:sectPr"));
}

BOOST_AUTO_TEST_CASE(deleted_text_elements)
{
    xml_document doc;
    test::load(doc, test::para("<w:r><w:t>a</w:t><w:instrText>REF x</w:instrText></w:r>"));
    convert_to_deleted(first(doc, "w:r"));
    BOOST_CHECK(find_all(doc, "w:t").empty());
    BOOST_CHECK_EQUAL(find_all(doc, "w:delText").size(), 1u);
    BOOST_CHECK_EQUAL(find_all(doc, "w:delInstrText").size(), 1u);
}

BOOST_AUTO_TEST_CASE(format_change_replaces_previous_one)
{
    xml_document doc, old;
    test::load(doc, test::para("<w:r><w:rPr><w:b/><w:rPrChange w:id=\"9\"><w:rPr/></w:rPrChange></w:rPr><w:t>x</w:t></w:r>"));
    loadXMLString(old, "<w:rPr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:i/></w:rPr>");
    RevisionIdState ids;
    Attribution by = {"A", "D"};
    add_format_change(first(doc, "w:r"), old.document_element(), ids, by);
    xml_nodes changes = find_all(doc, "w:rPrChange");
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    BOOST_CHECK_EQUAL(changes[0].attribute("w:id").as_int(), 1);
    BOOST_CHECK(find_child(find_child(changes[0], "w:rPr"), "w:i"));
}

BOOST_AUTO_TEST_CASE(text_atoms_share_one_element)
{
    xml_document doc;
    test::load(doc, test::text_para("a b")+"<w:p/>");
    AtomizeResult res = atomize(find_body(doc), "word/document.xml");
    xml_node run = find_body(doc).append_child("w:r");
    append_atoms_to_run(run, res.atoms);
    xml_nodes ts = find_all(run, "w:t");
    BOOST_REQUIRE_EQUAL(ts.size(), 1u);
    BOOST_CHECK_EQUAL(getLeafText(ts[0]), "a b");
}

BOOST_AUTO_TEST_CASE(adjacent_revisions_merge)
{
    xml_document doc;
    test::load(doc, test::para(
        "<w:ins w:id=\"1\" w:author=\"A\" w:date=\"D\">"+test::run("a")+"</w:ins>"
        "<w:ins w:id=\"2\" w:author=\"A\" w:date=\"D\">"+test::run("b")+"</w:ins>"
        "<w:ins w:id=\"3\" w:author=\"B\" w:date=\"D\">"+test::run("c")+"</w:ins>"));
    merge_adjacent_revisions(find_body(doc));
    xml_nodes inss = find_all(doc, "w:ins");
    BOOST_REQUIRE_EQUAL(inss.size(), 2u);
    BOOST_CHECK_EQUAL(getTextXML(inss[0]), "ab");
    BOOST_CHECK_EQUAL(getTextXML(inss[1]), "c");
}

BOOST_AUTO_TEST_CASE(premerge)
{
    xml_document doc;
    test::load(doc, test::para(test::run("a")+test::run("b")+test::run("c", "<w:b/>")
        +"<w:r><w:fldChar w:fldCharType=\"begin\"/></w:r>"+test::run("d")));
    BOOST_CHECK(!is_mergeable_run(find_all(doc, "w:r").at(3)));
    BOOST_CHECK(can_merge_runs(find_all(doc, "w:r").at(0), find_all(doc, "w:r").at(1)));
    BOOST_CHECK_EQUAL(premerge_adjacent_runs(find_body(doc)), 1);
    xml_nodes runs = find_all(doc, "w:r");
    BOOST_REQUIRE_EQUAL(runs.size(), 4u);
    BOOST_CHECK_EQUAL(getTextXML(runs[0]), "ab");
}

BOOST_AUTO_TEST_SUITE_END()
