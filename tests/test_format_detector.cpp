#define BOOST_TEST_MODULE format_detector
#include <boost/test/unit_test.hpp>
#include "test_helpers.h"
#include "redline/FormatDetector.h"
#include "redline/Correlator.h"

using namespace std;
using namespace pugi;
using namespace redline;

static xml_node rpr(xml_document& doc, const string& content)
{
    loadXMLString(doc, "<w:rPr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"+content+"</w:rPr>");
    return doc.document_element();
}

class Correlated
{
public:
    Correlated(const string& originalBody, const string& revisedBody) {
        test::load(o, originalBody);
        test::load(r, revisedBody);
        oa = atomize(find_body(o), "word/document.xml");
        ra = atomize(find_body(r), "word/document.xml");
        LcsResult lcs = compute_atom_lcs(oa.atoms, ra.atoms);
        mark_correlation(oa.atoms, ra.atoms, lcs);
    }
    xml_document o, r;
    AtomizeResult oa, ra;
};

BOOST_AUTO_TEST_SUITE(properties)

BOOST_AUTO_TEST_CASE(friendly_names)
{
    BOOST_CHECK_EQUAL(property_name("w:b"), "bold");
    BOOST_CHECK_EQUAL(property_name("w:sz"), "fontSize");
    BOOST_CHECK_EQUAL(property_name("w:lang"), "w:lang");
}

BOOST_AUTO_TEST_CASE(normalization_ignores_order_and_revision_history)
{
    xml_document d1, d2;
    xml_node a = rpr(d1, "<w:b/><w:sz w:val=\"24\"/>");
    xml_node b = rpr(d2, "<w:sz w:val=\"24\"/><w:b/><w:rPrChange w:id=\"1\"><w:rPr/></w:rPrChange>");
    BOOST_CHECK_EQUAL(normalize_run_properties(a), normalize_run_properties(b));
    BOOST_CHECK(run_properties_equal(a, b));
    BOOST_CHECK(run_properties_equal(xml_node(), xml_node()));
    BOOST_CHECK(!run_properties_equal(a, xml_node()));
}

BOOST_AUTO_TEST_CASE(categorizes_changes)
{
    xml_document d1, d2;
    xml_node oldRPr = rpr(d1, "<w:i/><w:sz w:val=\"20\"/>");
    xml_node newRPr = rpr(d2, "<w:b/><w:sz w:val=\"24\"/>");
    FormatChangeDetails details = categorize_property_changes(oldRPr, newRPr);
    BOOST_CHECK(details.added == Words({"bold"}));
    BOOST_CHECK(details.removed == Words({"italic"}));
    BOOST_CHECK(details.changed == Words({"fontSize"}));
    BOOST_CHECK(changed_property_names(oldRPr, newRPr) == Words({"bold", "fontSize", "italic"}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(detection)

BOOST_AUTO_TEST_CASE(bold_added)
{
    Correlated c(test::text_para("bold"), test::para(test::run("bold", "<w:b/>")));
    BOOST_REQUIRE_EQUAL(c.ra.atoms.size(), 1u);
    BOOST_CHECK_EQUAL(detect_format_changes(c.ra.atoms), 1);
    const AtomP& atom = c.ra.atoms[0];
    BOOST_CHECK(atom->status() == CorrelationStatus::FormatChanged);
    BOOST_REQUIRE(atom->formatChange);
    BOOST_CHECK(atom->formatChange->changedProperties == Words({"bold"}));
    BOOST_CHECK(atom->formatChange->details.added == Words({"bold"}));
    BOOST_CHECK(!atom->formatChange->oldRunProperties);
    BOOST_CHECK(atom->formatChange->newRunProperties);
    // The original side keeps its correlation status
    BOOST_CHECK(c.oa.atoms[0]->status() == CorrelationStatus::Equal);
}

BOOST_AUTO_TEST_CASE(same_formatting_stays_equal)
{
    Correlated c(test::para(test::run("same", "<w:i/>")), test::para(test::run("same", "<w:i/>")));
    BOOST_CHECK_EQUAL(detect_format_changes(c.ra.atoms), 0);
    BOOST_CHECK(c.ra.atoms[0]->status() == CorrelationStatus::Equal);
}

BOOST_AUTO_TEST_CASE(inserted_atoms_are_ignored)
{
    Correlated c(test::text_para("old"), test::para(test::run("new", "<w:b/>")));
    BOOST_CHECK_EQUAL(detect_format_changes(c.ra.atoms), 0);
    BOOST_CHECK(c.ra.atoms[0]->status() == CorrelationStatus::Inserted);
}

BOOST_AUTO_TEST_CASE(idempotent)
{
    Correlated c(test::text_para("one two"), test::para(test::run("one two", "<w:u w:val=\"single\"/>")));
    int first = detect_format_changes(c.ra.atoms);
    BOOST_CHECK_EQUAL(first, 3);
    BOOST_CHECK_EQUAL(detect_format_changes(c.ra.atoms), 0);
    BOOST_CHECK_EQUAL(test::count_status(c.ra.atoms, CorrelationStatus::FormatChanged), first);
}

BOOST_AUTO_TEST_SUITE_END()
