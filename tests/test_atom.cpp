#define BOOST_TEST_MODULE atom
#include <boost/test/unit_test.hpp>
#include "test_helpers.h"
#include "redline/Atom.h"
#include "redline/errors.h"

using namespace std;
using namespace pugi;
using namespace redline;

BOOST_AUTO_TEST_SUITE(fingerprints)

BOOST_AUTO_TEST_CASE(equal_content_gives_equal_fingerprint)
{
    Attributes a = {{"w:val", "1"}, {"w:type", "page"}};
    Attributes b = {{"w:type", "page"}, {"w:val", "1"}};
    BOOST_CHECK(fingerprint_leaf("w:br", a, "") == fingerprint_leaf("w:br", b, ""));
    BOOST_CHECK(fingerprint_leaf("w:t", {}, "Hello") == fingerprint_leaf("w:t", {}, "Hello"));
}

BOOST_AUTO_TEST_CASE(space_preserve_is_ignored)
{
    Attributes preserve = {{"xml:space", "preserve"}};
    BOOST_CHECK(fingerprint_leaf("w:t", preserve, " x") == fingerprint_leaf("w:t", {}, " x"));
}

BOOST_AUTO_TEST_CASE(text_tag_and_attributes_distinguish)
{
    BOOST_CHECK(fingerprint_leaf("w:t", {}, "Hello") != fingerprint_leaf("w:t", {}, "hello"));
    BOOST_CHECK(fingerprint_leaf("w:t", {}, "x") != fingerprint_leaf("w:delText", {}, "x"));
    BOOST_CHECK(fingerprint_leaf("w:br", {{"w:type", "page"}}, "") != fingerprint_leaf("w:br", {}, ""));
}

BOOST_AUTO_TEST_CASE(atom_from_leaf)
{
    xml_document doc;
    test::load(doc, test::para(test::run("abc")));
    xml_node t = find_all(doc, "w:t").at(0);
    xml_nodes ancestors = {find_ancestor(t, "w:p"), find_ancestor(t, "w:r")};
    Atom atom(t, ancestors, "word/document.xml");
    BOOST_CHECK_EQUAL(atom.tag, "w:t");
    BOOST_CHECK_EQUAL(atom.text, "abc");
    BOOST_CHECK(atom.isText());
    BOOST_CHECK(atom.run() == ancestors[1]);
    BOOST_CHECK(atom.paragraph() == ancestors[0]);
    BOOST_CHECK_EQUAL(atom.attr("xml:space"), "preserve");
    BOOST_CHECK_EQUAL(atom.attr("w:val"), "");
    BOOST_CHECK(atom.fingerprint == fingerprint_leaf("w:t", {}, "abc"));
    BOOST_CHECK(atom.status() == CorrelationStatus::Unknown);
}

BOOST_AUTO_TEST_CASE(rehash_follows_text)
{
    Atom atom;
    atom.tag = "w:t";
    atom.text = "a";
    atom.rehash();
    Fingerprint before = atom.fingerprint;
    atom.text = "ab";
    atom.rehash();
    BOOST_CHECK(atom.fingerprint != before);
    BOOST_CHECK_EQUAL(fingerprint_string(atom.fingerprint).size(), 36u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(transitions)

BOOST_AUTO_TEST_CASE(allowed_transitions)
{
    BOOST_CHECK(is_allowed_transition(Phase::Atomize, CorrelationStatus::Unknown, CorrelationStatus::Inserted));
    BOOST_CHECK(is_allowed_transition(Phase::Correlate, CorrelationStatus::Unknown, CorrelationStatus::Equal));
    BOOST_CHECK(is_allowed_transition(Phase::Correlate, CorrelationStatus::Inserted, CorrelationStatus::Deleted));
    BOOST_CHECK(is_allowed_transition(Phase::DetectMoves, CorrelationStatus::Deleted, CorrelationStatus::MovedSource));
    BOOST_CHECK(is_allowed_transition(Phase::DetectMoves, CorrelationStatus::Inserted, CorrelationStatus::MovedDestination));
    BOOST_CHECK(is_allowed_transition(Phase::DetectFormat, CorrelationStatus::Equal, CorrelationStatus::FormatChanged));
}

BOOST_AUTO_TEST_CASE(forbidden_transitions)
{
    BOOST_CHECK(!is_allowed_transition(Phase::Atomize, CorrelationStatus::Unknown, CorrelationStatus::Equal));
    BOOST_CHECK(!is_allowed_transition(Phase::Correlate, CorrelationStatus::Equal, CorrelationStatus::Deleted));
    BOOST_CHECK(!is_allowed_transition(Phase::DetectMoves, CorrelationStatus::Deleted, CorrelationStatus::MovedDestination));
    BOOST_CHECK(!is_allowed_transition(Phase::DetectMoves, CorrelationStatus::Equal, CorrelationStatus::MovedSource));
    BOOST_CHECK(!is_allowed_transition(Phase::DetectFormat, CorrelationStatus::Inserted, CorrelationStatus::FormatChanged));
}

BOOST_AUTO_TEST_CASE(pipeline_sequence)
{
    Atom atom;
    atom.setStatus(Phase::Correlate, CorrelationStatus::Deleted);
    atom.setStatus(Phase::DetectMoves, CorrelationStatus::MovedSource);
    BOOST_CHECK(atom.status() == CorrelationStatus::MovedSource);
}

BOOST_AUTO_TEST_CASE(status_written_once_per_phase)
{
    Atom atom;
    atom.setStatus(Phase::Correlate, CorrelationStatus::Equal);
    BOOST_CHECK_THROW(atom.setStatus(Phase::Correlate, CorrelationStatus::Deleted), RedlineException);
    BOOST_CHECK(atom.status() == CorrelationStatus::Equal);
}

BOOST_AUTO_TEST_CASE(phases_do_not_go_back)
{
    Atom atom;
    atom.setStatus(Phase::Correlate, CorrelationStatus::Equal);
    atom.setStatus(Phase::DetectFormat, CorrelationStatus::FormatChanged);
    try {
        atom.setStatus(Phase::DetectMoves, CorrelationStatus::MovedSource);
        BOOST_FAIL("transition accepted");
    } catch (const RedlineException& e) {
        BOOST_CHECK(e.kind == ErrorKind::Comparison);
        BOOST_CHECK(e.type == ErrorType::IllegalTransition);
    }
}

BOOST_AUTO_TEST_CASE(status_names)
{
    BOOST_CHECK_EQUAL(statusName(CorrelationStatus::MovedDestination), "MovedDestination");
    BOOST_CHECK_EQUAL(statusName(CorrelationStatus::FormatChanged), "FormatChanged");
}

BOOST_AUTO_TEST_SUITE_END()
