#include "redline/Atom.h"
#include "redline/errors.h"
#include <algorithm>
#include <cstring>
#include <map>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace std;
using namespace pugi;

namespace redline {

const char* const EMPTY_PARAGRAPH_TAG = "__emptyParagraph__";

static const map<CorrelationStatus, string> statusNames = {
    {CorrelationStatus::Unknown, "Unknown"},
    {CorrelationStatus::Equal, "Equal"},
    {CorrelationStatus::Deleted, "Deleted"},
    {CorrelationStatus::Inserted, "Inserted"},
    {CorrelationStatus::MovedSource, "MovedSource"},
    {CorrelationStatus::MovedDestination, "MovedDestination"},
    {CorrelationStatus::FormatChanged, "FormatChanged"}
};

const string& statusName(CorrelationStatus status)
{
    return statusNames.at(status);
}

static bool is_seed_status(CorrelationStatus s)
{
    return s==CorrelationStatus::Unknown || s==CorrelationStatus::Inserted || s==CorrelationStatus::Deleted
        || s==CorrelationStatus::MovedSource || s==CorrelationStatus::MovedDestination;
}

bool is_allowed_transition(Phase phase, CorrelationStatus from, CorrelationStatus to)
{
    switch (phase) {
    case Phase::Atomize:
        return from==CorrelationStatus::Unknown && is_seed_status(to);
    case Phase::Correlate:
        return is_seed_status(from) &&
            (to==CorrelationStatus::Equal || to==CorrelationStatus::Deleted || to==CorrelationStatus::Inserted);
    case Phase::DetectMoves:
        return (from==CorrelationStatus::Deleted && to==CorrelationStatus::MovedSource)
            || (from==CorrelationStatus::Inserted && to==CorrelationStatus::MovedDestination);
    case Phase::DetectFormat:
        return from==CorrelationStatus::Equal && to==CorrelationStatus::FormatChanged;
    }
    return false;
}

Fingerprint make_fingerprint(const string& content)
{
    static const boost::uuids::name_generator_sha1 gen(boost::uuids::ns::oid());
    return gen(content);
}

Fingerprint fingerprint_leaf(const string& tag, const Attributes& attrs, const string& text)
{
    vector<string> parts;
    for (const auto& a: attrs) {
        if (a.first=="xml:space") {
            continue;
        }
        parts.push_back(a.first+"="+a.second);
    }
    sort(parts.begin(), parts.end());
    string content = tag;
    for (const string& p: parts) {
        content+="|"+p;
    }
    content+="|"+text;
    return make_fingerprint(content);
}

string fingerprint_string(const Fingerprint& f)
{
    return boost::uuids::to_string(f);
}

Atom::Atom(const xml_node& leaf, const xml_nodes& ancestors_, const string& part_):
    tag(leaf.name()), source(leaf), ancestors(ancestors_), part(part_)
{
    for (xml_attribute attr: leaf.attributes()) {
        attrs.push_back(make_pair(string(attr.name()), string(attr.value())));
    }
    bool has_elements = false;
    for (xml_node child: leaf.children()) {
        if (child.type()==node_element) {
            has_elements = true;
            break;
        }
    }
    // Drawings and embedded objects compare on their whole content
    text = has_elements?canonical_xml(leaf):getLeafText(leaf);
    rehash();
}

void Atom::setStatus(Phase phase, CorrelationStatus status)
{
    int p = static_cast<int>(phase);
    if (p<=_phase || !is_allowed_transition(phase, _status, status)) {
        throw RedlineException(ErrorKind::Comparison, ErrorType::IllegalTransition,
            statusName(_status)+" -> "+statusName(status)+" in phase "+to_string(p), text);
    }
    _status = status;
    _phase = p;
}

xml_node Atom::ancestor(const char* name) const
{
    for (auto it = ancestors.rbegin(); it!=ancestors.rend(); ++it) {
        if (is_element(*it, name)) {
            return *it;
        }
    }
    return xml_node();
}

xml_node Atom::outerParagraph() const
{
    for (const xml_node& a: ancestors) {
        if (is_element(a, "w:p")) {
            return a;
        }
    }
    return xml_node();
}

string Atom::attr(const string& name) const
{
    for (const auto& a: attrs) {
        if (a.first==name) {
            return a.second;
        }
    }
    return "";
}

string Atom::visibleText() const
{
    if (tag=="w:t" || tag=="w:delText") {
        return text;
    }
    if (tag=="w:tab") {
        return "\t";
    }
    if (tag=="w:br" || tag=="w:cr") {
        return "\n";
    }
    return "";
}

bool Atom::whitespaceOnly() const
{
    if (tag=="w:tab" || tag=="w:br" || tag=="w:cr") {
        return true;
    }
    if (isText() && !collapsedField()) {
        return is_blank(text);
    }
    return false;
}

void Atom::rehash()
{
    fingerprint = fingerprint_leaf(tag, attrs, text);
}

ostream& operator<<(ostream& os, const Atom& atom)
{
    os << atom.tag << "[" << statusName(atom.status()) << "] p" << atom.paragraphIndex << " '" << truncate_text(atom.text, 40) << "'";
    return os;
}

} // namespace redline
