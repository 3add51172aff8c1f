#include "redline/FormatDetector.h"
#include "redline/Atomizer.h"
#include <map>
#include <set>
#include <algorithm>

using namespace std;
using namespace pugi;

namespace redline {

static const map<string, string> runPropertyNames = {
    {"w:b", "bold"},
    {"w:bCs", "boldComplex"},
    {"w:i", "italic"},
    {"w:iCs", "italicComplex"},
    {"w:u", "underline"},
    {"w:strike", "strikethrough"},
    {"w:dstrike", "doubleStrikethrough"},
    {"w:sz", "fontSize"},
    {"w:szCs", "fontSizeComplex"},
    {"w:rFonts", "font"},
    {"w:color", "color"},
    {"w:highlight", "highlight"},
    {"w:shd", "shading"},
    {"w:vertAlign", "verticalAlign"},
    {"w:caps", "allCaps"},
    {"w:smallCaps", "smallCaps"},
    {"w:vanish", "hidden"},
    {"w:emboss", "emboss"},
    {"w:imprint", "imprint"},
    {"w:outline", "outline"},
    {"w:shadow", "shadow"},
    {"w:spacing", "spacing"},
    {"w:w", "width"},
    {"w:kern", "kerning"},
    {"w:position", "position"}
};

string property_name(const string& tag)
{
    auto found = runPropertyNames.find(tag);
    return found==runPropertyNames.end()?tag:found->second;
}

static string normalize_property(const xml_node& prop)
{
    vector<string> attrs;
    for (xml_attribute a: prop.attributes()) {
        attrs.push_back(string(a.name())+"=\""+a.value()+"\"");
    }
    sort(attrs.begin(), attrs.end());
    string res = "<"+string(prop.name());
    for (const string& a: attrs) {
        res+=" "+a;
    }
    string text = getLeafText(prop);
    if (!text.empty()) {
        res+="|"+text;
    }
    for (xml_node child: child_elements(prop)) {
        res+="|"+canonical_xml(child);
    }
    return res+"/>";
}

// Property element name -> normalized form, without w:rPrChange
static map<string, string> property_map(const xml_node& rPr)
{
    map<string, string> res;
    if (!rPr) {
        return res;
    }
    for (xml_node prop: child_elements(rPr)) {
        if (is_element(prop, "w:rPrChange")) {
            continue;
        }
        res[prop.name()] += normalize_property(prop);
    }
    return res;
}

string normalize_run_properties(const xml_node& rPr)
{
    string res;
    for (const auto& p: property_map(rPr)) {
        res+=p.second;
    }
    return res;
}

bool run_properties_equal(const xml_node& rPr1, const xml_node& rPr2)
{
    return normalize_run_properties(rPr1)==normalize_run_properties(rPr2);
}

static Words sorted_names(const set<string>& tags)
{
    Words res;
    for (const string& t: tags) {
        res.push_back(property_name(t));
    }
    sort(res.begin(), res.end());
    return res;
}

FormatChangeDetails categorize_property_changes(const xml_node& oldRPr, const xml_node& newRPr)
{
    map<string, string> oldProps = property_map(oldRPr);
    map<string, string> newProps = property_map(newRPr);
    set<string> added, removed, changed;
    for (const auto& p: newProps) {
        if (!oldProps.count(p.first)) {
            added.insert(p.first);
        }
    }
    for (const auto& p: oldProps) {
        auto found = newProps.find(p.first);
        if (found==newProps.end()) {
            removed.insert(p.first);
        } else if (found->second!=p.second) {
            changed.insert(p.first);
        }
    }
    FormatChangeDetails res;
    res.added = sorted_names(added);
    res.removed = sorted_names(removed);
    res.changed = sorted_names(changed);
    return res;
}

Words changed_property_names(const xml_node& oldRPr, const xml_node& newRPr)
{
    FormatChangeDetails d = categorize_property_changes(oldRPr, newRPr);
    Words res = d.added;
    res.insert(res.end(), d.removed.begin(), d.removed.end());
    res.insert(res.end(), d.changed.begin(), d.changed.end());
    sort(res.begin(), res.end());
    return res;
}

int detect_format_changes(const Atoms& revised)
{
    int count = 0;
    for (const AtomP& atom: revised) {
        if (atom->status()!=CorrelationStatus::Equal || !atom->counterpart) {
            continue;
        }
        xml_node oldRPr = run_properties(*atom->counterpart);
        xml_node newRPr = run_properties(*atom);
        if (run_properties_equal(oldRPr, newRPr)) {
            continue;
        }
        atom->setStatus(Phase::DetectFormat, CorrelationStatus::FormatChanged);
        FormatChangeInfoP info = make_shared<FormatChangeInfo>();
        info->oldRunProperties = oldRPr;
        info->newRunProperties = newRPr;
        info->details = categorize_property_changes(oldRPr, newRPr);
        info->changedProperties = changed_property_names(oldRPr, newRPr);
        atom->formatChange = info;
        count++;
    }
    return count;
}

} // namespace redline
