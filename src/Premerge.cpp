#include "redline/Premerge.h"
#include "redline/xml-utils.h"
#include <set>
#include <string>

using namespace std;
using namespace pugi;

namespace redline {

static const set<string> mergeableChildren = {"w:rPr", "w:t", "w:tab", "w:br", "w:cr", "w:delText"};

bool is_mergeable_run(const xml_node& run)
{
    if (!is_element(run, "w:r")) {
        return false;
    }
    for (xml_node child: run.children()) {
        if (child.type()==node_pcdata || child.type()==node_cdata) {
            return false;
        }
    }
    for (const xml_node& child: child_elements(run)) {
        if (!mergeableChildren.count(child.name())) {
            return false;
        }
        if (!is_element(child, "w:rPr") && !child_elements(child).empty()) {
            return false;
        }
    }
    return true;
}

static bool same_attributes(const xml_node& a, const xml_node& b)
{
    size_t count = 0;
    for (xml_attribute attr: a.attributes()) {
        xml_attribute other = b.attribute(attr.name());
        if (!other || string(other.value())!=attr.value()) {
            return false;
        }
        count++;
    }
    size_t otherCount = 0;
    for (xml_attribute attr: b.attributes()) {
        (void)attr;
        otherCount++;
    }
    return count==otherCount;
}

bool can_merge_runs(const xml_node& a, const xml_node& b)
{
    if (!is_mergeable_run(a) || !is_mergeable_run(b) || !same_attributes(a, b)) {
        return false;
    }
    xml_node rPr1 = find_child(a, "w:rPr");
    xml_node rPr2 = find_child(b, "w:rPr");
    if (!rPr1 || !rPr2) {
        return !rPr1 && !rPr2;
    }
    return canonical_xml(rPr1)==canonical_xml(rPr2);
}

static int merge_children(xml_node parent)
{
    int merges = 0;
    xml_nodes kids = child_elements(parent);
    size_t i = 0;
    while (i+1<kids.size()) {
        xml_node a = kids[i];
        xml_node b = kids[i+1];
        if (can_merge_runs(a, b)) {
            for (xml_node child: child_elements(b)) {
                if (!is_element(child, "w:rPr")) {
                    a.append_move(child);
                }
            }
            parent.remove_child(b);
            kids.erase(kids.begin()+i+1);
            merges++;
        } else {
            i++;
        }
    }
    return merges;
}

int premerge_adjacent_runs(xml_node root)
{
    int merges = merge_children(root);
    for (xml_node child: child_elements(root)) {
        merges += premerge_adjacent_runs(child);
    }
    return merges;
}

} // namespace redline
