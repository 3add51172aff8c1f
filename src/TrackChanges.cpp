#include "redline/TrackChanges.h"
#include "redline/xml-utils.h"
#include <set>
#include <map>
#include <algorithm>
#include <cctype>

using namespace std;
using namespace pugi;

namespace redline {

static bool paragraph_has_marker(const xml_node& p, const char* tag)
{
    xml_node pPr = find_child(p, "w:pPr");
    return pPr && !find_all(pPr, tag).empty();
}

static void remove_paragraph_markers(xml_node root)
{
    for (xml_node& p: find_all(root, "w:p")) {
        xml_node pPr = find_child(p, "w:pPr");
        if (pPr) {
            remove_all(pPr, "w:ins");
            remove_all(pPr, "w:del");
        }
    }
}

// True when every run of p sits inside one of the removable children
static bool holds_only(const xml_node& p, const set<string>& removable)
{
    for (xml_node child: child_elements(p)) {
        if (is_element(child, "w:r")) {
            return false;
        }
        if (removable.count(child.name())) {
            continue;
        }
        if (!find_all(child, "w:r").empty()) {
            return false;
        }
    }
    return true;
}

static bool contains_any(const xml_node& p, const char* tag1, const char* tag2)
{
    return !find_all(p, tag1).empty() || !find_all(p, tag2).empty();
}

class ParagraphSet
{
public:
    void add(const xml_node& p) {
        if (members.insert(p).second) {
            ordered.push_back(p);
        }
    }
    bool has(const xml_node& p) const {
        return members.count(p)>0;
    }
    // Removes member paragraphs still attached under root, innermost first
    void remove_from(xml_node root) const {
        xml_nodes all = find_all(root, "w:p");
        for (auto it = all.rbegin(); it!=all.rend(); ++it) {
            if (has(*it)) {
                it->parent().remove_child(*it);
            }
        }
    }
    xml_nodes ordered;
private:
    xml_node_set members;
};

static void collect_content_only_paragraphs(const xml_node& root, const char* trigger1, const char* trigger2,
    const char* blocker1, const char* blocker2, const set<string>& removable, ParagraphSet& res)
{
    xml_nodes triggers = find_all(root, trigger1);
    if (trigger2) {
        xml_nodes more = find_all(root, trigger2);
        triggers.insert(triggers.end(), more.begin(), more.end());
    }
    for (const xml_node& t: triggers) {
        xml_node p = find_ancestor(t, "w:p");
        if (!p || res.has(p)) {
            continue;
        }
        if (contains_any(p, blocker1, blocker2)) {
            continue;
        }
        if (holds_only(p, removable)) {
            res.add(p);
        }
    }
}

// Paragraphs losing their mark: those left without runs go, the others are returned to be joined
static xml_nodes collect_marked_paragraphs(const xml_node& root, const char* marker, const set<string>& removable,
    ParagraphSet& remove)
{
    xml_nodes joined;
    for (const xml_node& p: find_all(root, "w:p")) {
        if (!paragraph_has_marker(p, marker)) {
            continue;
        }
        if (holds_only(p, removable)) {
            remove.add(p);
        } else {
            joined.push_back(p);
        }
    }
    return joined;
}

// Content of a paragraph whose mark is gone moves to the front of the following paragraph,
// which keeps its own properties. A paragraph with no following one stays.
static void join_paragraphs(const xml_nodes& joined)
{
    for (xml_node p: joined) {
        xml_node next = p.next_sibling();
        while (next && next.type()!=node_element) {
            next = next.next_sibling();
        }
        if (!is_element(next, "w:p")) {
            continue;
        }
        xml_node anchor = find_child(next, "w:pPr");
        xml_node child = p.first_child();
        while (child) {
            xml_node following = child.next_sibling();
            if (!is_element(child, "w:pPr")) {
                anchor = anchor?next.insert_move_after(child, anchor):next.prepend_move(child);
            }
            child = following;
        }
        p.parent().remove_child(p);
    }
}

void accept_all_changes(xml_node root)
{
    ParagraphSet remove;
    static const set<string> removable = {"w:del", "w:moveFrom", "w:pPr", "w:moveFromRangeStart", "w:moveFromRangeEnd"};
    xml_nodes joined = collect_marked_paragraphs(root, "w:del", removable, remove);
    collect_content_only_paragraphs(root, "w:del", "w:moveFrom", "w:ins", "w:moveTo", removable, remove);

    remove_all(root, "w:del");
    remove_all(root, "w:moveFrom");
    remove_all(root, "w:moveFromRangeStart");
    remove_all(root, "w:moveFromRangeEnd");
    remove_all(root, "w:moveToRangeStart");
    remove_all(root, "w:moveToRangeEnd");
    unwrap_all(root, "w:ins");
    unwrap_all(root, "w:moveTo");
    remove_all(root, "w:rPrChange");
    remove_all(root, "w:pPrChange");
    remove.remove_from(root);
    join_paragraphs(joined);
    remove_paragraph_markers(root);
}

static bool is_word_char(char c)
{
    return isalnum(static_cast<unsigned char>(c)) || c=='_';
}

Words referenced_bookmark_names(const string& instruction)
{
    static const char* const keywords[] = {"PAGEREF", "REF"};
    Words res;
    size_t i = 0;
    while (i<instruction.size()) {
        size_t matched = 0;
        if (i==0 || !is_word_char(instruction[i-1])) {
            for (const char* k: keywords) {
                string kw(k);
                if (instruction.compare(i, kw.size(), kw)==0) {
                    matched = kw.size();
                    break;
                }
            }
        }
        if (!matched) {
            i++;
            continue;
        }
        size_t j = i+matched;
        size_t start = j;
        while (j<instruction.size() && isspace(static_cast<unsigned char>(instruction[j]))) {
            j++;
        }
        if (j==start) {
            i++;
            continue;
        }
        size_t nameStart = j;
        while (j<instruction.size() && !isspace(static_cast<unsigned char>(instruction[j])) && instruction[j]!='\\') {
            j++;
        }
        if (j==nameStart) {
            i = j;
            continue;
        }
        res.push_back(instruction.substr(nameStart, j-nameStart));
        i = j;
    }
    return res;
}

typedef map<string, xml_nodes> NodesById;

static NodesById nodes_by_id(const xml_nodes& nodes)
{
    NodesById res;
    for (const xml_node& n: nodes) {
        string id = n.attribute("w:id").value();
        if (!id.empty()) {
            res[id].push_back(n);
        }
    }
    return res;
}

static xml_node neighbour_paragraph(const xml_node& p, const ParagraphSet& removed, bool forward)
{
    for (xml_node s = forward?p.next_sibling():p.previous_sibling(); s; s = forward?s.next_sibling():s.previous_sibling()) {
        if (is_element(s, "w:p") && !removed.has(s)) {
            return s;
        }
    }
    return xml_node();
}

class BookmarkRelocation
{
public:
    BookmarkRelocation(xml_node root_, const ParagraphSet& removed_): root(root_), removed(removed_) {
        startsById = nodes_by_id(find_all(root, "w:bookmarkStart"));
        endsById = nodes_by_id(find_all(root, "w:bookmarkEnd"));
        xml_nodes instrs = find_all(root, "w:instrText");
        xml_nodes delInstrs = find_all(root, "w:delInstrText");
        instrs.insert(instrs.end(), delInstrs.begin(), delInstrs.end());
        for (const xml_node& instr: instrs) {
            xml_node p = find_ancestor(instr, "w:p");
            if ((p && removed.has(p)) || find_ancestor(instr, "w:ins")) {
                continue;
            }
            for (const string& name: referenced_bookmark_names(getLeafText(instr))) {
                referencedOutside.insert(name);
            }
        }
    }

    void run() {
        for (const xml_node& p: removed.ordered) {
            xml_node startTarget = neighbour_paragraph(p, removed, true);
            if (!startTarget) {
                startTarget = neighbour_paragraph(p, removed, false);
            }
            xml_node endTarget = neighbour_paragraph(p, removed, false);
            if (!endTarget) {
                endTarget = neighbour_paragraph(p, removed, true);
            }
            if (!startTarget && !endTarget) {
                continue;
            }
            if (startTarget) {
                for (xml_node& start: find_all(p, "w:bookmarkStart")) {
                    relocate_start(start, p, startTarget);
                }
            }
            if (endTarget) {
                for (xml_node& end: find_all(p, "w:bookmarkEnd")) {
                    relocate_end(end, p, endTarget);
                }
            }
        }
        for (const xml_node& n: detached) {
            n.parent().remove_child(n);
        }
    }

private:
    bool outside(const NodesById& index, const string& id, const xml_node& source) const {
        auto found = index.find(id);
        if (found==index.end()) {
            return false;
        }
        for (const xml_node& n: found->second) {
            if (detached.count(n)) {
                continue;
            }
            xml_node p = find_ancestor(n, "w:p");
            if (p && p!=source && !removed.has(p)) {
                return true;
            }
        }
        return false;
    }

    string name_for_id(const string& id) const {
        auto found = startsById.find(id);
        if (found!=startsById.end()) {
            for (const xml_node& s: found->second) {
                string name = s.attribute("w:name").value();
                if (!name.empty()) {
                    return name;
                }
            }
        }
        return "";
    }

    bool skip(const xml_node& marker, string& id) const {
        if (detached.count(marker) || find_ancestor(marker, "w:ins")) {
            return true;
        }
        id = marker.attribute("w:id").value();
        return id.empty();
    }

    void relocate_start(xml_node start, const xml_node& p, xml_node target) {
        string id;
        if (skip(start, id) || outside(startsById, id, p)) {
            return;
        }
        string name = start.attribute("w:name").value();
        if (!outside(endsById, id, p) && !(!name.empty() && referencedOutside.count(name))) {
            return;
        }
        for (const xml_node& existing: find_all(target, "w:bookmarkStart")) {
            if (detached.count(existing)) {
                continue;
            }
            if (id==existing.attribute("w:id").value() || (!name.empty() && name==existing.attribute("w:name").value())) {
                detached.insert(start);
                return;
            }
        }
        xml_node before;
        for (xml_node child: target.children()) {
            if (!is_element(child, "w:pPr")) {
                before = child;
                break;
            }
        }
        if (before) {
            target.insert_move_before(start, before);
        } else {
            target.append_move(start);
        }
    }

    void relocate_end(xml_node end, const xml_node& p, xml_node target) {
        string id;
        if (skip(end, id) || outside(endsById, id, p)) {
            return;
        }
        string name = name_for_id(id);
        if (!outside(startsById, id, p) && !(!name.empty() && referencedOutside.count(name))) {
            return;
        }
        for (const xml_node& existing: find_all(target, "w:bookmarkEnd")) {
            if (!detached.count(existing) && id==existing.attribute("w:id").value()) {
                detached.insert(end);
                return;
            }
        }
        target.append_move(end);
    }

    xml_node root;
    const ParagraphSet& removed;
    NodesById startsById;
    NodesById endsById;
    set<string> referencedOutside;
    xml_node_set detached;
};

void reject_all_changes(xml_node root)
{
    ParagraphSet remove;
    static const set<string> removable = {"w:ins", "w:moveTo", "w:pPr", "w:moveToRangeStart", "w:moveToRangeEnd"};
    xml_nodes joined = collect_marked_paragraphs(root, "w:ins", removable, remove);
    collect_content_only_paragraphs(root, "w:moveTo", NULL, "w:del", "w:moveFrom", removable, remove);

    if (!remove.ordered.empty()) {
        BookmarkRelocation relocation(root, remove);
        relocation.run();
    }
    remove_all(root, "w:ins");
    remove.remove_from(root);
    remove_all(root, "w:moveTo");
    remove_all(root, "w:moveFromRangeStart");
    remove_all(root, "w:moveFromRangeEnd");
    remove_all(root, "w:moveToRangeStart");
    remove_all(root, "w:moveToRangeEnd");
    unwrap_all(root, "w:del");
    unwrap_all(root, "w:moveFrom");
    rename_all(root, "w:delText", "w:t");
    rename_all(root, "w:delInstrText", "w:instrText");
    remove_all(root, "w:rPrChange");
    remove_all(root, "w:pPrChange");
    join_paragraphs(joined);
    remove_paragraph_markers(root);
}

string extract_text_with_paragraphs(const xml_node& root)
{
    string res;
    bool first = true;
    for (const xml_node& p: find_all(root, "w:p")) {
        if (!first) {
            res+="\n";
        }
        first = false;
        for (const xml_node& t: find_all(p, "w:t")) {
            res+=getLeafText(t);
        }
        for (const xml_node& t: find_all(p, "w:delText")) {
            res+=getLeafText(t);
        }
    }
    return res;
}

string normalize_text(const string& text)
{
    string lines;
    for (size_t i=0;i<text.size();i++) {
        char c = text[i];
        if (c=='\r') {
            if (i+1<text.size() && text[i+1]=='\n') {
                i++;
            }
            c = '\n';
        } else if (c=='\t') {
            c = ' ';
        }
        if (c==' ' && !lines.empty() && lines.back()==' ') {
            continue;
        }
        lines+=c;
    }
    string res;
    for (size_t i=0;i<lines.size();i++) {
        char c = lines[i];
        if (c==' ' && ((i+1<lines.size() && lines[i+1]=='\n') || (!res.empty() && res.back()=='\n'))) {
            continue;
        }
        if (c=='\n' && !res.empty() && res.back()=='\n') {
            continue;
        }
        res+=c;
    }
    size_t b = res.find_first_not_of(" \n");
    if (b==string::npos) {
        return "";
    }
    size_t e = res.find_last_not_of(" \n");
    return res.substr(b, e-b+1);
}

TextComparison compare_texts(const string& expected, const string& actual)
{
    TextComparison res;
    res.identical = expected==actual;
    res.normalizedIdentical = normalize_text(expected)==normalize_text(actual);
    res.expectedLength = expected.size();
    res.actualLength = actual.size();
    if (!res.identical) {
        size_t diff = 0;
        while (diff<expected.size() && diff<actual.size() && expected[diff]==actual[diff]) {
            diff++;
        }
        const size_t context = 50;
        size_t start = diff>context?diff-context:0;
        res.differences.push_back("First difference at position "+to_string(diff)+":");
        res.differences.push_back("  Expected: \"..."+expected.substr(min(start, expected.size()), diff+context-start)+"...\"");
        res.differences.push_back("  Actual:   \"..."+actual.substr(min(start, actual.size()), diff+context-start)+"...\"");
    }
    return res;
}

static Words sorted(const set<string>& s)
{
    return Words(s.begin(), s.end());
}

BookmarkDiagnostics collect_bookmark_diagnostics(const xml_node& root)
{
    set<string> starts, ends, names, dupStarts, dupEnds, dupNames, refs;
    for (const xml_node& n: find_all(root, "w:bookmarkStart")) {
        string id = n.attribute("w:id").value();
        if (id.empty()) {
            continue;
        }
        if (!starts.insert(id).second) {
            dupStarts.insert(id);
        }
        string name = n.attribute("w:name").value();
        if (!name.empty() && !names.insert(name).second) {
            dupNames.insert(name);
        }
    }
    for (const xml_node& n: find_all(root, "w:bookmarkEnd")) {
        string id = n.attribute("w:id").value();
        if (!id.empty() && !ends.insert(id).second) {
            dupEnds.insert(id);
        }
    }
    for (const xml_node& n: find_all(root, "w:instrText")) {
        for (const string& name: referenced_bookmark_names(getLeafText(n))) {
            refs.insert(name);
        }
    }
    BookmarkDiagnostics res;
    res.startIds = sorted(starts);
    res.endIds = sorted(ends);
    res.startNames = sorted(names);
    res.duplicateStartNames = sorted(dupNames);
    res.referencedBookmarkNames = sorted(refs);
    res.duplicateStartIds = sorted(dupStarts);
    res.duplicateEndIds = sorted(dupEnds);
    for (const string& r: refs) {
        if (!names.count(r)) {
            res.unresolvedReferenceNames.push_back(r);
        }
    }
    for (const string& id: starts) {
        if (!ends.count(id)) {
            res.unmatchedStartIds.push_back(id);
        }
    }
    for (const string& id: ends) {
        if (!starts.count(id)) {
            res.unmatchedEndIds.push_back(id);
        }
    }
    return res;
}

bool bookmark_diagnostics_equal(const BookmarkDiagnostics& expected, const BookmarkDiagnostics& actual)
{
    return expected.startNames==actual.startNames
        && expected.duplicateStartNames==actual.duplicateStartNames
        && expected.referencedBookmarkNames==actual.referencedBookmarkNames
        && expected.unresolvedReferenceNames==actual.unresolvedReferenceNames
        && expected.duplicateStartIds==actual.duplicateStartIds
        && expected.duplicateEndIds==actual.duplicateEndIds
        && expected.unmatchedStartIds==actual.unmatchedStartIds
        && expected.unmatchedEndIds==actual.unmatchedEndIds;
}

} // namespace redline
