#include "redline/Reconstructor.h"
#include "redline/Correlator.h"
#include "redline/Atomizer.h"
#include "redline/FormatDetector.h"
#include <algorithm>
#include <climits>

using namespace std;
using namespace pugi;

namespace redline {

pair<int, int> RevisionIdState::moveRangeIds(const string& moveName)
{
    auto found = moveIds.find(moveName);
    if (found==moveIds.end()) {
        int source = allocate();
        int destination = allocate();
        found = moveIds.insert(make_pair(moveName, make_pair(source, destination))).first;
    }
    return found->second;
}

xml_node wrap_revision(xml_node node, const char* name, RevisionIdState& ids, const Attribution& by)
{
    xml_node wrapper = wrap_node(node, name);
    set_revision_attrs(wrapper, ids.allocate(), by.author, by.date);
    return wrapper;
}

xml_node RevisionIdState::moveRangeEnd(const string& moveName, bool source) const
{
    auto found = moveEnds.find(make_pair(moveName, source));
    return found==moveEnds.end()?xml_node():found->second;
}

xml_node wrap_move(xml_node node, bool source, const string& moveName, RevisionIdState& ids, const Attribution& by)
{
    const char* wrapperName = source?"w:moveFrom":"w:moveTo";
    xml_node parent = node.parent();
    xml_node end = ids.moveRangeEnd(moveName, source);
    if (end) {
        xml_node previous = end.previous_sibling();
        if (node.previous_sibling()==end && is_element(previous, wrapperName)) {
            previous.append_move(node);
            return previous;
        }
        xml_node wrapper = wrap_revision(node, wrapperName, ids, by);
        parent.insert_move_after(end, wrapper);
        return wrapper;
    }
    int rangeId = source?ids.moveRangeIds(moveName).first:ids.moveRangeIds(moveName).second;
    xml_node start = parent.insert_child_before(source?"w:moveFromRangeStart":"w:moveToRangeStart", node);
    start.append_attribute("w:id") = rangeId;
    start.append_attribute("w:name") = moveName.c_str();
    start.append_attribute("w:author") = by.author.c_str();
    start.append_attribute("w:date") = by.date.c_str();
    xml_node wrapper = wrap_revision(node, wrapperName, ids, by);
    end = parent.insert_child_after(source?"w:moveFromRangeEnd":"w:moveToRangeEnd", wrapper);
    end.append_attribute("w:id") = rangeId;
    ids.setMoveRangeEnd(moveName, source, end);
    return wrapper;
}

static xml_node first_child_named(xml_node parent, const char* name)
{
    xml_node child = find_child(parent, name);
    if (!child) {
        child = parent.prepend_child(name);
    }
    return child;
}

void mark_paragraph(xml_node p, const char* marker, RevisionIdState& ids, const Attribution& by)
{
    xml_node pPr = first_child_named(p, "w:pPr");
    xml_node rPr = find_child(pPr, "w:rPr");
    if (!rPr) {
        xml_node before = find_child(pPr, "w:sectPr");
        if (!before) {
            before = find_child(pPr, "w:pPrChange");
        }
        rPr = before?pPr.insert_child_before("w:rPr", before):pPr.append_child("w:rPr");
    }
    if (!find_child(rPr, marker)) {
        set_revision_attrs(rPr.prepend_child(marker), ids.allocate(), by.author, by.date);
    }
}

void convert_to_deleted(xml_node node)
{
    if (is_element(node, "w:t")) {
        node.set_name("w:delText");
    } else if (is_element(node, "w:instrText")) {
        node.set_name("w:delInstrText");
    }
    rename_all(node, "w:t", "w:delText");
    rename_all(node, "w:instrText", "w:delInstrText");
}

void add_format_change(xml_node run, const xml_node& oldRPr, RevisionIdState& ids, const Attribution& by)
{
    xml_node rPr = first_child_named(run, "w:rPr");
    remove_all(rPr, "w:rPrChange");
    xml_node change = rPr.append_child("w:rPrChange");
    set_revision_attrs(change, ids.allocate(), by.author, by.date);
    xml_node old = change.append_child("w:rPr");
    if (oldRPr) {
        for (xml_node child: child_elements(oldRPr)) {
            if (!is_element(child, "w:rPrChange")) {
                old.append_copy(child);
            }
        }
    }
}

bool is_entire_paragraph_with_status(const Atoms& atoms, CorrelationStatus status)
{
    bool content = false;
    bool target = false;
    for (const AtomP& atom: atoms) {
        if (atom->emptyParagraph) {
            continue;
        }
        content = true;
        if (atom->status()==status) {
            target = true;
        } else if (!atom->whitespaceOnly()) {
            return false;
        }
    }
    return content && target;
}

bool is_empty_paragraph_with_status(const Atoms& atoms, CorrelationStatus status)
{
    for (const AtomP& atom: atoms) {
        if (!atom->emptyParagraph || atom->status()!=status) {
            return false;
        }
    }
    return !atoms.empty();
}

struct RunGroup {
    CorrelationStatus status;
    Atoms atoms;
    xml_node rPr;
    string moveName;
    string formatKey;
    FormatChangeInfoP formatChange;
};

typedef vector<RunGroup> RunGroups;

struct ParagraphGroup {
    Atoms atoms;
    RunGroups runs;
    // Paragraph lending its properties
    xml_node source;
    // Paragraph mark revision for a break present in one version only
    const char* mark = NULL;
};

static string format_key(const Atom& atom)
{
    xml_node rPr = run_properties(atom);
    string key = rPr?canonical_xml(rPr):string();
    if (atom.formatChange) {
        key += "|was:"+normalize_run_properties(atom.formatChange->oldRunProperties);
    }
    return key;
}

static ParagraphGroup make_paragraph_group(const Atoms& atoms)
{
    ParagraphGroup g;
    g.atoms = atoms;
    g.source = atoms.front()->outerParagraph();
    for (const AtomP& atom: atoms) {
        string key = format_key(*atom);
        if (g.runs.empty() || g.runs.back().status!=atom->status() || g.runs.back().moveName!=atom->moveName
            || g.runs.back().formatKey!=key) {
            RunGroup run;
            run.status = atom->status();
            run.rPr = run_properties(*atom);
            run.moveName = atom->moveName;
            run.formatKey = key;
            run.formatChange = atom->formatChange;
            g.runs.push_back(run);
        }
        g.runs.back().atoms.push_back(atom);
    }
    return g;
}

// Original paragraph holding the atom's content; empty for revised-only content
static xml_node original_paragraph(const Atom& atom)
{
    if (is_original_side(atom)) {
        return atom.outerParagraph();
    }
    CorrelationStatus s = atom.status();
    if (atom.counterpart && (s==CorrelationStatus::Equal || s==CorrelationStatus::FormatChanged)) {
        return atom.counterpart->outerParagraph();
    }
    return xml_node();
}

// One group per unified paragraph. Original paragraphs joined in the revised version keep a paragraph
// each, with a deleted mark on all but the last. A paragraph ending inside an original paragraph
// continued by the next group gets an inserted mark.
static vector<ParagraphGroup> group_by_paragraph(const Atoms& merged)
{
    Atoms sorted = merged;
    stable_sort(sorted.begin(), sorted.end(), [](const AtomP& a, const AtomP& b) {
        int ia = a->unifiedParagraph<0?INT_MAX:a->unifiedParagraph;
        int ib = b->unifiedParagraph<0?INT_MAX:b->unifiedParagraph;
        return ia<ib;
    });
    vector<ParagraphGroup> groups;
    Atoms piece;
    xml_node pieceOriginal;
    for (const AtomP& atom: sorted) {
        xml_node original = original_paragraph(*atom);
        if (!piece.empty() && piece.back()->unifiedParagraph!=atom->unifiedParagraph) {
            groups.push_back(make_paragraph_group(piece));
            piece.clear();
            pieceOriginal = xml_node();
        } else if (!piece.empty() && original && pieceOriginal && original!=pieceOriginal) {
            groups.push_back(make_paragraph_group(piece));
            groups.back().source = pieceOriginal;
            groups.back().mark = "w:del";
            piece.clear();
        }
        if (original) {
            pieceOriginal = original;
        }
        piece.push_back(atom);
    }
    if (!piece.empty()) {
        groups.push_back(make_paragraph_group(piece));
    }

    xml_node following;
    for (size_t i=groups.size();i-->0;) {
        xml_node first, last;
        for (const AtomP& atom: groups[i].atoms) {
            if (xml_node original = original_paragraph(*atom)) {
                if (!first) {
                    first = original;
                }
                last = original;
            }
        }
        if (last && last==following && !groups[i].mark) {
            groups[i].mark = "w:ins";
        }
        if (first) {
            following = first;
        }
    }
    return groups;
}

static bool whitespace_group(const RunGroup& g)
{
    for (const AtomP& atom: g.atoms) {
        if (!atom->whitespaceOnly()) {
            return false;
        }
    }
    return true;
}

static bool is_change(CorrelationStatus s)
{
    return s==CorrelationStatus::Deleted || s==CorrelationStatus::Inserted;
}

// Deletions before insertions inside every block of adjacent changes
static RunGroups reorder_change_blocks(const RunGroups& runs)
{
    RunGroups res;
    size_t i = 0;
    while (i<runs.size()) {
        if (!is_change(runs[i].status)) {
            res.push_back(runs[i++]);
            continue;
        }
        RunGroups deletions, insertions;
        for (;i<runs.size();i++) {
            const RunGroup& g = runs[i];
            if (g.status==CorrelationStatus::Deleted) {
                deletions.push_back(g);
            } else if (g.status==CorrelationStatus::Inserted) {
                insertions.push_back(g);
            } else if (g.status==CorrelationStatus::Equal && whitespace_group(g)) {
                // Kept on both sides so accept and reject each see the space
                deletions.push_back(g);
                deletions.back().status = CorrelationStatus::Deleted;
                insertions.push_back(g);
                insertions.back().status = CorrelationStatus::Inserted;
            } else {
                break;
            }
        }
        res.insert(res.end(), deletions.begin(), deletions.end());
        res.insert(res.end(), insertions.begin(), insertions.end());
    }
    return res;
}

static void flush_text(xml_node run, string& pending)
{
    if (!pending.empty()) {
        append_text_element(run, "w:t", pending);
        pending.clear();
    }
}

static void append_atom_content(xml_node run, const Atom& atom, string& pending)
{
    if (atom.collapsedField()) {
        flush_text(run, pending);
        for (const AtomP& part: atom.collapsedFieldAtoms) {
            append_atom_content(run, *part, pending);
        }
        flush_text(run, pending);
        return;
    }
    if (atom.isText()) {
        pending += atom.text;
        return;
    }
    flush_text(run, pending);
    if (atom.source) {
        run.append_copy(atom.source);
    }
}

void append_atoms_to_run(xml_node run, const Atoms& atoms)
{
    string pending;
    for (const AtomP& atom: atoms) {
        if (!atom->emptyParagraph) {
            append_atom_content(run, *atom, pending);
        }
    }
    flush_text(run, pending);
}

// Empty handle when the group holds no content
static xml_node build_run(xml_node parent, const RunGroup& g)
{
    bool content = false;
    for (const AtomP& atom: g.atoms) {
        content = content || !atom->emptyParagraph;
    }
    if (!content) {
        return xml_node();
    }
    xml_node run = parent.append_child("w:r");
    if (g.rPr) {
        run.append_copy(g.rPr);
    }
    append_atoms_to_run(run, g.atoms);
    return run;
}

struct BookmarkMarker {
    xml_node node;
    bool start;
    string name;
    string key;
};

class DocumentRebuilder
{
public:
    DocumentRebuilder(const Attribution& by_): by(by_) {}

    void build(const Atoms& merged, xml_node body, xml_node before) {
        for (const ParagraphGroup& group: group_by_paragraph(merged)) {
            xml_node p = before?body.insert_child_before("w:p", before):body.append_child("w:p");
            build_paragraph(group, p);
        }
    }

private:
    void build_paragraph(const ParagraphGroup& group, xml_node p) {
        xml_node pPr = group.source?find_child(group.source, "w:pPr"):xml_node();
        if (pPr) {
            p.append_copy(pPr);
        }
        RunGroups runs = reorder_change_blocks(group.runs);
        // Part of a split or joined paragraph keeps its runs as they are
        bool part = group.mark!=NULL;
        bool wholeInserted = !part && is_entire_paragraph_with_status(group.atoms, CorrelationStatus::Inserted);
        bool wholeDeleted = !part && is_entire_paragraph_with_status(group.atoms, CorrelationStatus::Deleted);
        bool emptyInserted = !part && is_empty_paragraph_with_status(group.atoms, CorrelationStatus::Inserted);
        bool emptyDeleted = !part && is_empty_paragraph_with_status(group.atoms, CorrelationStatus::Deleted);

        if (wholeInserted || wholeDeleted) {
            mark_paragraph(p, wholeInserted?"w:ins":"w:del", ids, by);
            xml_node wrapper = p.append_child(wholeInserted?"w:ins":"w:del");
            set_revision_attrs(wrapper, ids.allocate(), by.author, by.date);
            for (const RunGroup& g: group.runs) {
                build_run(wrapper, g);
            }
            if (wholeDeleted) {
                convert_to_deleted(wrapper);
            }
        } else if (emptyInserted || emptyDeleted) {
            mark_paragraph(p, emptyInserted?"w:ins":"w:del", ids, by);
        } else {
            for (const RunGroup& g: runs) {
                build_marked_run(p, g);
            }
            if (group.mark) {
                mark_paragraph(p, group.mark, ids, by);
            }
        }

        bool removed = false, kept = false, moveTo = false;
        for (const RunGroup& g: runs) {
            if (!has_content(g)) {
                continue;
            }
            switch (g.status) {
            case CorrelationStatus::Deleted:
            case CorrelationStatus::MovedSource:
                removed = true;
                break;
            case CorrelationStatus::MovedDestination:
                moveTo = true;
                break;
            case CorrelationStatus::Equal:
            case CorrelationStatus::FormatChanged:
                kept = true;
                break;
            default:
                break;
            }
        }
        bool inserted = moveTo || any_status(runs, CorrelationStatus::Inserted);
        bool survivesAccept = !wholeDeleted && !emptyDeleted && !(removed && !inserted && !kept);
        bool survivesReject = !wholeInserted && !emptyInserted && !(moveTo && !removed && !kept);
        place_bookmarks(group, p, wholeInserted || wholeDeleted, survivesAccept && survivesReject);
    }

    static bool has_content(const RunGroup& g) {
        for (const AtomP& atom: g.atoms) {
            if (!atom->emptyParagraph) {
                return true;
            }
        }
        return false;
    }

    static bool any_status(const RunGroups& runs, CorrelationStatus s) {
        for (const RunGroup& g: runs) {
            if (g.status==s && has_content(g)) {
                return true;
            }
        }
        return false;
    }

    void build_marked_run(xml_node p, const RunGroup& g) {
        xml_node run = build_run(p, g);
        if (!run) {
            return;
        }
        switch (g.status) {
        case CorrelationStatus::Inserted:
            wrap_revision(run, "w:ins", ids, by);
            break;
        case CorrelationStatus::Deleted:
            convert_to_deleted(run);
            wrap_revision(run, "w:del", ids, by);
            break;
        case CorrelationStatus::MovedSource:
            convert_to_deleted(run);
            wrap_move(run, true, g.moveName, ids, by);
            break;
        case CorrelationStatus::MovedDestination:
            wrap_move(run, false, g.moveName, ids, by);
            break;
        case CorrelationStatus::FormatChanged:
            add_format_change(run, g.formatChange?g.formatChange->oldRunProperties:xml_node(), ids, by);
            break;
        default:
            break;
        }
    }

    const map<string, string>& id_names(const xml_node& root) {
        auto found = idNames.find(root);
        if (found!=idNames.end()) {
            return found->second;
        }
        map<string, string>& names = idNames[root];
        for (const xml_node& start: find_all(root, "w:bookmarkStart")) {
            names[start.attribute("w:id").value()] = start.attribute("w:name").value();
        }
        return names;
    }

    // Markers not yet placed by an earlier paragraph
    vector<BookmarkMarker> collect_markers(const xml_nodes& paragraphs, const string& side) {
        vector<BookmarkMarker> res;
        for (const xml_node& para: paragraphs) {
            const map<string, string>& names = id_names(para.root());
            for (const char* tag: {"w:bookmarkStart", "w:bookmarkEnd"}) {
                for (const xml_node& n: find_all(para, tag)) {
                    if (!placed.insert(n).second) {
                        continue;
                    }
                    BookmarkMarker m;
                    m.node = n;
                    m.start = is_element(n, "w:bookmarkStart");
                    string id = n.attribute("w:id").value();
                    if (m.start) {
                        m.name = n.attribute("w:name").value();
                    } else {
                        auto found = names.find(id);
                        m.name = found==names.end()?string():found->second;
                    }
                    m.key = m.name.empty()?"#"+side+":"+id:m.name;
                    res.push_back(m);
                }
            }
        }
        return res;
    }

    static void add_unique(xml_nodes& list, const xml_node& n) {
        if (n && find(list.begin(), list.end(), n)==list.end()) {
            list.push_back(n);
        }
    }

    void place_bookmarks(const ParagraphGroup& group, xml_node p, bool whole, bool survivesBoth) {
        xml_nodes originalParas, revisedParas;
        for (const AtomP& atom: group.atoms) {
            bool original = is_original_side(*atom);
            add_unique(original?originalParas:revisedParas, atom->outerParagraph());
            if (atom->counterpart && !whole) {
                add_unique(original?revisedParas:originalParas, atom->counterpart->outerParagraph());
            }
        }
        vector<BookmarkMarker> revisedMarkers = collect_markers(revisedParas, "r");
        vector<BookmarkMarker> originalMarkers = collect_markers(originalParas, "o");
        vector<bool> consumed(originalMarkers.size(), false);

        xml_node startAnchor = find_child(p, "w:pPr");
        for (const BookmarkMarker& m: revisedMarkers) {
            bool plain = false;
            for (size_t k=0;survivesBoth && !m.name.empty() && k<originalMarkers.size();k++) {
                if (!consumed[k] && originalMarkers[k].start==m.start && originalMarkers[k].name==m.name) {
                    consumed[k] = true;
                    plain = true;
                    break;
                }
            }
            place_marker(p, m, plain?NULL:"w:ins", startAnchor);
        }
        for (size_t k=0;k<originalMarkers.size();k++) {
            if (!consumed[k]) {
                place_marker(p, originalMarkers[k], "w:del", startAnchor);
            }
        }
    }

    // Starts go to the front of the paragraph in order, ends to the back
    void place_marker(xml_node p, const BookmarkMarker& m, const char* wrapper, xml_node& startAnchor) {
        xml_node holder;
        if (wrapper) {
            holder = m.start?(startAnchor?p.insert_child_after(wrapper, startAnchor):p.prepend_child(wrapper))
                :p.append_child(wrapper);
            set_revision_attrs(holder, ids.allocate(), by.author, by.date);
        }
        xml_node marker;
        if (holder) {
            marker = holder.append_copy(m.node);
        } else if (m.start) {
            marker = startAnchor?p.insert_copy_after(m.node, startAnchor):p.prepend_copy(m.node);
        } else {
            marker = p.append_copy(m.node);
        }
        if (m.start) {
            startAnchor = holder?holder:marker;
        }
        auto found = bookmarkIds.find(m.key);
        if (found==bookmarkIds.end()) {
            found = bookmarkIds.insert(make_pair(m.key, static_cast<int>(bookmarkIds.size()))).first;
        }
        marker.attribute("w:id").set_value(found->second);
    }

    const Attribution& by;
    RevisionIdState ids;
    map<xml_node, map<string, string> > idNames;
    map<string, int> bookmarkIds;
    // Source markers of both versions already copied to the output
    xml_node_set placed;
};

xml_node copy_document_shell(const xml_node& revisedRoot, xml_document& out, xml_node& sectPr)
{
    out.reset();
    if (revisedRoot.type()==node_document) {
        for (xml_node child: revisedRoot.children()) {
            out.append_copy(child);
        }
    } else {
        out.append_copy(revisedRoot);
    }
    xml_node body = find_body(out);
    xml_nodes children = child_elements(body);
    sectPr = xml_node();
    if (!children.empty() && is_element(children.back(), "w:sectPr")) {
        sectPr = children.back();
    }
    xml_node child = body.first_child();
    while (child) {
        xml_node next = child.next_sibling();
        if (child!=sectPr) {
            body.remove_child(child);
        }
        child = next;
    }
    return body;
}

void rebuild_document(const Atoms& merged, const xml_node& revisedRoot, const Attribution& by, xml_document& out)
{
    xml_node sectPr;
    xml_node body = copy_document_shell(revisedRoot, out, sectPr);
    DocumentRebuilder rebuilder(by);
    rebuilder.build(merged, body, sectPr);
}

} // namespace redline
