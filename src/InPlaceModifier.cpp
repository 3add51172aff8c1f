#include "redline/InPlaceModifier.h"
#include "redline/Atomizer.h"
#include "redline/Correlator.h"
#include "redline/FormatDetector.h"
#include <map>
#include <set>
#include <algorithm>
#include <cstdlib>

using namespace std;
using namespace pugi;

namespace redline {

static const set<string> revisionWrappers = {"w:ins", "w:del", "w:moveFrom", "w:moveTo"};

static string mark_key(const Atom& atom)
{
    string key = statusName(atom.status())+"|"+atom.moveName;
    if (atom.formatChange) {
        key += "|"+normalize_run_properties(atom.formatChange->oldRunProperties);
    }
    return key;
}

// Runs of the revised tree holding the atom's content
static xml_nodes atom_runs(const Atom& atom)
{
    xml_nodes res;
    if (atom.collapsedField()) {
        for (const AtomP& part: atom.collapsedFieldAtoms) {
            xml_node run = part->run();
            if (run && find(res.begin(), res.end(), run)==res.end()) {
                res.push_back(run);
            }
        }
    } else if (xml_node run = atom.run()) {
        res.push_back(run);
    }
    return res;
}

// Deleted content goes after the outermost revision wrapper of the run and its move range end
static xml_node insertion_anchor(xml_node run)
{
    xml_node res = run;
    while (res.parent() && revisionWrappers.count(res.parent().name())) {
        res = res.parent();
    }
    xml_node next = res.next_sibling();
    if (is_element(next, "w:moveToRangeEnd")) {
        res = next;
    }
    return res;
}

static xml_node insert_at_start(xml_node p, const char* name)
{
    xml_node pPr = find_child(p, "w:pPr");
    return pPr?p.insert_child_after(name, pPr):p.prepend_child(name);
}

static xml_node outermost_paragraph(const xml_node& node)
{
    xml_node res;
    for (xml_node p = node.parent(); p; p = p.parent()) {
        if (is_element(p, "w:p")) {
            res = p;
        }
    }
    return res;
}

int split_mixed_runs(const Atoms& merged)
{
    map<xml_node, Atoms> byRun;
    // Number of original-side stretches seen before each atom; deleted content goes between pieces
    map<xml_node, vector<int> > gapsByRun;
    xml_nodes order;
    xml_node_set fieldRuns;
    int gap = 0;
    for (const AtomP& atom: merged) {
        if (is_original_side(*atom)) {
            if (atom->status()!=CorrelationStatus::Equal) {
                gap++;
            }
            continue;
        }
        if (atom->emptyParagraph) {
            continue;
        }
        if (atom->collapsedField()) {
            for (const xml_node& run: atom_runs(*atom)) {
                fieldRuns.insert(run);
            }
            continue;
        }
        xml_node run = atom->run();
        if (!run) {
            continue;
        }
        if (!byRun.count(run)) {
            order.push_back(run);
        }
        byRun[run].push_back(atom);
        gapsByRun[run].push_back(gap);
    }

    int count = 0;
    for (xml_node run: order) {
        if (fieldRuns.count(run)) {
            continue;
        }
        vector<Atoms> pieces;
        string key;
        int lastGap = 0;
        const Atoms& atoms = byRun[run];
        const vector<int>& gaps = gapsByRun[run];
        for (size_t i=0;i<atoms.size();i++) {
            string k = mark_key(*atoms[i]);
            if (pieces.empty() || k!=key || gaps[i]!=lastGap) {
                pieces.push_back(Atoms());
                key = k;
                lastGap = gaps[i];
            }
            pieces.back().push_back(atoms[i]);
        }
        if (pieces.size()<2) {
            continue;
        }
        xml_node parent = run.parent();
        xml_node rPr = find_child(run, "w:rPr");
        for (size_t i=0;i<pieces.size();i++) {
            xml_node split = parent.insert_child_before("w:r", run);
            for (xml_attribute a: run.attributes()) {
                split.append_copy(a);
            }
            if (rPr) {
                split.append_copy(rPr);
            }
            if (i==0) {
                for (xml_node child: child_elements(run)) {
                    if (child!=rPr && !is_leaf_node(child)) {
                        split.append_copy(child);
                    }
                }
            }
            append_atoms_to_run(split, pieces[i]);
            for (const AtomP& atom: pieces[i]) {
                replace(atom->ancestors.begin(), atom->ancestors.end(), run, split);
            }
        }
        parent.remove_child(run);
        count++;
    }
    return count;
}

void merge_adjacent_revisions(xml_node root)
{
    xml_node child = root.first_child();
    while (child) {
        xml_node next = child.next_sibling();
        if (next && (is_element(child, "w:ins") || is_element(child, "w:del")) && is_element(next, child.name())
            && string(child.attribute("w:author").value())==next.attribute("w:author").value()
            && string(child.attribute("w:date").value())==next.attribute("w:date").value()) {
            while (xml_node moved = next.first_child()) {
                child.append_move(moved);
            }
            root.remove_child(next);
            continue;
        }
        merge_adjacent_revisions(child);
        child = next;
    }
}

class InPlaceEditor
{
public:
    InPlaceEditor(xml_node body_, const Attribution& by_): body(body_), by(by_) {}

    void prepare(const Atoms& merged) {
        for (const AtomP& atom: merged) {
            int u = atom->unifiedParagraph;
            paragraphAtoms[u].push_back(atom);
            if (!is_original_side(*atom)) {
                revisedParagraphs.insert(make_pair(u, atom->outerParagraph()));
            } else if (atom->emptyParagraph && atom->counterpart) {
                revisedParagraphs.insert(make_pair(u, atom->counterpart->outerParagraph()));
            }
        }
        for (auto& entry: paragraphAtoms) {
            if (is_entire_paragraph_with_status(entry.second, CorrelationStatus::Inserted)
                || is_empty_paragraph_with_status(entry.second, CorrelationStatus::Inserted)) {
                fullyInserted.insert(entry.first);
                if (xml_node p = revised_paragraph(entry.first)) {
                    removedOnReject.insert(p);
                }
            }
        }
    }

    void wrap_revised(const Atoms& merged) {
        xml_node_set done;
        for (const AtomP& atom: merged) {
            if (is_original_side(*atom)) {
                continue;
            }
            for (xml_node run: atom_runs(*atom)) {
                if (!done.insert(run).second) {
                    continue;
                }
                switch (atom->status()) {
                case CorrelationStatus::Inserted:
                    if (!has_ancestor(run, {"w:ins"}, atom->paragraph())) {
                        wrap_revision(run, "w:ins", ids, by);
                    }
                    break;
                case CorrelationStatus::MovedDestination:
                    wrap_move(run, false, atom->moveName, ids, by);
                    break;
                case CorrelationStatus::FormatChanged:
                    add_format_change(run, atom->formatChange?atom->formatChange->oldRunProperties:xml_node(), ids, by);
                    break;
                default:
                    break;
                }
            }
        }
    }

    // Walks the merged list keeping the last position written in the revised tree,
    // placing deleted and moved-from content right after it
    void insert_original(const Atoms& merged) {
        xml_node lastAnchor, lastOuter;
        int lastUnified = -1;
        for (const AtomP& atom: merged) {
            int u = atom->unifiedParagraph;
            if (!is_original_side(*atom)) {
                if (atom->emptyParagraph) {
                    lastAnchor = xml_node();
                } else {
                    xml_nodes runs = atom_runs(*atom);
                    if (runs.empty()) {
                        continue;
                    }
                    lastAnchor = insertion_anchor(runs.back());
                    if (atom->counterpart) {
                        targets.insert(make_pair(atom->counterpart->outerParagraph(), atom->outerParagraph()));
                    }
                }
                lastOuter = atom->outerParagraph();
                lastUnified = u;
                continue;
            }
            if (atom->status()==CorrelationStatus::Equal) {
                // Empty paragraph present in both versions
                if (xml_node p = revised_paragraph(u)) {
                    lastOuter = p;
                    lastAnchor = xml_node();
                    targets.insert(make_pair(atom->outerParagraph(), p));
                }
                lastUnified = u;
                continue;
            }
            if (atom->emptyParagraph) {
                xml_node p = create_paragraph(*atom, lastOuter);
                mark_paragraph(p, "w:del", ids, by);
                created[u] = p;
                targets.insert(make_pair(atom->outerParagraph(), p));
                lastOuter = p;
                lastAnchor = xml_node();
                lastUnified = u;
                continue;
            }

            xml_node target, anchor;
            xml_node revisedPara = revised_paragraph(u);
            if (revisedPara && !fullyInserted.count(u)) {
                target = revisedPara;
                if (lastUnified==u) {
                    anchor = lastAnchor;
                }
            } else if (created.count(u)) {
                target = created[u];
                anchor = createdLast[u];
            } else {
                target = create_paragraph(*atom, lastOuter);
                created[u] = target;
            }
            xml_node placed = place_original_run(atom, target, anchor);
            if (created.count(u)) {
                createdLast[u] = placed;
            }
            targets.insert(make_pair(atom->outerParagraph(), target));
            lastAnchor = placed;
            lastOuter = target;
            lastUnified = u;
        }
    }

    void mark_whole_paragraphs() {
        for (auto& entry: paragraphAtoms) {
            if (fullyInserted.count(entry.first)) {
                if (xml_node p = revised_paragraph(entry.first)) {
                    mark_paragraph(p, "w:ins", ids, by);
                }
            } else if (is_entire_paragraph_with_status(entry.second, CorrelationStatus::Deleted)) {
                auto found = created.find(entry.first);
                xml_node p = found!=created.end()?found->second:revised_paragraph(entry.first);
                if (p) {
                    mark_paragraph(p, "w:del", ids, by);
                }
            }
        }
    }

    // Revised-only markers go inside w:ins and original-only markers are copied inside w:del,
    // so accept and reject each see the bookmark set of their version
    void carry_bookmarks(const xml_node& originalRoot) {
        set<string> originalNames, revisedNames;
        map<string, string> originalIdNames, revisedIdNames;
        long maxId = -1;
        for (const xml_node& start: find_all(originalRoot, "w:bookmarkStart")) {
            originalNames.insert(start.attribute("w:name").value());
            originalIdNames[start.attribute("w:id").value()] = start.attribute("w:name").value();
        }
        xml_nodes revisedMarkers = find_all(body, "w:bookmarkStart");
        for (const xml_node& start: revisedMarkers) {
            revisedNames.insert(start.attribute("w:name").value());
            revisedIdNames[start.attribute("w:id").value()] = start.attribute("w:name").value();
            maxId = max(maxId, strtol(start.attribute("w:id").value(), NULL, 10));
        }
        find_all(body, "w:bookmarkEnd", revisedMarkers);
        for (const xml_node& end: find_all(body, "w:bookmarkEnd")) {
            maxId = max(maxId, strtol(end.attribute("w:id").value(), NULL, 10));
        }

        for (xml_node marker: revisedMarkers) {
            string name = marker_name(marker, revisedIdNames);
            if (name.empty() || originalNames.count(name) || has_ancestor(marker, {"w:ins"})) {
                continue;
            }
            if (removedOnReject.count(outermost_paragraph(marker))) {
                continue;
            }
            wrap_revision(marker, "w:ins", ids, by);
        }

        xml_nodes originalMarkers = find_all(originalRoot, "w:bookmarkStart");
        find_all(originalRoot, "w:bookmarkEnd", originalMarkers);
        map<string, long> newIds;
        map<xml_node, xml_node> startAnchors;
        for (const xml_node& marker: originalMarkers) {
            string name = marker_name(marker, originalIdNames);
            if (name.empty() || revisedNames.count(name)) {
                continue;
            }
            auto target = targets.find(outermost_paragraph(marker));
            if (target==targets.end()) {
                continue;
            }
            xml_node p = target->second;
            xml_node del;
            if (is_element(marker, "w:bookmarkStart")) {
                xml_node anchor = startAnchors[p];
                del = anchor?p.insert_child_after("w:del", anchor):insert_at_start(p, "w:del");
                startAnchors[p] = del;
            } else {
                del = p.append_child("w:del");
            }
            set_revision_attrs(del, ids.allocate(), by.author, by.date);
            auto found = newIds.find(name);
            if (found==newIds.end()) {
                found = newIds.insert(make_pair(name, maxId+1+static_cast<long>(newIds.size()))).first;
            }
            del.append_copy(marker).attribute("w:id").set_value(found->second);
        }
    }

private:
    static string marker_name(const xml_node& marker, const map<string, string>& idNames) {
        if (is_element(marker, "w:bookmarkStart")) {
            return marker.attribute("w:name").value();
        }
        auto found = idNames.find(marker.attribute("w:id").value());
        return found==idNames.end()?string():found->second;
    }

    xml_node revised_paragraph(int u) const {
        auto found = revisedParagraphs.find(u);
        return found==revisedParagraphs.end()?xml_node():found->second;
    }

    // New paragraph after the given one with the original paragraph's properties
    xml_node create_paragraph(const Atom& atom, const xml_node& after) {
        xml_node p = after?after.parent().insert_child_after("w:p", after):body.prepend_child("w:p");
        xml_node source = atom.outerParagraph();
        xml_node pPr = source?find_child(source, "w:pPr"):xml_node();
        if (pPr) {
            p.append_copy(pPr);
        }
        return p;
    }

    // Returns the last node written, the anchor for the next one
    xml_node place_original_run(const AtomP& atom, xml_node target, xml_node anchor) {
        xml_node run = anchor?anchor.parent().insert_child_after("w:r", anchor):insert_at_start(target, "w:r");
        xml_node rPr = run_properties(*atom);
        if (rPr) {
            run.append_copy(rPr);
        }
        append_atoms_to_run(run, Atoms(1, atom));
        convert_to_deleted(run);
        if (atom->status()==CorrelationStatus::MovedSource) {
            // The range end follows the wrapper
            return wrap_move(run, true, atom->moveName, ids, by).next_sibling();
        }
        return wrap_revision(run, "w:del", ids, by);
    }

    xml_node body;
    const Attribution& by;
    RevisionIdState ids;
    map<int, Atoms> paragraphAtoms;
    map<int, xml_node> revisedParagraphs;
    set<int> fullyInserted;
    xml_node_set removedOnReject;
    map<int, xml_node> created;
    map<int, xml_node> createdLast;
    // Original paragraph -> paragraph of the revised tree holding its content
    map<xml_node, xml_node> targets;
};

void modify_revised_document(xml_node revisedRoot, const Atoms& merged, const xml_node& originalRoot, const Attribution& by)
{
    xml_node body = find_body(revisedRoot);
    split_mixed_runs(merged);
    InPlaceEditor editor(body, by);
    editor.prepare(merged);
    editor.wrap_revised(merged);
    editor.insert_original(merged);
    editor.mark_whole_paragraphs();
    editor.carry_bookmarks(originalRoot);
    merge_adjacent_revisions(body);
}

} // namespace redline
