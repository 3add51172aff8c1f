#include "redline/Correlator.h"
#include "redline/MoveDetector.h"
#include "redline/utils.h"
#include <map>
#include <set>
#include <algorithm>

using namespace std;

namespace redline {

bool atoms_equal(const Atom& a, const Atom& b)
{
    return a.fingerprint==b.fingerprint && a.tag==b.tag && a.text==b.text;
}

static void fill_unmatched(LcsResult& res, size_t n, size_t m)
{
    vector<bool> inOriginal(n, false), inRevised(m, false);
    for (const LcsMatch& match: res.matches) {
        inOriginal[match.originalIndex] = true;
        inRevised[match.revisedIndex] = true;
    }
    for (size_t i=0;i<n;i++) {
        if (!inOriginal[i]) {
            res.deletedIndices.push_back(i);
        }
    }
    for (size_t j=0;j<m;j++) {
        if (!inRevised[j]) {
            res.insertedIndices.push_back(j);
        }
    }
}

// Hunt-Szymanski over original[oBegin, oEnd) and revised[rBegin, rEnd). Candidates are found by
// key and confirmed by equal(i, j).
template<class Equal>
static vector<LcsMatch> hunt_szymanski(const vector<Fingerprint>& originalKeys, size_t oBegin, size_t oEnd,
    const vector<Fingerprint>& revisedKeys, size_t rBegin, size_t rEnd, Equal equal)
{
    map<Fingerprint, vector<size_t> > positions;
    for (size_t j=rBegin;j<rEnd;j++) {
        positions[revisedKeys[j]].push_back(j);
    }

    struct Link {
        size_t i;
        size_t j;
        long prev;
    };
    vector<Link> links;
    // thresh[k] is the smallest revised index ending a common subsequence of length k+1
    vector<size_t> thresh;
    vector<long> tails;
    for (size_t i=oBegin;i<oEnd;i++) {
        auto found = positions.find(originalKeys[i]);
        if (found==positions.end()) {
            continue;
        }
        const vector<size_t>& js = found->second;
        long rowK = -1;
        // Positions come in decreasing order, so k never grows within a row and
        // a later position with the same k replaces the link of the earlier one
        for (auto it = js.rbegin(); it!=js.rend(); ++it) {
            size_t j = *it;
            size_t k = lower_bound(thresh.begin(), thresh.end(), j)-thresh.begin();
            if (k<thresh.size() && thresh[k]==j) {
                continue;
            }
            if (!equal(i, j)) {
                continue;
            }
            if (rowK==static_cast<long>(k)) {
                links.back().j = j;
            } else {
                links.push_back({i, j, k>0?tails[k-1]:-1});
                rowK = static_cast<long>(k);
            }
            long link = static_cast<long>(links.size())-1;
            if (k==thresh.size()) {
                thresh.push_back(j);
                tails.push_back(link);
            } else {
                thresh[k] = j;
                tails[k] = link;
            }
        }
    }
    vector<LcsMatch> res;
    for (long l = tails.empty()?-1:tails.back(); l>=0; l = links[l].prev) {
        res.push_back({links[l].i, links[l].j});
    }
    reverse(res.begin(), res.end());
    return res;
}

static vector<Fingerprint> fingerprints(const Atoms& atoms)
{
    vector<Fingerprint> res;
    res.reserve(atoms.size());
    for (const AtomP& a: atoms) {
        res.push_back(a->fingerprint);
    }
    return res;
}

static vector<LcsMatch> atom_matches(const Atoms& original, const Atoms& revised)
{
    vector<LcsMatch> res;
    size_t n = original.size();
    size_t m = revised.size();
    size_t prefix = 0;
    while (prefix<n && prefix<m && atoms_equal(*original[prefix], *revised[prefix])) {
        res.push_back({prefix, prefix});
        prefix++;
    }
    size_t suffix = 0;
    while (suffix<n-prefix && suffix<m-prefix && atoms_equal(*original[n-1-suffix], *revised[m-1-suffix])) {
        suffix++;
    }
    vector<LcsMatch> middle = hunt_szymanski(fingerprints(original), prefix, n-suffix, fingerprints(revised), prefix, m-suffix,
        [&](size_t i, size_t j) { return atoms_equal(*original[i], *revised[j]); });
    res.insert(res.end(), middle.begin(), middle.end());
    for (size_t s=suffix;s>0;s--) {
        res.push_back({n-s, m-s});
    }
    return res;
}

LcsResult compute_atom_lcs(const Atoms& original, const Atoms& revised)
{
    LcsResult res;
    res.matches = atom_matches(original, revised);
    fill_unmatched(res, original.size(), revised.size());
    return res;
}

// Breaks and tabs read as spaces
static string group_text(const Atom& atom)
{
    if (atom.tag=="w:br" || atom.tag=="w:cr" || atom.tag=="w:tab") {
        return " ";
    }
    return atom.visibleText();
}

static void close_group(const Atoms& atoms, AtomGroup& group, string& raw)
{
    group.text = to_lowercase(normalize_white_spaces(raw));
    if (!group.text.empty()) {
        group.key = make_fingerprint("text:"+group.text);
    } else {
        string hashes;
        for (size_t i=group.first;i<group.first+group.count;i++) {
            hashes += fingerprint_string(atoms[i]->fingerprint);
        }
        group.key = make_fingerprint("atoms:"+hashes);
    }
    raw.clear();
}

AtomGroups group_atoms(const Atoms& atoms)
{
    AtomGroups res;
    string raw;
    for (size_t i=0;i<atoms.size();i++) {
        const Atom& atom = *atoms[i];
        bool split = false;
        if (!res.empty()) {
            const AtomGroup& last = res.back();
            const Atom& previous = *atoms[i-1];
            split = previous.paragraphIndex!=atom.paragraphIndex
                || (last.count>=MAX_ATOMS_BEFORE_SPLIT && previous.tag=="w:br");
        }
        if (res.empty() || split) {
            if (!res.empty()) {
                close_group(atoms, res.back(), raw);
            }
            res.push_back(AtomGroup());
            res.back().first = i;
        }
        res.back().count++;
        raw += group_text(atom);
    }
    if (!res.empty()) {
        close_group(atoms, res.back(), raw);
    }
    return res;
}

double group_similarity(const AtomGroup& a, const AtomGroup& b)
{
    return jaccard_word_similarity(a.text, b.text, false);
}

// Pairs the groups left between two exact matches by word similarity, keeping pairs in order
static void pair_similar_groups(const AtomGroups& original, size_t oBegin, size_t oEnd,
    const AtomGroups& revised, size_t rBegin, size_t rEnd, double threshold, vector<LcsMatch>& pairs)
{
    size_t next = rBegin;
    for (size_t i=oBegin;i<oEnd && next<rEnd;i++) {
        double best = -1;
        size_t bestIndex = rEnd;
        for (size_t j=next;j<rEnd;j++) {
            double similarity = group_similarity(original[i], revised[j]);
            if (similarity>=threshold && similarity>best) {
                best = similarity;
                bestIndex = j;
            }
        }
        if (bestIndex<rEnd) {
            pairs.push_back({i, bestIndex});
            next = bestIndex+1;
        }
    }
}

static Atoms slice(const Atoms& atoms, const AtomGroup& group)
{
    return Atoms(atoms.begin()+group.first, atoms.begin()+group.first+group.count);
}

LcsResult compute_hierarchical_lcs(const Atoms& original, const Atoms& revised, double threshold)
{
    AtomGroups originalGroups = group_atoms(original);
    AtomGroups revisedGroups = group_atoms(revised);
    vector<Fingerprint> originalKeys, revisedKeys;
    for (const AtomGroup& g: originalGroups) {
        originalKeys.push_back(g.key);
    }
    for (const AtomGroup& g: revisedGroups) {
        revisedKeys.push_back(g.key);
    }
    vector<LcsMatch> anchors = hunt_szymanski(originalKeys, 0, originalKeys.size(), revisedKeys, 0, revisedKeys.size(),
        [](size_t, size_t) { return true; });

    vector<LcsMatch> pairs;
    size_t o = 0, r = 0;
    for (size_t a=0;a<=anchors.size();a++) {
        size_t oEnd = a<anchors.size()?anchors[a].originalIndex:originalGroups.size();
        size_t rEnd = a<anchors.size()?anchors[a].revisedIndex:revisedGroups.size();
        pair_similar_groups(originalGroups, o, oEnd, revisedGroups, r, rEnd, threshold, pairs);
        if (a<anchors.size()) {
            pairs.push_back(anchors[a]);
            o = oEnd+1;
            r = rEnd+1;
        }
    }

    LcsResult res;
    for (const LcsMatch& pair: pairs) {
        const AtomGroup& og = originalGroups[pair.originalIndex];
        const AtomGroup& rg = revisedGroups[pair.revisedIndex];
        for (const LcsMatch& match: atom_matches(slice(original, og), slice(revised, rg))) {
            res.matches.push_back({og.first+match.originalIndex, rg.first+match.revisedIndex});
        }
    }
    fill_unmatched(res, original.size(), revised.size());
    return res;
}

LcsResult compute_atom_lcs_dp(const Atoms& original, const Atoms& revised)
{
    LcsResult res;
    size_t n = original.size();
    size_t m = revised.size();
    vector<vector<unsigned> > table(n+1, vector<unsigned>(m+1, 0));
    for (size_t i=n;i-->0;) {
        for (size_t j=m;j-->0;) {
            if (atoms_equal(*original[i], *revised[j])) {
                table[i][j] = table[i+1][j+1]+1;
            } else {
                table[i][j] = max(table[i+1][j], table[i][j+1]);
            }
        }
    }
    size_t i = 0, j = 0;
    while (i<n && j<m) {
        if (atoms_equal(*original[i], *revised[j])) {
            res.matches.push_back({i, j});
            i++;
            j++;
        } else if (table[i+1][j]>=table[i][j+1]) {
            i++;
        } else {
            j++;
        }
    }
    fill_unmatched(res, n, m);
    return res;
}

void mark_correlation(Atoms& original, Atoms& revised, const LcsResult& lcs)
{
    for (const LcsMatch& match: lcs.matches) {
        original[match.originalIndex]->setStatus(Phase::Correlate, CorrelationStatus::Equal);
        revised[match.revisedIndex]->setStatus(Phase::Correlate, CorrelationStatus::Equal);
        revised[match.revisedIndex]->counterpart = original[match.originalIndex].get();
        original[match.originalIndex]->counterpart = revised[match.revisedIndex].get();
    }
    for (size_t i: lcs.deletedIndices) {
        original[i]->setStatus(Phase::Correlate, CorrelationStatus::Deleted);
    }
    for (size_t j: lcs.insertedIndices) {
        revised[j]->setStatus(Phase::Correlate, CorrelationStatus::Inserted);
    }
}

Atoms create_merged_atom_list(const Atoms& original, const Atoms& revised, const LcsResult& lcs)
{
    Atoms merged;
    map<size_t, size_t> revisedToOriginal;
    for (const LcsMatch& match: lcs.matches) {
        revisedToOriginal[match.revisedIndex] = match.originalIndex;
    }
    set<size_t> deleted(lcs.deletedIndices.begin(), lcs.deletedIndices.end());

    size_t o = 0;
    for (size_t r=0;r<revised.size();r++) {
        while (o<original.size() && deleted.count(o)) {
            merged.push_back(original[o++]);
        }
        auto found = revisedToOriginal.find(r);
        if (found==revisedToOriginal.end()) {
            merged.push_back(revised[r]);
            continue;
        }
        for (;o<found->second;o++) {
            if (deleted.count(o)) {
                merged.push_back(original[o]);
            }
        }
        const AtomP& orig = original[found->second];
        // The original marker keeps the original paragraph for reject
        merged.push_back(orig->emptyParagraph?orig:revised[r]);
        o = found->second+1;
    }
    for (;o<original.size();o++) {
        if (deleted.count(o)) {
            merged.push_back(original[o]);
        }
    }
    return merged;
}

bool is_original_side(const Atom& atom)
{
    CorrelationStatus s = atom.status();
    return s==CorrelationStatus::Deleted || s==CorrelationStatus::MovedSource
        || (s==CorrelationStatus::Equal && atom.emptyParagraph);
}

static vector<int> paragraph_list(const Atoms& atoms)
{
    set<int> res;
    for (const AtomP& a: atoms) {
        if (a->paragraphIndex>=0) {
            res.insert(a->paragraphIndex);
        }
    }
    return vector<int>(res.begin(), res.end());
}

void assign_unified_paragraph_indices(const Atoms& original, const Atoms& revised, Atoms& merged, const LcsResult& lcs)
{
    map<int, int> originalToRevised;
    for (const LcsMatch& match: lcs.matches) {
        int op = original[match.originalIndex]->paragraphIndex;
        int rp = revised[match.revisedIndex]->paragraphIndex;
        if (op>=0 && rp>=0 && !originalToRevised.count(op)) {
            originalToRevised[op] = rp;
        }
    }
    vector<int> originalParas = paragraph_list(original);
    vector<int> revisedParas = paragraph_list(revised);

    map<int, int> originalOut, revisedOut;
    int next = 0;
    size_t r = 0;
    for (int op: originalParas) {
        auto found = originalToRevised.find(op);
        if (found==originalToRevised.end()) {
            originalOut[op] = next++;
            continue;
        }
        int rp = found->second;
        while (r<revisedParas.size() && revisedParas[r]<rp) {
            if (!revisedOut.count(revisedParas[r])) {
                revisedOut[revisedParas[r]] = next++;
            }
            r++;
        }
        if (!revisedOut.count(rp)) {
            revisedOut[rp] = next;
            originalOut[op] = next;
            next++;
        } else {
            originalOut[op] = revisedOut[rp];
        }
        if (r<revisedParas.size() && revisedParas[r]==rp) {
            r++;
        }
    }
    for (;r<revisedParas.size();r++) {
        if (!revisedOut.count(revisedParas[r])) {
            revisedOut[revisedParas[r]] = next++;
        }
    }

    for (AtomP& atom: merged) {
        if (atom->paragraphIndex<0) {
            continue;
        }
        const map<int, int>& out = is_original_side(*atom)?originalOut:revisedOut;
        auto found = out.find(atom->paragraphIndex);
        if (found!=out.end()) {
            atom->unifiedParagraph = found->second;
        }
    }
}

} // namespace redline
