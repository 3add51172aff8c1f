#include "redline/Atomizer.h"
#include <set>
#include <map>

using namespace std;
using namespace pugi;

namespace redline {

static const set<string> leafTags = {
    "w:t", "w:br", "w:cr", "w:tab", "w:sym", "w:softHyphen", "w:noBreakHyphen",
    "w:fldChar", "w:instrText", "w:delText",
    "w:dayShort", "w:dayLong", "w:monthShort", "w:monthLong", "w:yearShort", "w:yearLong",
    "w:annotationRef", "w:footnoteRef", "w:endnoteRef", "w:footnoteReference", "w:endnoteReference",
    "w:separator", "w:continuationSeparator", "w:pgNum",
    "w:drawing", "w:pict", "w:object", "mc:AlternateContent"
};

static const map<string, CorrelationStatus> revisionStatus = {
    {"w:ins", CorrelationStatus::Inserted},
    {"w:del", CorrelationStatus::Deleted},
    {"w:moveFrom", CorrelationStatus::MovedSource},
    {"w:moveTo", CorrelationStatus::MovedDestination}
};

bool is_leaf_node(const xml_node& node)
{
    return node.type()==node_element && leafTags.count(node.name())>0;
}

static bool has_leaf_descendant(const xml_node& node)
{
    for (xml_node child: node.children()) {
        if (child.type()!=node_element) {
            continue;
        }
        if (is_leaf_node(child) || has_leaf_descendant(child)) {
            return true;
        }
    }
    return false;
}

struct AtomizeState {
    string lastContentHash;
    int consecutiveEmpty = 0;
    int emptyParagraphCount = 0;
    const AtomizeOptions* options;
    shared_ptr<xml_document> clones;
    string part;
};

static void seed_revision(Atom& atom)
{
    for (auto it = atom.ancestors.rbegin(); it!=atom.ancestors.rend(); ++it) {
        auto found = revisionStatus.find(it->name());
        if (it->type()==node_element && found!=revisionStatus.end()) {
            atom.revision = *it;
            atom.setStatus(Phase::Atomize, found->second);
            return;
        }
    }
}

static AtomP empty_paragraph_atom(const xml_node& p, const xml_nodes& ancestors, AtomizeState& state)
{
    AtomP atom = make_shared<Atom>();
    atom->tag = EMPTY_PARAGRAPH_TAG;
    atom->ancestors = ancestors;
    atom->ancestors.push_back(p);
    atom->part = state.part;
    atom->emptyParagraph = true;
    xml_node pPr = find_child(p, "w:pPr");
    string context = state.lastContentHash.empty()?string("document-start"):state.lastContentHash;
    string hashContent = "empty-paragraph:"+context+":"+to_string(state.consecutiveEmpty)+":"
        +(pPr?canonical_xml(pPr):string("no-pPr"));
    atom->fingerprint = make_fingerprint(hashContent);
    seed_revision(*atom);
    return atom;
}

static void atomize_node(const xml_node& node, xml_nodes& ancestors, AtomizeState& state, Atoms& res)
{
    if (is_leaf_node(node)) {
        xml_node leaf = node;
        if (state.options->cloneLeafNodes) {
            leaf = state.clones->append_copy(node);
        }
        AtomP atom = make_shared<Atom>(leaf, ancestors, state.part);
        seed_revision(*atom);
        res.push_back(atom);
        state.lastContentHash = fingerprint_string(atom->fingerprint);
        state.consecutiveEmpty = 0;
        return;
    }
    if (is_element(node, "w:p") && !has_leaf_descendant(node)) {
        res.push_back(empty_paragraph_atom(node, ancestors, state));
        state.consecutiveEmpty++;
        state.emptyParagraphCount++;
        return;
    }
    ancestors.push_back(node);
    for (xml_node child: node.children()) {
        if (child.type()==node_element) {
            atomize_node(child, ancestors, state, res);
        }
    }
    ancestors.pop_back();
}

AtomizeResult atomize(const xml_node& root, const string& part, const AtomizeOptions& options)
{
    AtomizeResult result;
    AtomizeState state;
    state.options = &options;
    state.part = part;
    if (options.cloneLeafNodes) {
        state.clones = make_shared<xml_document>();
    }
    Atoms raw;
    xml_nodes ancestors;
    atomize_node(root, ancestors, state, raw);

    Atoms atoms = collapse_field_sequences(raw);
    atoms = merge_contiguous_text_atoms(atoms, options.mergeAcrossRuns);
    if (options.splitTextIntoWords) {
        atoms = split_atoms_into_words(atoms);
    }
    atoms = merge_punctuation_atoms(atoms, options.mergePunctuationAcrossRuns);
    assign_paragraph_indices(atoms);

    result.atoms = atoms;
    result.emptyParagraphCount = state.emptyParagraphCount;
    result.clones = state.clones;
    return result;
}

static bool is_field_char(const Atom& atom, const char* type)
{
    return atom.tag=="w:fldChar" && atom.attr("w:fldCharType")==type;
}

static string field_visible_text(const Atoms& atoms, size_t from, size_t to)
{
    string res;
    for (size_t i=from;i<to;i++) {
        if (atoms[i]->tag=="w:t") {
            res+=atoms[i]->text;
        }
    }
    return res;
}

static bool spans_paragraphs(const Atoms& atoms)
{
    xml_node para;
    for (const AtomP& a: atoms) {
        xml_node p = a->outerParagraph();
        if (!p) {
            continue;
        }
        if (para && p!=para) {
            return true;
        }
        para = p;
    }
    return false;
}

Atoms collapse_field_sequences(const Atoms& atoms)
{
    Atoms res;
    size_t i = 0;
    while (i<atoms.size()) {
        if (!is_field_char(*atoms[i], "begin")) {
            res.push_back(atoms[i++]);
            continue;
        }
        Atoms field;
        field.push_back(atoms[i++]);
        int depth = 1;
        long separator = -1;
        while (i<atoms.size() && depth>0) {
            const AtomP& cur = atoms[i++];
            field.push_back(cur);
            if (is_field_char(*cur, "begin")) {
                depth++;
            } else if (is_field_char(*cur, "end")) {
                depth--;
            } else if (depth==1 && is_field_char(*cur, "separate")) {
                separator = field.size()-1;
            }
        }
        if (spans_paragraphs(field)) {
            res.insert(res.end(), field.begin(), field.end());
            continue;
        }
        string visible;
        if (separator>=0) {
            visible = field_visible_text(field, separator+1, field.size()-1);
        } else {
            visible = field_visible_text(field, 0, field.size());
        }
        AtomP collapsed = make_shared<Atom>(*field[0]);
        collapsed->tag = "w:t";
        collapsed->attrs.clear();
        collapsed->text = visible;
        collapsed->source = xml_node();
        collapsed->collapsedFieldAtoms = field;
        collapsed->rehash();
        res.push_back(collapsed);
    }
    return res;
}

xml_node run_properties(const Atom& atom)
{
    xml_node run = atom.run();
    return run?find_child(run, "w:rPr"):xml_node();
}

static bool same_run_properties(const xml_node& a, const xml_node& b)
{
    if (!a && !b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return canonical_xml(a)==canonical_xml(b);
}

static bool same_text_context(const Atom& a, const Atom& b)
{
    if (!a.isText() || !b.isText()) {
        return false;
    }
    if (a.collapsedField() || b.collapsedField()) {
        return false;
    }
    return a.outerParagraph()==b.outerParagraph() && a.revisionTag()==b.revisionTag();
}

static bool can_merge(const Atom& a, const Atom& b, bool mergeAcrossRuns)
{
    if (!same_text_context(a, b)) {
        return false;
    }
    if (a.run()==b.run()) {
        return true;
    }
    if (!mergeAcrossRuns) {
        return false;
    }
    return same_run_properties(run_properties(a), run_properties(b));
}

Atoms merge_contiguous_text_atoms(const Atoms& atoms, bool mergeAcrossRuns)
{
    Atoms res;
    for (const AtomP& atom: atoms) {
        if (!res.empty() && can_merge(*res.back(), *atom, mergeAcrossRuns)) {
            res.back()->text += atom->text;
            res.back()->rehash();
        } else {
            res.push_back(atom);
        }
    }
    return res;
}

Atoms split_atoms_into_words(const Atoms& atoms)
{
    Atoms res;
    for (const AtomP& atom: atoms) {
        if (!atom->isText() || atom->collapsedField() || atom->text.size()<=1 || atom->text.find(' ')==string::npos) {
            res.push_back(atom);
            continue;
        }
        Words parts = split_keep_whitespace(atom->text);
        if (parts.size()<=1) {
            res.push_back(atom);
            continue;
        }
        for (const string& part: parts) {
            AtomP word = make_shared<Atom>(*atom);
            word->text = part;
            word->splitFrom = atom;
            word->rehash();
            res.push_back(word);
        }
    }
    return res;
}

static bool can_merge_punctuation(const Atom& a, const Atom& b, bool acrossRuns)
{
    if (!b.splitFragment() || !same_text_context(a, b) || !is_punctuation_only(b.text)) {
        return false;
    }
    if (!ends_with_word_char(a.text)) {
        return false;
    }
    return acrossRuns || a.run()==b.run();
}

Atoms merge_punctuation_atoms(const Atoms& atoms, bool mergePunctuationAcrossRuns)
{
    Atoms res;
    for (const AtomP& atom: atoms) {
        if (!res.empty() && can_merge_punctuation(*res.back(), *atom, mergePunctuationAcrossRuns)) {
            res.back()->text += atom->text;
            res.back()->rehash();
        } else {
            res.push_back(atom);
        }
    }
    return res;
}

void assign_paragraph_indices(Atoms& atoms)
{
    map<xml_node, int> indices;
    for (AtomP& atom: atoms) {
        xml_node p = atom->outerParagraph();
        if (!p) {
            continue;
        }
        auto found = indices.find(p);
        if (found==indices.end()) {
            found = indices.insert(make_pair(p, static_cast<int>(indices.size()))).first;
        }
        atom->paragraphIndex = found->second;
    }
}

} // namespace redline
