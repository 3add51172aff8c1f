#ifndef REDLINE_CORRELATOR_H
#define REDLINE_CORRELATOR_H

#include <string>
#include <vector>
#include "redline/Atom.h"

namespace redline {

struct LcsMatch {
    size_t originalIndex;
    size_t revisedIndex;
};

class LcsResult
{
public:
    // Ascending in both indices
    std::vector<LcsMatch> matches;
    std::vector<size_t> deletedIndices;
    std::vector<size_t> insertedIndices;
};

#define MAX_ATOMS_BEFORE_SPLIT 50
#define PARAGRAPH_SIMILARITY_THRESHOLD 0.25

// Atoms of one paragraph, or of a stretch of a long paragraph ending at a break
class AtomGroup
{
public:
    size_t first = 0;
    size_t count = 0;
    // Lowercase with whitespace collapsed
    std::string text;
    // Same key for groups with the same text; groups without text use their atom fingerprints
    Fingerprint key;
};
typedef std::vector<AtomGroup> AtomGroups;

bool atoms_equal(const Atom& a, const Atom& b);

// Hunt-Szymanski over the part left after trimming the common prefix and suffix
LcsResult compute_atom_lcs(const Atoms& original, const Atoms& revised);
// Quadratic dynamic programming; same length as compute_atom_lcs, used as a reference
LcsResult compute_atom_lcs_dp(const Atoms& original, const Atoms& revised);

AtomGroups group_atoms(const Atoms& atoms);
// Jaccard similarity of the word sets
double group_similarity(const AtomGroup& a, const AtomGroup& b);

// Matches groups first, exactly and then by similarity between exact matches,
// and compares atoms only inside matched groups. Atoms of unmatched groups are all deleted or inserted.
LcsResult compute_hierarchical_lcs(const Atoms& original, const Atoms& revised,
    double threshold = PARAGRAPH_SIMILARITY_THRESHOLD);

void mark_correlation(Atoms& original, Atoms& revised, const LcsResult& lcs);

// Revised order with each run of original-only atoms placed before the revised atom that follows it
Atoms create_merged_atom_list(const Atoms& original, const Atoms& revised, const LcsResult& lcs);

// For atoms of the merged list: true when the atom comes from the original document
bool is_original_side(const Atom& atom);

void assign_unified_paragraph_indices(const Atoms& original, const Atoms& revised, Atoms& merged, const LcsResult& lcs);

} // namespace redline

#endif // REDLINE_CORRELATOR_H
