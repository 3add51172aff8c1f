#ifndef REDLINE_ATOMIZER_H
#define REDLINE_ATOMIZER_H

#include <string>
#include <memory>
#include "pugixml.hpp"
#include "redline/Atom.h"

namespace redline {

struct AtomizeOptions {
    // Atoms reference private copies of their leaves instead of the live tree
    bool cloneLeafNodes = false;
    bool mergeAcrossRuns = true;
    bool mergePunctuationAcrossRuns = true;
    bool splitTextIntoWords = true;
};

class AtomizeResult
{
public:
    Atoms atoms;
    int emptyParagraphCount = 0;
    // Owner of cloned leaves when cloneLeafNodes is set
    std::shared_ptr<pugi::xml_document> clones;
};

bool is_leaf_node(const pugi::xml_node& node);
AtomizeResult atomize(const pugi::xml_node& root, const std::string& part, const AtomizeOptions& options = AtomizeOptions());

// Individual passes, in the order atomize runs them
Atoms collapse_field_sequences(const Atoms& atoms);
Atoms merge_contiguous_text_atoms(const Atoms& atoms, bool mergeAcrossRuns);
Atoms split_atoms_into_words(const Atoms& atoms);
Atoms merge_punctuation_atoms(const Atoms& atoms, bool mergePunctuationAcrossRuns);
void assign_paragraph_indices(Atoms& atoms);

// Run properties of the atom's nearest run, empty if none
pugi::xml_node run_properties(const Atom& atom);

} // namespace redline

#endif // REDLINE_ATOMIZER_H
