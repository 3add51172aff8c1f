#ifndef REDLINE_INPLACE_MODIFIER_H
#define REDLINE_INPLACE_MODIFIER_H

#include "pugixml.hpp"
#include "redline/Atom.h"
#include "redline/Reconstructor.h"

namespace redline {

// Runs holding atoms with different marks, or with original content falling between their atoms,
// are replaced by one run per piece and the atoms' ancestor chains are pointed at the new runs.
// Returns the number of runs split.
int split_mixed_runs(const Atoms& merged);

// Merges adjacent sibling w:ins or w:del elements with the same author and date
void merge_adjacent_revisions(pugi::xml_node root);

// Adds the revision markup to the revised tree the revised atoms were taken from.
// Deleted and moved-from content is copied from the original atoms.
void modify_revised_document(pugi::xml_node revisedRoot, const Atoms& merged, const pugi::xml_node& originalRoot,
    const Attribution& by);

} // namespace redline

#endif // REDLINE_INPLACE_MODIFIER_H
