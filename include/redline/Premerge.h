#ifndef REDLINE_PREMERGE_H
#define REDLINE_PREMERGE_H

#include "pugixml.hpp"

namespace redline {

// Run holding only w:rPr, w:t, w:tab, w:br, w:cr and w:delText, none of them with children besides w:rPr
bool is_mergeable_run(const pugi::xml_node& run);
bool can_merge_runs(const pugi::xml_node& a, const pugi::xml_node& b);

// Merges adjacent sibling runs with equal attributes and formatting throughout root.
// Returns the number of merges.
int premerge_adjacent_runs(pugi::xml_node root);

} // namespace redline

#endif // REDLINE_PREMERGE_H
