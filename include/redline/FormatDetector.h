#ifndef REDLINE_FORMAT_DETECTOR_H
#define REDLINE_FORMAT_DETECTOR_H

#include <string>
#include "pugixml.hpp"
#include "redline/Atom.h"

namespace redline {

// Friendly name of a run property element, or the element name itself
std::string property_name(const std::string& tag);

// Sorted children without w:rPrChange, rendered as <tag k="v"...|text/>
std::string normalize_run_properties(const pugi::xml_node& rPr);
bool run_properties_equal(const pugi::xml_node& rPr1, const pugi::xml_node& rPr2);

Words changed_property_names(const pugi::xml_node& oldRPr, const pugi::xml_node& newRPr);
FormatChangeDetails categorize_property_changes(const pugi::xml_node& oldRPr, const pugi::xml_node& newRPr);

// Reclassifies cross-linked Equal atoms whose run formatting differs. Returns the number reclassified.
int detect_format_changes(const Atoms& revised);

} // namespace redline

#endif // REDLINE_FORMAT_DETECTOR_H
