#ifndef REDLINE_PARAGRAPH_ENGINE_H
#define REDLINE_PARAGRAPH_ENGINE_H

#include <string>
#include <map>
#include "pugixml.hpp"
#include "redline/xml-utils.h"
#include "redline/Reconstructor.h"

namespace redline {

struct ParagraphDiffStats {
    int equal = 0;
    int insertions = 0;
    int deletions = 0;
    // Deleted blocks directly replaced by inserted ones
    int modifications = 0;
};

// Element children of the body except the trailing w:sectPr
xml_nodes body_blocks(const pugi::xml_node& body);

// One character per block; equal blocks get equal characters
std::wstring encode_blocks(const xml_nodes& blocks, std::map<std::string, wchar_t>& codes);

// Wraps every run of the block and marks every paragraph mark as inserted or deleted
void mark_block(pugi::xml_node block, bool inserted, RevisionIdState& ids, const Attribution& by);

// Compares the bodies block by block and writes the tracked result to out
ParagraphDiffStats compare_paragraphs(const pugi::xml_node& originalRoot, const pugi::xml_node& revisedRoot,
    const Attribution& by, pugi::xml_document& out);

} // namespace redline

#endif // REDLINE_PARAGRAPH_ENGINE_H
