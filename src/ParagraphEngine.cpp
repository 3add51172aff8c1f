#include "redline/ParagraphEngine.h"
#include <algorithm>
#include <set>
#include "diff-match-patch/diff_match_patch.h"

using namespace std;
using namespace pugi;

namespace redline {

typedef diff_match_patch<wstring> DMPW;

xml_nodes body_blocks(const xml_node& body)
{
    xml_nodes res = child_elements(body);
    if (!res.empty() && is_element(res.back(), "w:sectPr")) {
        res.pop_back();
    }
    return res;
}

wstring encode_blocks(const xml_nodes& blocks, map<string, wchar_t>& codes)
{
    wstring res;
    for (const xml_node& block: blocks) {
        string key = canonical_xml(block);
        auto found = codes.find(key);
        if (found==codes.end()) {
            found = codes.insert(make_pair(key, static_cast<wchar_t>(codes.size()+1))).first;
        }
        res += found->second;
    }
    return res;
}

void mark_block(xml_node block, bool inserted, RevisionIdState& ids, const Attribution& by)
{
    static const set<string> wrappers = {"w:ins", "w:del", "w:moveFrom", "w:moveTo"};
    xml_nodes runs = find_all(block, "w:r");
    for (xml_node run: runs) {
        if (has_ancestor(run, wrappers, block)) {
            continue;
        }
        if (!inserted) {
            convert_to_deleted(run);
        }
        wrap_revision(run, inserted?"w:ins":"w:del", ids, by);
    }
    xml_nodes paragraphs = find_all(block, "w:p");
    if (is_element(block, "w:p")) {
        paragraphs.insert(paragraphs.begin(), block);
    }
    for (xml_node p: paragraphs) {
        mark_paragraph(p, inserted?"w:ins":"w:del", ids, by);
    }
}

ParagraphDiffStats compare_paragraphs(const xml_node& originalRoot, const xml_node& revisedRoot, const Attribution& by, xml_document& out)
{
    xml_nodes originalBlocks = body_blocks(find_body(originalRoot));
    xml_nodes revisedBlocks = body_blocks(find_body(revisedRoot));
    map<string, wchar_t> codes;
    wstring originalCodes = encode_blocks(originalBlocks, codes);
    wstring revisedCodes = encode_blocks(revisedBlocks, codes);

    xml_node sectPr;
    xml_node body = copy_document_shell(revisedRoot, out, sectPr);

    DMPW dmp;
    auto diffs = dmp.diff_main(originalCodes, revisedCodes, false);
    ParagraphDiffStats stats;
    RevisionIdState ids;
    size_t from = 0;
    size_t to = 0;
    int pendingDeletions = 0;
    for (auto& diff: diffs) {
        size_t size = diff.text.size();
        switch (diff.operation) {
            case DMPW::Operation::DELETE:
                for (size_t i=0;i<size;i++) {
                    xml_node block = sectPr?body.insert_copy_before(originalBlocks[from+i], sectPr):body.append_copy(originalBlocks[from+i]);
                    mark_block(block, false, ids, by);
                }
                from += size;
                stats.deletions += size;
                pendingDeletions += size;
                break;
            case DMPW::Operation::INSERT:
                for (size_t i=0;i<size;i++) {
                    xml_node block = sectPr?body.insert_copy_before(revisedBlocks[to+i], sectPr):body.append_copy(revisedBlocks[to+i]);
                    mark_block(block, true, ids, by);
                }
                to += size;
                stats.insertions += size;
                stats.modifications += min(pendingDeletions, static_cast<int>(size));
                pendingDeletions = 0;
                break;
            case DMPW::Operation::EQUAL:
                for (size_t i=0;i<size;i++) {
                    if (sectPr) {
                        body.insert_copy_before(revisedBlocks[to+i], sectPr);
                    } else {
                        body.append_copy(revisedBlocks[to+i]);
                    }
                }
                from += size;
                to += size;
                stats.equal += size;
                pendingDeletions = 0;
                break;
        };
    }
    return stats;
}

} // namespace redline
