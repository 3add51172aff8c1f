#include "redline/MoveDetector.h"
#include <set>

using namespace std;

namespace redline {

int count_words(const string& text)
{
    return static_cast<int>(split_words(text).size());
}

double jaccard_word_similarity(const string& text1, const string& text2, bool caseInsensitive)
{
    Words w1 = split_words(caseInsensitive?to_lowercase(text1):text1);
    Words w2 = split_words(caseInsensitive?to_lowercase(text2):text2);
    set<string> words1(w1.begin(), w1.end());
    set<string> words2(w2.begin(), w2.end());
    if (words1.empty() && words2.empty()) {
        return 1.0;
    }
    if (words1.empty() || words2.empty()) {
        return 0.0;
    }
    size_t common = 0;
    for (const string& w: words1) {
        if (words2.count(w)) {
            common++;
        }
    }
    size_t all = words1.size()+words2.size()-common;
    return static_cast<double>(common)/all;
}

AtomBlocks group_into_blocks(const Atoms& atoms)
{
    AtomBlocks blocks;
    bool open = false;
    for (const AtomP& atom: atoms) {
        CorrelationStatus s = atom->status();
        if (s!=CorrelationStatus::Deleted && s!=CorrelationStatus::Inserted) {
            open = false;
            continue;
        }
        if (!open || blocks.back().status!=s) {
            blocks.push_back(AtomBlock());
            blocks.back().status = s;
            open = true;
        } else if (blocks.back().atoms.back()->paragraphIndex!=atom->paragraphIndex) {
            // Words of two paragraphs stay apart
            blocks.back().text += ' ';
        }
        blocks.back().atoms.push_back(atom);
        blocks.back().text += atom->visibleText();
    }
    for (AtomBlock& b: blocks) {
        b.wordCount = count_words(b.text);
    }
    return blocks;
}

static void mark_move(const AtomBlock& block, CorrelationStatus status, int id)
{
    for (const AtomP& atom: block.atoms) {
        atom->setStatus(Phase::DetectMoves, status);
        atom->moveGroupId = id;
        atom->moveName = "move"+to_string(id);
    }
}

static const AtomBlock* find_best_match(const AtomBlock& deleted, const vector<const AtomBlock*>& inserted,
    const MoveDetectionSettings& settings)
{
    const AtomBlock* best = NULL;
    double bestScore = 0;
    for (const AtomBlock* candidate: inserted) {
        if (candidate->atoms.front()->status()==CorrelationStatus::MovedDestination) {
            continue;
        }
        double score = jaccard_word_similarity(deleted.text, candidate->text, settings.caseInsensitive);
        if (score<settings.similarityThreshold) {
            continue;
        }
        bool better = !best || score>bestScore;
        if (best && score==bestScore && settings.tieBreak==MoveTieBreak::Largest) {
            better = candidate->wordCount>best->wordCount;
        }
        if (better) {
            best = candidate;
            bestScore = score;
        }
    }
    return best;
}

int detect_moves(const Atoms& atoms, const MoveDetectionSettings& settings)
{
    if (!settings.detectMoves) {
        return 0;
    }
    AtomBlocks blocks = group_into_blocks(atoms);
    vector<const AtomBlock*> deleted, inserted;
    for (const AtomBlock& b: blocks) {
        if (b.wordCount<settings.minimumWordCount) {
            continue;
        }
        if (b.status==CorrelationStatus::Deleted) {
            deleted.push_back(&b);
        } else {
            inserted.push_back(&b);
        }
    }
    int id = 1;
    for (const AtomBlock* d: deleted) {
        const AtomBlock* match = find_best_match(*d, inserted, settings);
        if (match) {
            mark_move(*d, CorrelationStatus::MovedSource, id);
            mark_move(*match, CorrelationStatus::MovedDestination, id);
            id++;
        }
    }
    return id-1;
}

} // namespace redline
