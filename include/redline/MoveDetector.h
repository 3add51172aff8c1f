#ifndef REDLINE_MOVE_DETECTOR_H
#define REDLINE_MOVE_DETECTOR_H

#include <string>
#include <vector>
#include "redline/Atom.h"

namespace redline {

enum class MoveTieBreak {
    // First candidate in document order wins on equal similarity
    First,
    // Larger block wins on equal similarity
    Largest
};

struct MoveDetectionSettings {
    bool detectMoves = true;
    double similarityThreshold = 0.8;
    int minimumWordCount = 5;
    bool caseInsensitive = true;
    MoveTieBreak tieBreak = MoveTieBreak::First;
};

class AtomBlock
{
public:
    CorrelationStatus status;
    Atoms atoms;
    std::string text;
    int wordCount = 0;
};

typedef std::vector<AtomBlock> AtomBlocks;

int count_words(const std::string& text);
double jaccard_word_similarity(const std::string& text1, const std::string& text2, bool caseInsensitive = true);

// Maximal runs of Deleted or Inserted atoms within one paragraph
AtomBlocks group_into_blocks(const Atoms& atoms);

// Returns the number of moves found
int detect_moves(const Atoms& atoms, const MoveDetectionSettings& settings = MoveDetectionSettings());

} // namespace redline

#endif // REDLINE_MOVE_DETECTOR_H
