#ifndef REDLINE_COMPARE_H
#define REDLINE_COMPARE_H

#include <string>
#include <vector>
#include <memory>
#include "pugixml.hpp"
#include "redline/Atom.h"
#include "redline/CompareOptions.h"
#include "redline/SafetyCheck.h"

namespace redline {

#define FALLBACK_SAFETY_CHECK_FAILED "round_trip_safety_check_failed"

struct CompareStats {
    int insertions = 0;
    int deletions = 0;
    int moves = 0;
    int formatChanges = 0;
    int modifications = 0;
};

// One in-place pass whose output failed the round-trip checks
class ReconstructionAttempt
{
public:
    std::string pass;
    SafetyCheckResult checks;
};

class CompareResult
{
public:
    std::string comparisonId;
    // Serialized output document
    std::string documentXml;
    std::shared_ptr<pugi::xml_document> document;
    CompareStats stats;
    Engine engine = Engine::Atomizer;
    ReconstructionMode reconstructionModeRequested = ReconstructionMode::Rebuild;
    ReconstructionMode reconstructionModeUsed = ReconstructionMode::Rebuild;
    // Set only when in-place output was replaced by a rebuild
    std::string fallbackReason;
    std::vector<ReconstructionAttempt> attempts;
};

// Insertions and deletions count atoms, moves count pairs of moved atoms, modifications
// count paragraphs with both deletions and insertions plus format changes
CompareStats compute_stats(const Atoms& merged);

// The inputs are not modified. Throws Input errors for documents without a body and
// Comparison/UnsupportedCombination for the paragraph engine with in-place reconstruction.
CompareResult compareDocuments(const pugi::xml_node& original, const pugi::xml_node& revised,
    const CompareOptions& options = CompareOptions());
CompareResult compareDocuments(const std::string& originalXml, const std::string& revisedXml,
    const CompareOptions& options = CompareOptions());

} // namespace redline

#endif // REDLINE_COMPARE_H
