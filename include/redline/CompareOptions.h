#ifndef REDLINE_COMPARE_OPTIONS_H
#define REDLINE_COMPARE_OPTIONS_H

#include <string>
#include <ctime>
#include "redline/MoveDetector.h"

namespace redline {

#define COMPARE_CONF_MAJOR_VERSION 1
// 9999-12-31T23:59:59Z
#define MAX_REVISION_DATE 253402300799.0

enum class ReconstructionMode {
    Rebuild,
    InPlace
};

enum class Engine {
    Atomizer,
    Paragraph
};

const std::string& modeName(ReconstructionMode mode);
const std::string& engineName(Engine engine);
// Both throw Config/BadConfig on unknown names
ReconstructionMode str_to_mode(const std::string& s);
Engine str_to_engine(const std::string& s);
MoveTieBreak str_to_tie_break(const std::string& s);

class CompareOptions
{
public:
    std::string author = "Comparison";
    // 0 means the time of the comparison
    time_t date = 0;
    bool ignoreFormatting = false;
    bool premergeRuns = false;
    ReconstructionMode reconstructionMode = ReconstructionMode::Rebuild;
    Engine engine = Engine::Atomizer;
    MoveDetectionSettings moves;
    bool detectFormatChanges = true;
    bool verbose = false;

    bool formatDetectionEnabled() const {
        return detectFormatChanges && !ignoreFormatting;
    }
};

// Reads a JSON configuration file; members that are absent keep their defaults
CompareOptions loadCompareOptions(const std::string& filename);
CompareOptions parseCompareOptions(const std::string& json);

} // namespace redline

#endif // REDLINE_COMPARE_OPTIONS_H
