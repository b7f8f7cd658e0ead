// =================================================================
// include/Cortex/WorkerTypes.hpp
// =================================================================
// Core data model shared by selection, execution and aggregation.

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace Cortex {

/**
 * @brief Opaque worker identifier, unique within the registry
 */
using WorkerId = std::string;

/**
 * @brief Output produced by a single worker
 *
 * Quality is always on the 0-1 scale inside the library. Raw scores are
 * converted with normalizeQuality() at the execution boundary.
 */
struct WorkerOutput {
    WorkerId source;            ///< Worker that produced the output
    std::string content;        ///< Free-text answer
    double quality = 0.0;       ///< Quality score (0-1)

    WorkerOutput() = default;
    WorkerOutput(WorkerId src, std::string text, double q)
        : source(std::move(src)), content(std::move(text)), quality(q) {}
};

/**
 * @brief Result of merging several worker outputs
 */
struct MergedResponse {
    std::string content;                ///< Merged answer text
    double quality = 0.0;               ///< Mean quality over considered outputs
    std::vector<WorkerId> sources;      ///< Contributing workers, in merge order
};

bool operator==(const MergedResponse& lhs, const MergedResponse& rhs);
bool operator!=(const MergedResponse& lhs, const MergedResponse& rhs);

/**
 * @brief Final attributed response returned to the caller
 */
struct UnifiedResponse {
    std::string user_id;
    std::string content;
    double quality = 0.0;
    std::vector<WorkerId> sources;
    int64_t created_at_epoch_millis = 0;
};

/**
 * @brief Pair of outputs flagged as contradictory
 */
struct Conflict {
    WorkerOutput first;
    WorkerOutput second;
};

/**
 * @brief Advisory resolution of a conflict
 *
 * Resolutions never alter the merge; they record which side would win.
 */
struct ConflictResolution {
    WorkerId preferred_source;
    WorkerId other_source;
    double preferred_quality = 0.0;
    double other_quality = 0.0;
};

/**
 * @brief Per-worker score components used by ranked selection
 */
struct ScoreBreakdown {
    WorkerId worker;
    double relevance = 0.0;
    double complexity_match = 0.0;
    double user_history = 0.0;
    double performance = 0.0;

    double total() const {
        return relevance + complexity_match + user_history + performance;
    }
};

/**
 * @brief Scale a raw quality score is reported on
 */
enum class QualityScale {
    AUTO,       ///< Guess: values above 1 are percentages
    UNIT,       ///< Already 0-1
    PERCENT     ///< 0-100
};

/**
 * @brief Convert a raw worker quality onto the 0-1 scale
 *
 * With QualityScale::AUTO, values above 1 are read as percentages, so a
 * percentage score of exactly 1 (or less) is taken as a unit score. Workers
 * reporting percentages should declare QualityScale::PERCENT. The result is
 * clamped to [0,1]; NaN maps to 0.
 */
double normalizeQuality(double raw_quality, QualityScale scale = QualityScale::AUTO);

} // namespace Cortex
