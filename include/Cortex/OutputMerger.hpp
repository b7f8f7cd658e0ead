// =================================================================
// include/Cortex/OutputMerger.hpp
// =================================================================
// Aggregates worker outputs into one attributed response.

#pragma once

#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <vector>
#include <utility>

namespace Cortex {

/**
 * @brief Merger tuning
 */
struct MergerConfig {
    double similarity_threshold = 0.6;       ///< Jaccard above which two texts are redundant
    size_t max_merged_outputs = 3;           ///< Outputs considered by mergeOutputs
    std::string insight_prefix = "Additional insight: ";
    std::string perspective_prefix = "Additional perspective: ";
    double consistency_threshold = 0.85;     ///< Average similarity required for consistency
    double inconsistency_threshold = 0.5;    ///< Pairs below this are reported
};

/**
 * @brief Pairwise agreement among a set of outputs
 */
struct ConsistencyReport {
    bool is_consistent = true;
    double average_similarity = 1.0;
    std::vector<std::pair<WorkerId, WorkerId>> inconsistent_pairs;
};

/**
 * @brief Quality statistics over a set of outputs
 */
struct MergerStatistics {
    size_t count = 0;
    double mean_quality = 0.0;
    double max_quality = 0.0;
    double min_quality = 0.0;
};

/**
 * @brief Output aggregator
 *
 * Stateless apart from its configuration; safe to share between threads.
 * No operation throws for any input shape; an empty collection yields the
 * empty merge.
 */
class OutputMerger {
public:
    explicit OutputMerger(const MergerConfig& config = MergerConfig());

    /**
     * @brief Word-set Jaccard similarity above the configured threshold
     */
    bool isSimilar(const std::string& a, const std::string& b) const;

    /**
     * @brief Lexical contradiction check
     *
     * Directional: @p a must carry the affirmative marker and @p b the
     * negative one (yes/no, always/never, must/must not). Case-insensitive
     * substring matching, so "know" contains "no".
     */
    static bool isConflicting(const WorkerOutput& a, const WorkerOutput& b);

    /**
     * @brief Quality-first merge of the top outputs
     *
     * The best output leads; up to two more are appended when they are not
     * redundant with it. Quality is the summed quality of the contributing
     * outputs divided by the number considered, so a redundant output
     * lowers the score.
     */
    MergedResponse mergeOutputs(const std::vector<WorkerOutput>& outputs) const;

    /**
     * @brief Flag conflicts, record advisory resolutions, then merge
     *
     * Resolutions are logged only; the merge sees the unmodified set.
     */
    MergedResponse mergeWithConflictResolution(const std::vector<WorkerOutput>& outputs) const;

    /**
     * @brief Concatenate every output not redundant with the first one
     *
     * Input order is kept; there is no quality weighting or truncation.
     */
    std::string combineInsights(const std::vector<WorkerOutput>& outputs) const;

    /**
     * @brief Conflict-aware merge stamped with caller identity and time
     */
    UnifiedResponse createUnifiedResponse(const std::vector<WorkerOutput>& outputs,
                                          const std::string& user_id) const;

    /**
     * @brief All pairs (i < j) with isConflicting(outputs[i], outputs[j])
     *
     * Input order matters: a later affirmative output is not flagged.
     */
    std::vector<Conflict> identifyConflicts(const std::vector<WorkerOutput>& outputs) const;

    /**
     * @brief Advisory resolution of one conflict
     *
     * The higher-quality member is preferred; on a tie the second member is.
     */
    static ConflictResolution resolveConflict(const Conflict& conflict);

    std::vector<ConflictResolution> resolveConflicts(const std::vector<Conflict>& conflicts) const;

    ConsistencyReport checkConsistency(const std::vector<WorkerOutput>& outputs) const;

    static MergerStatistics computeStatistics(const std::vector<WorkerOutput>& outputs);

    void logMergerStatistics(const std::vector<WorkerOutput>& outputs) const;

    const MergerConfig& getConfig() const { return m_config; }

private:
    MergerConfig m_config;

    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
};

} // namespace Cortex
