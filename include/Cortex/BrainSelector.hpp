// =================================================================
// include/Cortex/BrainSelector.hpp
// =================================================================
// Decides which workers run for a query and in what order.

#pragma once

#include "Cortex/WorkerRegistry.hpp"
#include "Cortex/EmbeddingIndex.hpp"
#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <memory>
#include <vector>
#include <optional>
#include <chrono>

namespace Cortex {

/**
 * @brief Selection modes
 */
enum class SelectionMode {
    CORE_PLUS_SPECIALISTS,  ///< Core set plus semantically matched specialists
    RANKED                  ///< Multi-factor ranked top-N plus the core set
};

std::string selectionModeToString(SelectionMode mode);

/**
 * @brief Parameters of one selection call
 */
struct SelectionRequest {
    std::string query;
    SelectionMode mode = SelectionMode::CORE_PLUS_SPECIALISTS;
    int complexity_level = 5;       ///< Query complexity (0-10), ranked mode only
    std::string user_id;            ///< Caller identity, ranked mode only
    int top_n = 5;                  ///< Ranked slots before core forcing
};

/**
 * @brief Result of one selection call
 */
struct SelectionResult {
    std::vector<WorkerId> workers;                ///< Ordered workers to execute
    bool used_fallback = false;                   ///< True when only the core set was returned
    std::string selection_reason;                 ///< Human-readable reason
    std::vector<ScoreBreakdown> scores;           ///< Ranked mode: scores in rank order
    std::chrono::milliseconds selection_time{0};
};

/**
 * @brief Worker selector
 *
 * Holds no per-call state: the registry and index are shared read-only, so
 * a single selector may serve concurrent queries. Neither selection
 * operation throws; index failures and timeouts degrade to the core set.
 */
class BrainSelector {
public:
    /**
     * @param registry Worker reference data, must outlive the selector
     * @param index Semantic index; may be null, which behaves like an
     *              unavailable index
     */
    BrainSelector(const WorkerRegistry& registry, std::shared_ptr<EmbeddingIndex> index);

    /**
     * @brief Core workers plus the top specialists for the query
     * @return Core set and specialists sorted by execution order; the core
     *         set alone if the index cannot be reached
     */
    std::vector<WorkerId> selectBrains(const std::string& query) const;

    /**
     * @brief Top-N workers by composite score, plus any missing core worker
     * @param query Natural-language query
     * @param complexity_level Query complexity (0-10)
     * @param user_id Caller identity
     * @param top_n Ranked slots; values <= 0 leave only the core set
     * @return Workers sorted by execution order; the core set alone on failure
     */
    std::vector<WorkerId> selectTopBrains(const std::string& query, int complexity_level,
                                          const std::string& user_id, int top_n) const;

    /**
     * @brief Run either mode and report details
     */
    SelectionResult select(const SelectionRequest& request) const;

    /**
     * @brief Score every catalogued worker and sort by descending total
     * @throws std::exception if the catalog cannot be retrieved
     */
    std::vector<ScoreBreakdown> rankWorkers(const std::string& query, int complexity_level,
                                            const std::string& user_id) const;

    /**
     * @brief Score a single worker
     * @param worker Worker being scored
     * @param top_match The index's single best match, empty if the lookup
     *                  failed or found nothing
     */
    ScoreBreakdown scoreWorker(const WorkerId& worker, const std::optional<WorkerId>& top_match,
                               int complexity_level, const std::string& user_id) const;

    /**
     * @brief Stable sort by execution order; equal ranks keep their order
     */
    void sortByExecutionOrder(std::vector<WorkerId>& workers) const;

private:
    const WorkerRegistry& m_registry;
    std::shared_ptr<EmbeddingIndex> m_index;

    SelectionResult selectCorePlusSpecialists(const std::string& query) const;
    SelectionResult selectRanked(const SelectionRequest& request) const;
    SelectionResult coreFallback(const std::string& reason) const;

    std::vector<IndexMatch> searchIndex(const std::string& query, size_t top_k) const;
    std::vector<IndexMatch> catalogIndex(size_t top_k) const;
    std::vector<WorkerId> enumerateWorkers() const;
    std::optional<WorkerId> lookupTopMatch(const std::string& query) const;
    void logOutcome(SelectionMode mode, const SelectionResult& result) const;
};

} // namespace Cortex
