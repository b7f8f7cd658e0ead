// =================================================================
// include/Cortex/BrainOrchestrator.hpp
// =================================================================
// End-to-end pipeline: select workers, execute them, merge the outputs.

#pragma once

#include "Cortex/BrainSelector.hpp"
#include "Cortex/WorkerExecutor.hpp"
#include "Cortex/OutputMerger.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <mutex>

namespace Cortex {

/**
 * @brief Pipeline request structure
 */
struct OrchestrationRequest {
    std::string query;                            ///< User query
    std::string user_id;                          ///< Caller identity, stamped on the response
    SelectionMode mode = SelectionMode::CORE_PLUS_SPECIALISTS;
    int complexity_level = 5;                     ///< Ranked mode only
    int top_n = 5;                                ///< Ranked mode only
};

/**
 * @brief Pipeline response structure
 */
struct OrchestrationResult {
    bool success = false;                         ///< Whether the pipeline ran to completion
    std::string error_message;                    ///< Error message if failed
    SelectionResult selection;                    ///< Selected workers and reason
    std::vector<WorkerOutput> outputs;            ///< Outputs that completed
    ExecutionSummary execution;                   ///< Executor statistics
    std::vector<ConflictResolution> conflicts;    ///< Advisory conflict report
    ConsistencyReport consistency;                ///< Pairwise agreement of the outputs
    UnifiedResponse response;                     ///< Final merged response
    std::chrono::milliseconds total_time{0};
    std::vector<std::string> pipeline_steps;      ///< Steps taken in pipeline
};

/**
 * @brief Request statistics
 */
struct OrchestratorStatistics {
    size_t total_requests = 0;
    size_t successful_requests = 0;
    size_t failed_requests = 0;
    size_t fallback_selections = 0;               ///< Requests served by the core set alone
    size_t empty_responses = 0;                   ///< Requests where no worker completed
    double average_response_time = 0.0;           ///< Average total time in ms
};

/**
 * @brief Coordinates selection, execution and aggregation
 *
 * Components are borrowed and must outlive the orchestrator.
 */
class BrainOrchestrator {
public:
    BrainOrchestrator(const BrainSelector& selector, const WorkerExecutor& executor,
                      const OutputMerger& merger);

    /**
     * @brief Process one query through the whole pipeline
     *
     * Selection and aggregation never fail for valid input; an execution
     * that completes no worker still produces an empty unified response.
     */
    OrchestrationResult process(const OrchestrationRequest& request);

    OrchestratorStatistics getStatistics() const;

    void resetStatistics();

private:
    const BrainSelector& m_selector;
    const WorkerExecutor& m_executor;
    const OutputMerger& m_merger;

    OrchestratorStatistics m_statistics;
    mutable std::mutex m_statistics_mutex;

    void updateStatistics(const OrchestrationResult& result);
};

} // namespace Cortex
