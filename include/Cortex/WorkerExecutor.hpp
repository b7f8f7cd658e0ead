// =================================================================
// include/Cortex/WorkerExecutor.hpp
// =================================================================
// Bounded-parallel execution of selected workers under a time budget.

#pragma once

#include "Cortex/Worker.hpp"
#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace Cortex {

/**
 * @brief Executor settings
 */
struct ExecutorConfig {
    size_t max_concurrency = 4;                        ///< Workers running at once
    std::chrono::milliseconds execution_budget{30000}; ///< Budget for the whole batch
    std::chrono::milliseconds poll_interval{5};        ///< Wait slice while workers run
};

/**
 * @brief Execution statistics
 */
struct ExecutionSummary {
    size_t requested = 0;
    size_t completed = 0;
    size_t unknown = 0;       ///< Ids with no registered worker
    size_t failed = 0;        ///< Workers that threw
    size_t timed_out = 0;     ///< Workers still running (or never started) at the deadline
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Runs workers by id
 *
 * Workers are started in selection order, at most max_concurrency at a
 * time. When the budget runs out the outputs collected so far are
 * returned; stragglers finish in the background and are discarded.
 */
class WorkerExecutor {
public:
    explicit WorkerExecutor(const ExecutorConfig& config = ExecutorConfig());

    /**
     * @brief Register or replace a worker under its own id
     */
    void registerWorker(std::shared_ptr<Worker> worker);

    bool hasWorker(const WorkerId& id) const;

    std::vector<WorkerId> getWorkerIds() const;

    /**
     * @brief Execute the given workers against a query
     * @param workers Ordered worker ids
     * @param query Query passed to every worker
     * @param summary Optional statistics output
     * @return Completed outputs in selection order, quality normalized to 0-1
     */
    std::vector<WorkerOutput> execute(const std::vector<WorkerId>& workers,
                                      const std::string& query,
                                      ExecutionSummary* summary = nullptr) const;

    const ExecutorConfig& getConfig() const { return m_config; }

private:
    ExecutorConfig m_config;
    std::unordered_map<WorkerId, std::shared_ptr<Worker>> m_workers;
    mutable std::mutex m_mutex;

    std::shared_ptr<Worker> findWorker(const WorkerId& id) const;
};

} // namespace Cortex
