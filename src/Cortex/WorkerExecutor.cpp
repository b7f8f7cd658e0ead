// =================================================================
// src/Cortex/WorkerExecutor.cpp
// =================================================================
// Implementation of bounded-parallel worker execution.

#include "Cortex/WorkerExecutor.hpp"
#include "Cortex/TimedCall.hpp"
#include "Cortex/Logger.hpp"
#include <algorithm>
#include <future>
#include <optional>

namespace Cortex {

WorkerExecutor::WorkerExecutor(const ExecutorConfig& config) : m_config(config) {
    if (m_config.max_concurrency == 0) {
        CORTEX_LOG_WARNING("WorkerExecutor", "max_concurrency must be at least 1; using 1");
        m_config.max_concurrency = 1;
    }
}

void WorkerExecutor::registerWorker(std::shared_ptr<Worker> worker) {
    if (!worker) {
        CORTEX_LOG_WARNING("WorkerExecutor", "Ignoring null worker");
        return;
    }

    auto id = worker->getId();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workers[id] = std::move(worker);
    CORTEX_LOG_DEBUG("WorkerExecutor", "Registered worker: " + id);
}

bool WorkerExecutor::hasWorker(const WorkerId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.count(id) > 0;
}

std::vector<WorkerId> WorkerExecutor::getWorkerIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<WorkerId> ids;
    ids.reserve(m_workers.size());
    for (const auto& [id, worker] : m_workers) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<WorkerOutput> WorkerExecutor::execute(const std::vector<WorkerId>& workers,
                                                  const std::string& query,
                                                  ExecutionSummary* summary) const {
    auto start_time = std::chrono::steady_clock::now();
    auto deadline = start_time + m_config.execution_budget;

    struct Running {
        size_t slot;
        WorkerId id;
        std::future<WorkerResult> future;
    };

    ExecutionSummary stats;
    stats.requested = workers.size();

    std::vector<std::optional<WorkerOutput>> slots(workers.size());
    std::vector<Running> running;
    size_t next = 0;

    while (true) {
        while (next < workers.size() && running.size() < m_config.max_concurrency) {
            const WorkerId& id = workers[next];
            auto worker = findWorker(id);
            if (!worker) {
                CORTEX_LOG_WARNING("WorkerExecutor", "Skipping unknown worker: " + id);
                stats.unknown++;
                next++;
                continue;
            }

            running.push_back(Running{next, id,
                launchDetached([worker, query]() { return worker->run(query); })});
            next++;
        }

        if (running.empty()) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        running.front().future.wait_for(std::max(std::chrono::milliseconds(0),
                                                 std::min(m_config.poll_interval, remaining)));

        for (auto it = running.begin(); it != running.end();) {
            if (it->future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }

            try {
                WorkerResult result = it->future.get();
                slots[it->slot] = WorkerOutput(it->id, result.content,
                                                normalizeQuality(result.quality, result.scale));
                stats.completed++;
            } catch (const std::exception& e) {
                CORTEX_LOG_WARNING("WorkerExecutor", "Worker " + it->id + " failed: " + e.what());
                stats.failed++;
            } catch (...) {
                CORTEX_LOG_WARNING("WorkerExecutor", "Worker " + it->id + " failed: unknown exception");
                stats.failed++;
            }
            it = running.erase(it);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    stats.timed_out = running.size() + (workers.size() - next);
    for (const auto& pending : running) {
        CORTEX_LOG_WARNING("WorkerExecutor", "Worker " + pending.id + " exceeded the execution budget");
    }
    if (next < workers.size()) {
        CORTEX_LOG_WARNING("WorkerExecutor", std::to_string(workers.size() - next) +
                           " worker(s) not started before the execution budget ran out");
    }

    std::vector<WorkerOutput> outputs;
    outputs.reserve(stats.completed);
    for (auto& slot : slots) {
        if (slot) {
            outputs.push_back(std::move(*slot));
        }
    }

    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().info("WorkerExecutor",
        "Executed " + std::to_string(stats.requested) + " worker(s): " +
        std::to_string(stats.completed) + " completed, " +
        std::to_string(stats.failed) + " failed, " +
        std::to_string(stats.unknown) + " unknown, " +
        std::to_string(stats.timed_out) + " timed out (" +
        std::to_string(stats.elapsed.count()) + "ms)");

    if (summary) {
        *summary = stats;
    }
    return outputs;
}

std::shared_ptr<Worker> WorkerExecutor::findWorker(const WorkerId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workers.find(id);
    return it != m_workers.end() ? it->second : nullptr;
}

} // namespace Cortex
