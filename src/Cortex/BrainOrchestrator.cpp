// =================================================================
// src/Cortex/BrainOrchestrator.cpp
// =================================================================
// Implementation of the selection, execution and merge pipeline.

#include "Cortex/BrainOrchestrator.hpp"
#include "Cortex/Logger.hpp"

namespace Cortex {

BrainOrchestrator::BrainOrchestrator(const BrainSelector& selector, const WorkerExecutor& executor,
                                     const OutputMerger& merger)
    : m_selector(selector), m_executor(executor), m_merger(merger) {
}

OrchestrationResult BrainOrchestrator::process(const OrchestrationRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    OrchestrationResult result;

    Logger::getInstance().info("BrainOrchestrator",
        "Processing query for user '" + request.user_id + "' (" +
        selectionModeToString(request.mode) + ")");

    try {
        SelectionRequest selection_request;
        selection_request.query = request.query;
        selection_request.mode = request.mode;
        selection_request.complexity_level = request.complexity_level;
        selection_request.user_id = request.user_id;
        selection_request.top_n = request.top_n;

        result.selection = m_selector.select(selection_request);
        result.pipeline_steps.push_back("selection");

        result.outputs = m_executor.execute(result.selection.workers, request.query, &result.execution);
        result.pipeline_steps.push_back("execution");

        for (const auto& conflict : m_merger.identifyConflicts(result.outputs)) {
            result.conflicts.push_back(OutputMerger::resolveConflict(conflict));
        }
        result.consistency = m_merger.checkConsistency(result.outputs);
        m_merger.logMergerStatistics(result.outputs);
        result.pipeline_steps.push_back("analysis");

        result.response = m_merger.createUnifiedResponse(result.outputs, request.user_id);
        result.pipeline_steps.push_back("aggregation");

        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
        Logger::getInstance().error("BrainOrchestrator", "Pipeline failed: " + result.error_message);
    } catch (...) {
        result.success = false;
        result.error_message = "unknown exception";
        Logger::getInstance().error("BrainOrchestrator", "Pipeline failed: unknown exception");
    }

    result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result.success) {
        Logger::getInstance().info("BrainOrchestrator",
            "Completed in " + std::to_string(result.total_time.count()) + "ms: " +
            std::to_string(result.selection.workers.size()) + " selected, " +
            std::to_string(result.outputs.size()) + " completed, " +
            std::to_string(result.response.sources.size()) + " merged");
    }

    updateStatistics(result);
    return result;
}

OrchestratorStatistics BrainOrchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_statistics_mutex);
    return m_statistics;
}

void BrainOrchestrator::resetStatistics() {
    std::lock_guard<std::mutex> lock(m_statistics_mutex);
    m_statistics = OrchestratorStatistics();
}

void BrainOrchestrator::updateStatistics(const OrchestrationResult& result) {
    std::lock_guard<std::mutex> lock(m_statistics_mutex);

    m_statistics.total_requests++;
    if (result.success) {
        m_statistics.successful_requests++;
    } else {
        m_statistics.failed_requests++;
    }
    if (result.selection.used_fallback) {
        m_statistics.fallback_selections++;
    }
    if (result.success && result.outputs.empty()) {
        m_statistics.empty_responses++;
    }

    double n = static_cast<double>(m_statistics.total_requests);
    m_statistics.average_response_time =
        (m_statistics.average_response_time * (n - 1) + result.total_time.count()) / n;
}

} // namespace Cortex
