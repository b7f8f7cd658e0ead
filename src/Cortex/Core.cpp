// =================================================================
// src/Cortex/Core.cpp
// =================================================================
// Implementation of the command-line application object.

#include "Cortex/Core.hpp"
#include "Cortex/WorkerRegistry.hpp"
#include "Cortex/PipelineConfig.hpp"
#include "Cortex/BrainSelector.hpp"
#include "Cortex/OutputMerger.hpp"
#include "Cortex/HttpEmbeddingIndex.hpp"
#include "Cortex/LexicalEmbeddingIndex.hpp"
#include "Cortex/ResponseJson.hpp"
#include "Cortex/Logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Cortex {

Core::Core(const Commands& commands) : m_commands(commands) {
    Logger& logger = Logger::getInstance();

    std::string pipeline_error;
    try {
        m_pipeline = std::make_unique<PipelineConfig>(loadPipelineConfig(m_commands.config_path));
    } catch (const std::exception& e) {
        pipeline_error = e.what();
        m_pipeline = std::make_unique<PipelineConfig>();
    }

    LoggerConfig log_config = m_pipeline->logging;
    if (m_commands.verbose) {
        log_config.console_level = LogLevel::DEBUG;
    }
    logger.configure(log_config);

    if (!pipeline_error.empty()) {
        logger.error("Core", pipeline_error + "; using default pipeline settings");
    }

    RegistryConfig registry_config;
    registry_config.config_file_path = m_commands.config_path;
    registry_config.validate_on_load = true;
    m_registry = std::make_unique<WorkerRegistry>(registry_config);
}

// Defined here, where WorkerRegistry and PipelineConfig are complete types.
Core::~Core() = default;

int Core::run() {
    Logger& logger = Logger::getInstance();
    auto start_time = std::chrono::steady_clock::now();

    const std::string& command = m_commands.active_command;
    logger.logSessionStart(command, command == "select" ? m_commands.query : m_commands.outputs_file);

    int exit_code = 0;
    if (command == "workers") {
        exit_code = handleWorkers();
    } else if (command == "select") {
        exit_code = handleSelect();
    } else if (command == "merge") {
        exit_code = handleMerge();
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd(command, exit_code, duration.count());
    logger.flush();

    return exit_code;
}

int Core::handleWorkers() {
    auto status = m_registry->getStatus();

    if (!m_commands.worker_name.empty()) {
        std::cout << m_registry->getWorkerInfo(m_commands.worker_name) << std::endl;
        return m_registry->getProfile(m_commands.worker_name) ? 0 : 1;
    }

    std::cout << m_registry->getAllWorkersInfo() << std::endl;

    if (!status.config_loaded) {
        std::cerr << "Configuration could not be loaded from " << m_commands.config_path << std::endl;
        return 1;
    }

    if (status.failed_to_load > 0) {
        std::cout << "\nFailed workers:" << std::endl;
        for (const auto& result : status.load_results) {
            if (!result.success) {
                std::cout << "  - " << result.worker_id << ": " << result.error_message << std::endl;
            }
        }
        return 1;
    }

    return 0;
}

int Core::handleSelect() {
    BrainSelector selector(*m_registry, createIndex());

    SelectionRequest request;
    request.query = m_commands.query;
    request.mode = m_commands.ranked ? SelectionMode::RANKED : SelectionMode::CORE_PLUS_SPECIALISTS;
    request.complexity_level = m_commands.complexity;
    request.user_id = m_commands.user_id;
    request.top_n = m_commands.top_n;

    SelectionResult result = selector.select(request);

    nlohmann::json output = {
        {"mode", selectionModeToString(request.mode)},
        {"workers", result.workers},
        {"fallback", result.used_fallback},
        {"reason", result.selection_reason},
        {"selectionTimeMs", result.selection_time.count()}
    };
    if (request.mode == SelectionMode::RANKED) {
        output["scores"] = result.scores;
    }

    std::cout << output.dump(2) << std::endl;
    return 0;
}

int Core::handleMerge() {
    std::ifstream file(m_commands.outputs_file);
    if (!file.is_open()) {
        std::cerr << "Cannot open " << m_commands.outputs_file << std::endl;
        return 1;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<WorkerOutput> outputs;
    try {
        outputs = parseWorkerOutputs(buffer.str());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    OutputMerger merger(m_pipeline->merger);
    merger.logMergerStatistics(outputs);

    nlohmann::json conflicts = nlohmann::json::array();
    for (const auto& conflict : merger.identifyConflicts(outputs)) {
        conflicts.push_back(OutputMerger::resolveConflict(conflict));
    }

    nlohmann::json output = {
        {"response", merger.createUnifiedResponse(outputs, m_commands.user_id)},
        {"conflicts", conflicts},
        {"consistency", merger.checkConsistency(outputs)},
        {"statistics", OutputMerger::computeStatistics(outputs)},
        {"insights", merger.combineInsights(outputs)}
    };

    std::cout << output.dump(2) << std::endl;
    return 0;
}

std::shared_ptr<EmbeddingIndex> Core::createIndex() const {
    if (!m_commands.index_url.empty() || m_pipeline->use_remote_index) {
        HttpIndexConfig index_config = m_pipeline->index;
        if (!m_commands.index_url.empty()) {
            index_config.server_url = m_commands.index_url;
        }
        index_config = capIndexTimeouts(index_config, m_registry->getSelectorSettings().index_timeout);
        return std::make_shared<HttpEmbeddingIndex>(index_config);
    }

    return std::make_shared<LexicalEmbeddingIndex>(*m_registry);
}

} // namespace Cortex
