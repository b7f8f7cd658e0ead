// =================================================================
// src/Cortex/PipelineConfig.cpp
// =================================================================

#include "Cortex/PipelineConfig.hpp"
#include "Cortex/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace Cortex {

PipelineConfig loadPipelineConfig(const std::string& config_path) {
    PipelineConfig config;

    if (!std::filesystem::exists(config_path)) {
        CORTEX_LOG_DEBUG("PipelineConfig", "No configuration at " + config_path + ", using defaults");
        return config;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);

        if (YAML::Node merger = root["merger"]) {
            auto& m = config.merger;
            if (merger["similarity_threshold"]) {
                m.similarity_threshold = merger["similarity_threshold"].as<double>();
            }
            if (merger["max_merged_outputs"]) {
                m.max_merged_outputs = merger["max_merged_outputs"].as<size_t>();
            }
            if (merger["insight_prefix"]) {
                m.insight_prefix = merger["insight_prefix"].as<std::string>();
            }
            if (merger["perspective_prefix"]) {
                m.perspective_prefix = merger["perspective_prefix"].as<std::string>();
            }
            if (merger["consistency_threshold"]) {
                m.consistency_threshold = merger["consistency_threshold"].as<double>();
            }
            if (merger["inconsistency_threshold"]) {
                m.inconsistency_threshold = merger["inconsistency_threshold"].as<double>();
            }
        }

        if (YAML::Node executor = root["executor"]) {
            if (executor["max_concurrency"]) {
                config.executor.max_concurrency = executor["max_concurrency"].as<size_t>();
            }
            if (executor["execution_budget_ms"]) {
                config.executor.execution_budget =
                    std::chrono::milliseconds(executor["execution_budget_ms"].as<long>());
            }
        }

        if (YAML::Node index = root["index"]) {
            if (index["url"]) {
                config.index.server_url = index["url"].as<std::string>();
                config.use_remote_index = !config.index.server_url.empty();
            }
            if (index["search_path"]) {
                config.index.search_path = index["search_path"].as<std::string>();
            }
            if (index["worker_id_key"]) {
                config.index.worker_id_key = index["worker_id_key"].as<std::string>();
            }
            if (index["connection_timeout_s"]) {
                config.index.connection_timeout = std::chrono::seconds(index["connection_timeout_s"].as<long>());
            }
            if (index["read_timeout_s"]) {
                config.index.read_timeout = std::chrono::seconds(index["read_timeout_s"].as<long>());
            }
        }

        if (YAML::Node logging = root["logging"]) {
            auto& l = config.logging;
            if (logging["directory"]) {
                l.log_dir = logging["directory"].as<std::string>();
            }
            if (logging["max_file_size_mb"]) {
                l.max_file_bytes = logging["max_file_size_mb"].as<size_t>() * 1024 * 1024;
            }
            if (logging["max_files"]) {
                l.max_files = logging["max_files"].as<size_t>();
            }
            if (logging["console_level"]) {
                l.console_level = parseLogLevel(logging["console_level"].as<std::string>());
            }
            if (logging["file_level"]) {
                l.file_level = parseLogLevel(logging["file_level"].as<std::string>());
            }
            if (logging["console"]) {
                l.console_enabled = logging["console"].as<bool>();
            }
            if (logging["file"]) {
                l.file_enabled = logging["file"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid pipeline configuration in " + config_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid logging configuration in " + config_path + ": " + e.what());
    }

    return config;
}

} // namespace Cortex
