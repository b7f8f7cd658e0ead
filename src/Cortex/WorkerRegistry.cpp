// =================================================================
// src/Cortex/WorkerRegistry.cpp
// =================================================================
// Implementation of the worker reference-data registry.

#include "Cortex/WorkerRegistry.hpp"
#include "Cortex/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <cmath>

namespace Cortex {

WorkerRegistry::WorkerRegistry(const RegistryConfig& config)
    : m_config(config) {

    m_status.last_update = std::chrono::system_clock::now();

    if (m_config.auto_load && !m_config.config_file_path.empty()) {
        loadFromConfig(m_config.config_file_path);
    }
}

RegistryStatus WorkerRegistry::loadFromConfig(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    Logger::getInstance().info("WorkerRegistry", "Loading workers from configuration: " + config_path);

    m_status = RegistryStatus();

    try {
        ParsedConfig parsed = parseConfigFile(config_path);

        if (!validateWeights(parsed.settings.weights)) {
            Logger::getInstance().error("WorkerRegistry",
                "Scoring weights must be non-negative and sum to 100, using defaults");
            parsed.settings.weights = ScoringWeights();
        }

        m_settings = parsed.settings;
        m_profiles.clear();
        m_worker_order.clear();
        m_status.total_configured = parsed.workers.size();

        for (const auto& profile : parsed.workers) {
            m_status.load_results.push_back(registerWorkerLocked(profile));
        }

        setCoreWorkersLocked(parsed.core_workers);
        m_status.config_loaded = true;

        Logger::getInstance().info("WorkerRegistry",
            "Worker loading complete. Loaded: " + std::to_string(m_profiles.size()) +
            "/" + std::to_string(m_status.total_configured) +
            ", core: " + std::to_string(m_core_workers.size()));

    } catch (const std::exception& e) {
        Logger::getInstance().error("WorkerRegistry",
            "Failed to load configuration: " + std::string(e.what()));
    }

    updateStatus();
    return m_status;
}

RegistryStatus WorkerRegistry::reloadConfiguration() {
    if (m_config.config_file_path.empty()) {
        Logger::getInstance().warning("WorkerRegistry", "No configuration file path set");
        return getStatus();
    }

    return loadFromConfig(m_config.config_file_path);
}

WorkerLoadResult WorkerRegistry::registerWorker(const WorkerProfile& profile) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto result = registerWorkerLocked(profile);
    m_status.load_results.push_back(result);
    updateStatus();
    return result;
}

WorkerLoadResult WorkerRegistry::registerWorkerLocked(const WorkerProfile& profile) {
    WorkerLoadResult result;
    result.worker_id = profile.name;

    if (m_config.validate_on_load && !validateWorkerProfile(profile)) {
        result.error_message = "Invalid configuration";
        return result;
    }

    if (m_profiles.find(profile.name) == m_profiles.end()) {
        m_worker_order.push_back(profile.name);
    }
    m_profiles[profile.name] = profile;
    result.success = true;

    Logger::getInstance().debug("WorkerRegistry", "Registered worker: " + profile.name);
    return result;
}

void WorkerRegistry::setCoreWorkers(const std::vector<WorkerId>& core_workers) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    setCoreWorkersLocked(core_workers);
    updateStatus();
}

void WorkerRegistry::setCoreWorkersLocked(const std::vector<WorkerId>& core_workers) {
    m_core_workers.clear();

    for (const auto& worker : core_workers) {
        if (worker.empty()) {
            Logger::getInstance().warning("WorkerRegistry", "Ignoring empty core worker id");
            continue;
        }
        if (std::find(m_core_workers.begin(), m_core_workers.end(), worker) != m_core_workers.end()) {
            continue;
        }
        if (m_profiles.find(worker) == m_profiles.end()) {
            // Still a core worker: the core set must be honoured even without a profile
            Logger::getInstance().warning("WorkerRegistry",
                "Core worker has no profile, defaults apply: " + worker);
        }
        m_core_workers.push_back(worker);
    }
}

void WorkerRegistry::setSelectorSettings(const SelectorSettings& settings) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    m_settings = settings;
    if (!validateWeights(settings.weights)) {
        Logger::getInstance().error("WorkerRegistry",
            "Scoring weights must be non-negative and sum to 100, using defaults");
        m_settings.weights = ScoringWeights();
    }
}

std::vector<WorkerId> WorkerRegistry::getCoreWorkers() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_core_workers;
}

bool WorkerRegistry::isCoreWorker(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return std::find(m_core_workers.begin(), m_core_workers.end(), worker) != m_core_workers.end();
}

std::vector<WorkerId> WorkerRegistry::getWorkerIds() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_worker_order;
}

std::optional<WorkerProfile> WorkerRegistry::getProfile(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto it = m_profiles.find(worker);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

int WorkerRegistry::getExecutionOrder(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto it = m_profiles.find(worker);
    if (it != m_profiles.end() && it->second.execution_order) {
        return *it->second.execution_order;
    }
    return m_settings.default_execution_order;
}

int WorkerRegistry::getComplexity(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto it = m_profiles.find(worker);
    if (it != m_profiles.end() && it->second.complexity) {
        return *it->second.complexity;
    }

    Logger::getInstance().debug("WorkerRegistry",
        "No complexity rating for " + worker + ", using " +
        std::to_string(m_settings.default_complexity));
    return m_settings.default_complexity;
}

double WorkerRegistry::getLatencyMs(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto it = m_profiles.find(worker);
    if (it != m_profiles.end() && it->second.latency_ms) {
        return *it->second.latency_ms;
    }

    Logger::getInstance().debug("WorkerRegistry",
        "No latency rating for " + worker + ", using " +
        std::to_string(static_cast<long>(m_settings.default_latency_ms)) + "ms");
    return m_settings.default_latency_ms;
}

SelectorSettings WorkerRegistry::getSelectorSettings() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_settings;
}

RegistryStatus WorkerRegistry::getStatus() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_status;
}

bool WorkerRegistry::validateWorkerProfile(const WorkerProfile& profile) const {
    if (profile.name.empty()) {
        Logger::getInstance().error("WorkerRegistry", "Worker configuration missing name");
        return false;
    }

    if (profile.complexity && (*profile.complexity < 0 || *profile.complexity > 10)) {
        Logger::getInstance().error("WorkerRegistry",
            "Complexity must be within 0-10 for worker: " + profile.name);
        return false;
    }

    if (profile.latency_ms && (*profile.latency_ms < 0.0 || std::isnan(*profile.latency_ms))) {
        Logger::getInstance().error("WorkerRegistry",
            "Latency must be non-negative for worker: " + profile.name);
        return false;
    }

    return true;
}

std::string WorkerRegistry::getWorkerInfo(const WorkerId& worker) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    bool is_core = std::find(m_core_workers.begin(), m_core_workers.end(), worker) != m_core_workers.end();
    auto it = m_profiles.find(worker);
    if (it == m_profiles.end() && !is_core) {
        return "Worker not found: " + worker;
    }

    std::stringstream ss;
    ss << "Worker: " << worker << (is_core ? " [core]" : "") << "\n";

    if (it == m_profiles.end()) {
        ss << "  (no profile, defaults apply)\n";
        return ss.str();
    }

    const auto& profile = it->second;
    ss << "  Description: " << profile.description << "\n";
    ss << "  Execution order: "
       << profile.execution_order.value_or(m_settings.default_execution_order) << "\n";
    ss << "  Complexity: "
       << profile.complexity.value_or(m_settings.default_complexity) << "/10\n";
    ss << "  Typical latency: "
       << profile.latency_ms.value_or(m_settings.default_latency_ms) << "ms\n";

    return ss.str();
}

std::string WorkerRegistry::getAllWorkersInfo() const {
    auto status = getStatus();
    auto core = getCoreWorkers();
    auto ids = getWorkerIds();

    std::stringstream ss;
    ss << "Worker Registry Status\n";
    ss << "======================\n";
    ss << "Total Configured: " << status.total_configured << "\n";
    ss << "Successfully Loaded: " << status.successfully_loaded << "\n";
    ss << "Failed to Load: " << status.failed_to_load << "\n";
    ss << "Core Workers: " << core.size() << "\n";

    if (ids.empty() && core.empty()) {
        ss << "\nNo workers registered.\n";
        return ss.str();
    }

    ss << "\nWorkers:\n";
    ss << "--------\n";
    for (const auto& id : core) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ss << "\n" << getWorkerInfo(id);
        }
    }
    for (const auto& id : ids) {
        ss << "\n" << getWorkerInfo(id);
    }

    return ss.str();
}

WorkerRegistry::ParsedConfig WorkerRegistry::parseConfigFile(const std::string& config_path) const {
    ParsedConfig parsed;

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot read " + config_path + ": " + e.what());
    }

    if (YAML::Node selector = root["selector"]) {
        auto& s = parsed.settings;
        if (selector["specialist_top_k"]) {
            s.specialist_top_k = selector["specialist_top_k"].as<size_t>();
        }
        if (selector["catalog_top_k"]) {
            s.catalog_top_k = selector["catalog_top_k"].as<size_t>();
        }
        if (selector["index_timeout_ms"]) {
            s.index_timeout = std::chrono::milliseconds(selector["index_timeout_ms"].as<long>());
        }
        if (selector["default_execution_order"]) {
            s.default_execution_order = selector["default_execution_order"].as<int>();
        }
        if (selector["default_complexity"]) {
            s.default_complexity = selector["default_complexity"].as<int>();
        }
        if (selector["default_latency_ms"]) {
            s.default_latency_ms = selector["default_latency_ms"].as<double>();
        }
        if (selector["latency_ceiling_ms"]) {
            s.latency_ceiling_ms = selector["latency_ceiling_ms"].as<double>();
        }
        if (YAML::Node weights = selector["weights"]) {
            if (weights["relevance"]) s.weights.relevance = weights["relevance"].as<double>();
            if (weights["complexity"]) s.weights.complexity = weights["complexity"].as<double>();
            if (weights["user_history"]) s.weights.user_history = weights["user_history"].as<double>();
            if (weights["performance"]) s.weights.performance = weights["performance"].as<double>();
        }
    }

    if (YAML::Node core = root["core_workers"]) {
        for (const auto& worker : core) {
            parsed.core_workers.push_back(worker.as<std::string>());
        }
    } else {
        Logger::getInstance().warning("WorkerRegistry", "No 'core_workers' section in configuration file");
    }

    YAML::Node workers = root["workers"];
    if (!workers) {
        Logger::getInstance().warning("WorkerRegistry", "No 'workers' section in configuration file");
        return parsed;
    }

    for (YAML::const_iterator it = workers.begin(); it != workers.end(); ++it) {
        WorkerProfile profile;
        profile.name = it->first.as<std::string>();

        YAML::Node node = it->second;
        if (node["description"]) {
            profile.description = node["description"].as<std::string>();
        }
        if (node["execution_order"]) {
            profile.execution_order = node["execution_order"].as<int>();
        }
        if (node["complexity"]) {
            profile.complexity = node["complexity"].as<int>();
        }
        if (node["latency_ms"]) {
            profile.latency_ms = node["latency_ms"].as<double>();
        }

        parsed.workers.push_back(profile);
    }

    return parsed;
}

bool WorkerRegistry::validateWeights(const ScoringWeights& weights) {
    if (weights.relevance < 0 || weights.complexity < 0 ||
        weights.user_history < 0 || weights.performance < 0) {
        return false;
    }
    return std::abs(weights.sum() - 100.0) < 1e-6;
}

void WorkerRegistry::updateStatus() {
    m_status.successfully_loaded = m_profiles.size();
    m_status.failed_to_load = static_cast<size_t>(std::count_if(
        m_status.load_results.begin(), m_status.load_results.end(),
        [](const WorkerLoadResult& r) { return !r.success; }));
    m_status.core_workers = m_core_workers.size();
    m_status.last_update = std::chrono::system_clock::now();
}

} // namespace Cortex
