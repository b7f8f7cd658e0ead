// =================================================================
// include/Cortex/WorkerRegistry.hpp
// =================================================================
// Reference data for all known workers: core set, execution order,
// complexity and latency ratings.

#pragma once

#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <mutex>

namespace Cortex {

/**
 * @brief Static profile of a single worker, as read from YAML
 */
struct WorkerProfile {
    WorkerId name;                         ///< Worker identifier
    std::string description;               ///< Human-readable description
    std::optional<int> execution_order;    ///< Sequencing rank (lower runs first)
    std::optional<int> complexity;         ///< Declared complexity rating (0-10)
    std::optional<double> latency_ms;      ///< Typical response time
};

/**
 * @brief Weights of the ranked-selection score components
 *
 * The four weights must sum to 100.
 */
struct ScoringWeights {
    double relevance = 40.0;
    double complexity = 30.0;
    double user_history = 20.0;
    double performance = 10.0;

    double sum() const { return relevance + complexity + user_history + performance; }
};

/**
 * @brief Selector-wide settings loaded alongside the worker table
 */
struct SelectorSettings {
    size_t specialist_top_k = 4;                     ///< Matches requested by selectBrains
    size_t catalog_top_k = 100;                      ///< Size of the catalog listing query
    std::chrono::milliseconds index_timeout{2000};   ///< Budget for each index call
    int default_execution_order = 500;               ///< Rank for workers without one
    int default_complexity = 5;                      ///< Complexity for unrated workers
    double default_latency_ms = 100.0;               ///< Latency for unrated workers
    double latency_ceiling_ms = 200.0;               ///< Latency at which performance reaches 0
    ScoringWeights weights;
};

/**
 * @brief Outcome of registering a single worker
 */
struct WorkerLoadResult {
    bool success = false;
    WorkerId worker_id;
    std::string error_message;
};

/**
 * @brief Registry status information
 */
struct RegistryStatus {
    size_t total_configured = 0;           ///< Workers declared in config
    size_t successfully_loaded = 0;        ///< Workers accepted
    size_t failed_to_load = 0;             ///< Workers rejected by validation
    size_t core_workers = 0;               ///< Size of the core set
    bool config_loaded = false;            ///< Whether the last file parsed
    std::chrono::system_clock::time_point last_update;
    std::vector<WorkerLoadResult> load_results;
};

/**
 * @brief Registry configuration
 */
struct RegistryConfig {
    std::string config_file_path = "config/workers.yml"; ///< Path to workers config
    bool auto_load = true;                 ///< Load the file on construction
    bool validate_on_load = true;          ///< Reject invalid worker entries
};

/**
 * @brief Read-mostly registry of worker reference data
 *
 * Populated at startup, either from YAML or programmatically, and shared
 * read-only by selectors afterwards.
 */
class WorkerRegistry {
public:
    explicit WorkerRegistry(const RegistryConfig& config = RegistryConfig());
    virtual ~WorkerRegistry() = default;

    /**
     * @brief Load workers and selector settings from a YAML file
     * @param config_path Path to YAML configuration file
     * @return Registry status after loading
     */
    virtual RegistryStatus loadFromConfig(const std::string& config_path);

    /**
     * @brief Reload the configured file
     */
    virtual RegistryStatus reloadConfiguration();

    /**
     * @brief Register or replace a worker profile
     * @return Load result describing acceptance
     */
    virtual WorkerLoadResult registerWorker(const WorkerProfile& profile);

    /**
     * @brief Replace the core set
     *
     * Order is preserved, duplicates are dropped.
     */
    virtual void setCoreWorkers(const std::vector<WorkerId>& core_workers);

    /**
     * @brief Replace the selector settings
     *
     * Weights that are negative or do not sum to 100 are rejected in favour
     * of the defaults.
     */
    virtual void setSelectorSettings(const SelectorSettings& settings);

    std::vector<WorkerId> getCoreWorkers() const;
    bool isCoreWorker(const WorkerId& worker) const;

    /**
     * @brief All registered worker ids in registration order
     */
    std::vector<WorkerId> getWorkerIds() const;

    std::optional<WorkerProfile> getProfile(const WorkerId& worker) const;

    /**
     * @brief Execution rank, or the default mid-range rank when unknown
     */
    int getExecutionOrder(const WorkerId& worker) const;

    /**
     * @brief Declared complexity, or the default rating when unknown
     */
    int getComplexity(const WorkerId& worker) const;

    /**
     * @brief Typical latency, or the default latency when unknown
     */
    double getLatencyMs(const WorkerId& worker) const;

    SelectorSettings getSelectorSettings() const;
    RegistryStatus getStatus() const;

    /**
     * @brief Validate a worker profile
     * @return True if the profile can be registered
     */
    virtual bool validateWorkerProfile(const WorkerProfile& profile) const;

    /**
     * @brief Get worker info as formatted string (for CLI)
     */
    std::string getWorkerInfo(const WorkerId& worker) const;

    /**
     * @brief Get all workers info as formatted string (for CLI)
     */
    std::string getAllWorkersInfo() const;

protected:
    struct ParsedConfig {
        SelectorSettings settings;
        std::vector<WorkerId> core_workers;
        std::vector<WorkerProfile> workers;
    };

    /**
     * @brief Parse YAML configuration file
     * @throws std::runtime_error on unreadable or malformed files
     */
    virtual ParsedConfig parseConfigFile(const std::string& config_path) const;

private:
    RegistryConfig m_config;
    SelectorSettings m_settings;
    std::vector<WorkerId> m_core_workers;
    std::vector<WorkerId> m_worker_order;
    std::unordered_map<WorkerId, WorkerProfile> m_profiles;
    RegistryStatus m_status;
    mutable std::mutex m_registry_mutex;

    WorkerLoadResult registerWorkerLocked(const WorkerProfile& profile);
    void setCoreWorkersLocked(const std::vector<WorkerId>& core_workers);
    static bool validateWeights(const ScoringWeights& weights);
    void updateStatus();
};

} // namespace Cortex
