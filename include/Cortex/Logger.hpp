// =================================================================
// include/Cortex/Logger.hpp
// =================================================================
// Header for structured logging across selection and aggregation.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Cortex {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Parse a level name such as "debug" or "WARN" (case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Sinks and rotation limits for the logger
 */
struct LoggerConfig {
    std::string log_dir = ".cortex/logs";          ///< Directory for log files
    size_t max_file_bytes = 10 * 1024 * 1024;     ///< Rotate after this many bytes
    size_t max_files = 5;                          ///< Log files kept in log_dir
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    bool console_enabled = true;
    bool file_enabled = true;
};

/**
 * @brief A single message on its way to the sinks
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
};

/**
 * @brief Process-wide logger with console and rotating file outputs
 *
 * All public methods may be called concurrently; writes are serialized
 * internally. The file sink opens lazily on the first record, so a logger
 * that is never configured still writes to the default directory.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Apply a configuration, reopening the file sink if needed
     *
     * Existing log files beyond max_files are pruned immediately.
     */
    void configure(const LoggerConfig& config);

    LoggerConfig getConfig() const;

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a selection call
     * @param mode Selection mode ("core_plus_specialists" or "ranked")
     * @param core_count Number of core workers in the result
     * @param specialist_count Number of non-core workers in the result
     * @param selected Final ordered worker list
     */
    void logSelection(const std::string& mode, size_t core_count, size_t specialist_count,
                      const std::vector<std::string>& selected);

    /**
     * @brief Log a fallback caused by the embedding index
     * @param operation Index operation that failed (search, catalog, relevance)
     * @param reason Error message or timeout description
     */
    void logIndexFallback(const std::string& operation, const std::string& reason);

    /**
     * @brief Log merge results
     * @param considered Number of outputs considered for the merge
     * @param merged_sources Number of sources that contributed content
     * @param quality Final merged quality
     */
    void logMerge(size_t considered, size_t merged_sources, double quality);

    void logConflicts(size_t conflict_count);

    /**
     * @brief Log the start of a CLI session
     * @param command Subcommand being executed
     * @param subject Query or input file the command works on
     */
    void logSessionStart(const std::string& command, const std::string& subject);

    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    static const char* getLevelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig m_config;
    std::unique_ptr<std::ofstream> m_file;
    size_t m_file_bytes = 0;
    unsigned m_file_sequence = 0;
    bool m_file_opened = false;
    mutable std::mutex m_mutex;

    void dispatch(const LogRecord& record);
    void writeToFile(const LogRecord& record);

    void openLogFile();
    void closeLogFile();
    void pruneLogFiles();
    std::string nextLogFilename();

    static std::string formatRecord(const LogRecord& record, bool colored);
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point,
                                       const char* pattern, bool with_millis);
};

// Convenience macros for logging
#define CORTEX_LOG_DEBUG(component, message) \
    Cortex::Logger::getInstance().debug(component, message)

#define CORTEX_LOG_INFO(component, message) \
    Cortex::Logger::getInstance().info(component, message)

#define CORTEX_LOG_WARNING(component, message) \
    Cortex::Logger::getInstance().warning(component, message)

#define CORTEX_LOG_ERROR(component, message) \
    Cortex::Logger::getInstance().error(component, message)

#define CORTEX_LOG_CRITICAL(component, message) \
    Cortex::Logger::getInstance().critical(component, message)

} // namespace Cortex
