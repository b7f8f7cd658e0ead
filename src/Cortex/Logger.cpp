// =================================================================
// src/Cortex/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Cortex/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Cortex {

namespace {

struct LevelStyle {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelStyle kLevelStyles[] = {
    {LogLevel::DEBUG, "DEBUG", "\033[90m"},     // Dark gray
    {LogLevel::INFO, "INFO", "\033[36m"},       // Cyan
    {LogLevel::WARNING, "WARN", "\033[33m"},    // Yellow
    {LogLevel::ERROR, "ERROR", "\033[31m"},     // Red
    {LogLevel::CRITICAL, "CRIT", "\033[91m"},   // Bright red
};

constexpr const char* kColorReset = "\033[0m";
constexpr const char* kLogFilePrefix = "cortex_";

const LevelStyle& styleFor(LogLevel level) {
    for (const auto& style : kLevelStyles) {
        if (style.level == level) {
            return style;
        }
    }
    return kLevelStyles[1];
}

} // anonymous namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "crit" || lowered == "critical") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    closeLogFile();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);

    bool reopen = m_file_opened &&
                  (config.log_dir != m_config.log_dir || !config.file_enabled);
    m_config = config;
    if (m_config.max_files == 0) {
        m_config.max_files = 1;
    }

    if (reopen) {
        closeLogFile();
        m_file_opened = false;
    }

    std::error_code ec;
    if (m_config.file_enabled && fs::is_directory(m_config.log_dir, ec)) {
        pruneLogFiles();
    }
}

LoggerConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.console_level = level;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    dispatch(LogRecord{std::chrono::system_clock::now(), level, component, message, context});
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::CRITICAL, component, message, context);
}

void Logger::logSelection(const std::string& mode, size_t core_count, size_t specialist_count,
                          const std::vector<std::string>& selected) {
    std::ostringstream context;
    context << "Mode: " << mode
            << ", Core: " << core_count
            << ", Specialist: " << specialist_count
            << ", Total: " << selected.size();
    info("BrainSelector", "Selection completed", context.str());

    std::string joined;
    for (const auto& worker : selected) {
        joined += joined.empty() ? worker : ", " + worker;
    }
    debug("BrainSelector", "Selected workers: " + joined);
}

void Logger::logIndexFallback(const std::string& operation, const std::string& reason) {
    warning("EmbeddingIndex", "Index " + operation + " unavailable, falling back to core workers", reason);
}

void Logger::logMerge(size_t considered, size_t merged_sources, double quality) {
    std::ostringstream context;
    context << "Considered: " << considered
            << ", Sources: " << merged_sources
            << ", Quality: " << std::fixed << std::setprecision(2) << quality;
    info("OutputMerger", "Merged worker outputs", context.str());
}

void Logger::logConflicts(size_t conflict_count) {
    if (conflict_count == 0) {
        debug("OutputMerger", "No conflicts detected");
        return;
    }
    info("OutputMerger", std::to_string(conflict_count) + " conflicting output pair(s), resolving advisory");
}

void Logger::logSessionStart(const std::string& command, const std::string& subject) {
    info("Session", "Session started", "Command: " + command);
    if (!subject.empty()) {
        debug("Session", "Subject: " + subject);
    }
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "Command: " + command + ", Exit code: " + std::to_string(exit_code) +
                          ", Duration: " + std::to_string(duration_ms) + "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context);
    } else {
        error("Session", "Session completed with errors", context);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file) {
        m_file->flush();
    }
    std::cerr.flush();
}

const char* Logger::getLevelName(LogLevel level) {
    return styleFor(level).name;
}

void Logger::dispatch(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Console output goes to stderr so command output on stdout stays parseable
    if (m_config.console_enabled && record.level >= m_config.console_level) {
        std::cerr << formatRecord(record, true) << std::endl;
    }

    if (m_config.file_enabled && record.level >= m_config.file_level) {
        if (!m_file_opened) {
            openLogFile();
        }
        writeToFile(record);
    }
}

void Logger::writeToFile(const LogRecord& record) {
    if (!m_file) {
        return;
    }

    if (m_file_bytes >= m_config.max_file_bytes) {
        closeLogFile();
        openLogFile();
        if (!m_file) {
            return;
        }
    }

    std::string line = formatRecord(record, false);
    *m_file << line << '\n';
    m_file_bytes += line.size() + 1;

    if (record.level >= LogLevel::ERROR) {
        m_file->flush();
    }
}

void Logger::openLogFile() {
    m_file_opened = true;

    try {
        fs::create_directories(m_config.log_dir);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[ERROR] Cannot create log directory " << m_config.log_dir << ": "
                  << e.what() << std::endl;
        m_config.file_enabled = false;
        return;
    }

    std::string filename = nextLogFilename();
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file " << filename << std::endl;
        m_config.file_enabled = false;
        return;
    }

    m_file = std::move(file);
    m_file_bytes = 0;
    pruneLogFiles();
}

void Logger::closeLogFile() {
    if (m_file) {
        m_file->flush();
        m_file.reset();
    }
}

void Logger::pruneLogFiles() {
    try {
        std::vector<fs::path> log_files;
        for (const auto& entry : fs::directory_iterator(m_config.log_dir)) {
            const auto name = entry.path().filename().string();
            if (entry.is_regular_file() && name.rfind(kLogFilePrefix, 0) == 0 &&
                entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        if (log_files.size() <= m_config.max_files) {
            return;
        }

        // File names embed their creation time, so name order is age order
        std::sort(log_files.begin(), log_files.end());
        size_t excess = log_files.size() - m_config.max_files;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(log_files[i]);
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[WARN] Log pruning failed: " << e.what() << std::endl;
    }
}

std::string Logger::nextLogFilename() {
    std::ostringstream filename;
    filename << m_config.log_dir << "/" << kLogFilePrefix
             << formatTimestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S", false)
             << "_" << std::setfill('0') << std::setw(3) << m_file_sequence++ << ".log";
    return filename.str();
}

std::string Logger::formatRecord(const LogRecord& record, bool colored) {
    const LevelStyle& style = styleFor(record.level);

    std::ostringstream line;
    line << formatTimestamp(record.timestamp, "%Y-%m-%d %H:%M:%S", true) << " ";
    if (colored) {
        line << style.color << "[" << style.name << "]" << kColorReset;
    } else {
        line << "[" << style.name << "]";
    }
    line << " " << record.component << ": " << record.message;

    if (!record.context.empty()) {
        line << " (" << record.context << ")";
    }
    return line.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point,
                                    const char* pattern, bool with_millis) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);

    // Callers hold m_mutex, which also guards std::localtime's shared buffer
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), pattern);
    if (with_millis) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            time_point.time_since_epoch()) % 1000;
        oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
}

} // namespace Cortex
