// =================================================================
// include/Codefeed/Logger.hpp
// =================================================================
// Header for diagnostic logging. Console output goes to stderr and is
// off by default, because stderr carries the skip report.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <cstdint>

namespace Codefeed {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with a console sink and an optional file sink
 *
 * The console sink writes to stderr once enabled. The file sink appends to
 * a single file and rotates it to `<file>.1`, `<file>.2`, ... once it grows
 * past the configured size.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Open a log file that receives every entry at or above the file level
     * @param file_path Path of the log file (appended to)
     * @param max_log_size Size at which the file is rotated (bytes)
     * @param max_log_files Number of rotated files to keep
     * @return true if the file could be opened
     */
    bool openLogFile(const std::string& file_path,
                     size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                     size_t max_log_files = 5);

    /**
     * @brief Close the log file, if one is open
     */
    void closeLogFile();

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the start of a run with its effective limits
     * @param root_path Traversal root
     * @param max_files File count ceiling
     * @param max_total_size Cumulative size ceiling (bytes)
     * @param max_file_size Per-file size ceiling (bytes)
     */
    void logRunStart(const std::string& root_path, size_t max_files,
                     std::uint64_t max_total_size, std::uint64_t max_file_size);

    /**
     * @brief Log the outcome of a completed traversal
     * @param entries_seen Entries yielded by the walker
     * @param files_admitted Files whose content was kept
     * @param bytes_admitted Bytes committed to the running totals
     * @param binary_files Files classified as non-text
     * @param skipped_files Files recorded as skipped
     */
    void logRunSummary(size_t entries_seen, size_t files_admitted, std::uint64_t bytes_admitted,
                       size_t binary_files, size_t skipped_files);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = false;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Shift `<file>.N` names up by one and start a fresh file
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Codefeed::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Codefeed::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Codefeed::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Codefeed::Logger::getInstance().error(component, message)

} // namespace Codefeed
