// =================================================================
// src/Codefeed/Logger.cpp
// =================================================================
// Implementation for the diagnostic logger.

#include "Codefeed/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <cstdio>
#include <unistd.h>

namespace Codefeed {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

bool Logger::openLogFile(const std::string& file_path, size_t max_log_size, size_t max_log_files) {
    closeLogFile();

    m_log_filename = file_path;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;

    std::error_code ec;
    auto existing = std::filesystem::file_size(file_path, ec);
    m_current_log_size = ec ? 0 : static_cast<size_t>(existing);

    m_log_file = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!m_log_file->is_open()) {
        m_log_file.reset();
        return false;
    }

    info("Logger", "Log file opened", file_path);
    return true;
}

void Logger::closeLogFile() {
    if (m_log_file) {
        m_log_file->flush();
        m_log_file.reset();
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::logRunStart(const std::string& root_path, size_t max_files,
                         std::uint64_t max_total_size, std::uint64_t max_file_size) {
    std::ostringstream context;
    context << "Max files: " << max_files << ", ";
    context << "Max total size: " << max_total_size << " bytes, ";
    context << "Max file size: " << max_file_size << " bytes";

    info("Run", "Walking " + root_path, context.str());
}

void Logger::logRunSummary(size_t entries_seen, size_t files_admitted, std::uint64_t bytes_admitted,
                           size_t binary_files, size_t skipped_files) {
    std::ostringstream context;
    context << "Entries: " << entries_seen << ", ";
    context << "Admitted: " << files_admitted << ", ";
    context << "Bytes: " << bytes_admitted << ", ";
    context << "Non-text: " << binary_files << ", ";
    context << "Skipped: " << skipped_files;

    info("Run", "Traversal completed", context.str());

    if (skipped_files > 0) {
        warning("Run", "Some files were left out of the output",
                "Files skipped: " + std::to_string(skipped_files));
    }
}

void Logger::flush() {
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    static const bool color = isatty(fileno(stderr)) != 0;
    std::cerr << formatEntry(entry, color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_log_file.reset();

    // file.N-1 -> file.N, ..., file -> file.1; the oldest falls off the end
    std::error_code ec;
    if (m_max_log_files > 0) {
        std::filesystem::remove(m_log_filename + "." + std::to_string(m_max_log_files), ec);
        for (size_t i = m_max_log_files; i > 1; --i) {
            std::string from = m_log_filename + "." + std::to_string(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, m_log_filename + "." + std::to_string(i), ec);
            }
        }
        std::filesystem::rename(m_log_filename, m_log_filename + ".1", ec);
    } else {
        std::filesystem::remove(m_log_filename, ec);
    }

    if (ec) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << ec.message() << std::endl;
    }

    m_log_file = std::make_unique<std::ofstream>(m_log_filename, std::ios::trunc);
    if (!m_log_file->is_open()) {
        m_log_file.reset();
    }
    m_current_log_size = 0;
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace Codefeed
