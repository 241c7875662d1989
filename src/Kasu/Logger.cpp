// =================================================================
// src/Kasu/Logger.cpp
// =================================================================
// Implementation for the diagnostic logger.

#include "Kasu/Logger.hpp"
#include "Kasu/FileScanner.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

#if defined(_WIN32)
#include <io.h>
#define KASU_ISATTY _isatty
#define KASU_FILENO _fileno
#else
#include <unistd.h>
#define KASU_ISATTY isatty
#define KASU_FILENO fileno
#endif

namespace Kasu {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_console_level(LogLevel::INFO),
      m_console_enabled(true),
      m_show_timestamps(false),
      m_use_color(KASU_ISATTY(KASU_FILENO(stderr)) != 0),
      m_stream(&std::cerr)
{
}

Logger::~Logger() {
    flush();
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::setConsoleStream(std::ostream& stream) {
    m_stream = &stream;
    m_use_color = false;
}

void Logger::setShowTimestamps(bool enabled) {
    m_show_timestamps = enabled;
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

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

bool Logger::isEnabled(LogLevel level) const {
    return m_console_enabled && level >= m_console_level;
}

void Logger::logScanSummary(const ScanStatistics& stats) {
    std::ostringstream context;
    context << "Scanned: " << stats.scanned << ", ";
    context << "Glob filtered: " << stats.glob_filtered << ", ";
    context << "Ignored: " << stats.ignored << ", ";
    context << "Included: " << stats.included;
    if (stats.size_filtered > 0) {
        context << ", Size filtered: " << stats.size_filtered;
    }
    if (stats.non_text > 0) {
        context << ", Non-text: " << stats.non_text;
    }

    debug("FileScanner", "Traversal completed", context.str());
}

void Logger::flush() {
    if (m_stream) {
        m_stream->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    if (!isEnabled(entry.level) || !m_stream) {
        return;
    }

    *m_stream << formatEntry(entry, m_use_color) << std::endl;
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) const {
    std::ostringstream formatted;

    if (m_show_timestamps) {
        formatted << formatTimestamp(entry.timestamp) << " ";
    }

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace Kasu
