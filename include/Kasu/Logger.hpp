// =================================================================
// include/Kasu/Logger.hpp
// =================================================================
// Header for the diagnostic logger shared by all components.

#pragma once

#include <string>
#include <chrono>
#include <ostream>

namespace Kasu {

struct ScanStatistics;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed trace information (--debug)
    INFO,       ///< General information
    WARNING,    ///< Recoverable problems
    ERROR,      ///< Errors that fail the run
    CRITICAL    ///< Unexpected failures
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
 * @brief Process-wide logger writing to the diagnostic stream
 *
 * Every warning, trace line and fatal error of a run goes through this
 * logger. The sink defaults to stderr so that output written to stdout
 * (the --stdout mode) is never mixed with diagnostics.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Get the current minimum console level
     */
    LogLevel getConsoleLogLevel() const { return m_console_level; }

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Redirect the console sink
     * @param stream Stream receiving formatted entries (must outlive the logger use)
     */
    void setConsoleStream(std::ostream& stream);

    /**
     * @brief Prefix entries with a timestamp
     * @param enabled True to print timestamps
     */
    void setShowTimestamps(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Check whether entries of a level would be written
     * @param level Level to test
     * @return true if an entry at this level reaches the sink
     */
    bool isEnabled(LogLevel level) const;

    /**
     * @brief Log the filter counters of a finished traversal
     * @param stats Counters produced by FileScanner::scan
     */
    void logScanSummary(const ScanStatistics& stats);

    /**
     * @brief Flush the console sink
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
    Logger();
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level;
    bool m_console_enabled;
    bool m_show_timestamps;
    bool m_use_color;
    std::ostream* m_stream;

    void logEntry(const LogEntry& entry);

    std::string formatEntry(const LogEntry& entry, bool include_color) const;

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;
};

// Convenience macros for logging
#define KASU_LOG_DEBUG(component, message) \
    Kasu::Logger::getInstance().debug(component, message)

#define KASU_LOG_INFO(component, message) \
    Kasu::Logger::getInstance().info(component, message)

#define KASU_LOG_WARNING(component, message) \
    Kasu::Logger::getInstance().warning(component, message)

#define KASU_LOG_ERROR(component, message) \
    Kasu::Logger::getInstance().error(component, message)

#define KASU_LOG_CRITICAL(component, message) \
    Kasu::Logger::getInstance().critical(component, message)

} // namespace Kasu
