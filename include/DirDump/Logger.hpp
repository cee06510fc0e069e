// =================================================================
// include/DirDump/Logger.hpp
// =================================================================
// Header for diagnostic logging of dump runs.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace DirDump {

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
 * @brief Logging system for dump diagnostics
 *
 * Writes structured entries to the console and, once initialize() has been
 * called with a directory, to rotating log files. Without initialize() only
 * the console is used, so a dump never writes logs into the tree it reads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir,
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log file collection results
     * @param strategy Collection strategy actually used
     * @param collected_files Candidate files after filtering
     * @param prefiltered_binary Files dropped by the extension blacklist
     */
    void logCollection(const std::string& strategy,
                       const std::vector<std::string>& collected_files,
                       size_t prefiltered_binary);

    /**
     * @brief Log the counters of a finished dump
     * @param parts Output part paths in emission order
     * @param written Files written
     * @param skipped_binary Files skipped as binary
     * @param skipped_large Files skipped for exceeding the size cap
     * @param skipped_self Files skipped because they are dump output
     */
    void logDumpSummary(const std::vector<std::string>& parts, size_t written,
                        size_t skipped_binary, size_t skipped_large, size_t skipped_self);

    /**
     * @brief Log session start
     * @param target Target directory of the dump
     * @param output Output path of the dump
     */
    void logSessionStart(const std::string& target, const std::string& output);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

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

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    /**
     * @brief Log an entry to all configured outputs
     * @param entry Log entry to write
     */
    void logEntry(const LogEntry& entry);

    /**
     * @brief Write entry to console if appropriate
     *
     * WARNING and above go to stderr, the rest to stdout.
     */
    void writeToConsole(const LogEntry& entry);

    /**
     * @brief Write entry to file if appropriate
     * @param entry Log entry
     */
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    /**
     * @brief Generate timestamp string
     * @param time_point Time to format
     * @return Formatted timestamp
     */
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     * @return false if it cannot be created
     */
    bool ensureLogDirectory();

    /**
     * @brief Get new log filename
     * @return Filename for new log file
     */
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    DirDump::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    DirDump::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    DirDump::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    DirDump::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    DirDump::Logger::getInstance().critical(component, message)

} // namespace DirDump
