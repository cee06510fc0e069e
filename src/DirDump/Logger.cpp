// =================================================================
// src/DirDump/Logger.cpp
// =================================================================
// Implementation for diagnostic logging of dump runs.

#include "DirDump/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <ctime>

namespace DirDump {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;

    if (!ensureLogDirectory()) {
        warning("Logger", "File logging disabled", m_log_dir);
        return;
    }

    // Create initial log file
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        m_current_log_file.reset();
        warning("Logger", "Cannot open log file", m_current_log_filename);
        return;
    }

    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
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

void Logger::logCollection(const std::string& strategy,
                           const std::vector<std::string>& collected_files,
                           size_t prefiltered_binary) {
    std::ostringstream context;
    context << "Strategy: " << strategy << ", ";
    context << "Candidates: " << collected_files.size() << ", ";
    context << "Blacklisted: " << prefiltered_binary;

    info("FileCollector", "File collection completed", context.str());

    // Log first few files for debugging
    if (!collected_files.empty()) {
        std::ostringstream file_list;
        for (size_t i = 0; i < std::min(size_t(10), collected_files.size()); i++) {
            if (i > 0) file_list << ", ";
            file_list << collected_files[i];
        }
        if (collected_files.size() > 10) {
            file_list << " and " << (collected_files.size() - 10) << " more";
        }
        debug("FileCollector", "Files collected: " + file_list.str());
    }
}

void Logger::logDumpSummary(const std::vector<std::string>& parts, size_t written,
                            size_t skipped_binary, size_t skipped_large, size_t skipped_self) {
    std::ostringstream context;
    context << "Parts: " << parts.size() << ", ";
    context << "Written: " << written << ", ";
    context << "Binary: " << skipped_binary << ", ";
    context << "Too large: " << skipped_large << ", ";
    context << "Own output: " << skipped_self;

    info("Dumper", "Dump completed", context.str());

    if (skipped_self > 0) {
        warning("Dumper",
               "Previous dump output found in target and skipped",
               "Files skipped: " + std::to_string(skipped_self));
    }

    for (const auto& part : parts) {
        debug("Dumper", "Part: " + part);
    }
}

void Logger::logSessionStart(const std::string& target, const std::string& output) {
    std::ostringstream context;
    context << "Target: " << target << ", ";
    context << "Output: " << output;

    info("Session", "Session started", context.str());
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
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
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    if (entry.level >= LogLevel::WARNING) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    // Timestamp
    formatted << formatTimestamp(entry.timestamp) << " ";

    // Level with color
    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    // Component
    formatted << entry.component << ": ";

    // Message
    formatted << entry.message;

    // Context (if provided)
    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    // Close current file
    m_current_log_file.reset();

    // Create new file
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        m_current_log_file.reset();
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        return;
    }

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Sort by modification time (newest first)
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        // Remove old files beyond the limit
        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
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

bool Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream filename;
    filename << m_log_dir << "/dirdump_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace DirDump
