// =================================================================
// include/Hotify/Logger.hpp
// =================================================================
// Header for console and file logging of hot-folder activity.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Hotify {

struct CommandInvocation;
struct ExecutionResult;

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
 * @brief Process-wide logger shared by the dispatcher and all workers
 * 
 * Writes colored entries to the console and plain entries to a rotating
 * log file. Until initialize() is called only the console is used.
 * All methods may be called concurrently.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize file logging
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

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a rendered invocation before it is executed
     * @param environment Environment name
     * @param invocation The rendered command chain
     */
    void logInvocation(const std::string& environment, const CommandInvocation& invocation);

    /**
     * @brief Log the outcome of an executed invocation
     * @param environment Environment name
     * @param result Execution result
     * @param duration_ms Wall time of the whole chain in milliseconds
     */
    void logExecutionResult(const std::string& environment, const ExecutionResult& result,
                            long duration_ms);

    /**
     * @brief Log a file that no environment claims
     * @param file_path Path of the dropped file
     */
    void logUnmatched(const std::string& file_path);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Path of the log file currently written, empty when file logging is off
     */
    std::string currentLogFile() const;

private:
    Logger() = default;
    ~Logger();
    
    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    
    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    /**
     * @brief Keep only the newest m_max_log_files Hotify log files
     */
    void removeOldLogFiles();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists, falling back to the current directory
     */
    void ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Hotify::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Hotify::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Hotify::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Hotify::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Hotify::Logger::getInstance().critical(component, message)

} // namespace Hotify
