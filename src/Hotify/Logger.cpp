// =================================================================
// src/Hotify/Logger.cpp
// =================================================================
// Implementation for the hot-folder logging system.

#include "Hotify/Logger.hpp"
#include "Hotify/Invocation.hpp"
#include <algorithm>
#include <ctime>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace Hotify {

namespace {

const char* const kLogFilePrefix = "hotify_";

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log_dir = log_dir;
        m_max_log_size = max_log_size;
        m_max_log_files = max_log_files;
        m_current_log_size = 0;

        ensureLogDirectory();

        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        if (!m_current_log_file->is_open()) {
            std::cerr << "[ERROR] Cannot open log file: " << m_current_log_filename << std::endl;
            m_current_log_file.reset();
            m_current_log_filename.clear();
        }
    }
    
    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
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

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logInvocation(const std::string& environment, const CommandInvocation& invocation) {
    std::ostringstream context;
    context << "Steps: " << invocation.commands.size() << ", ";
    context << "Inputs: " << invocation.consumed_inputs.size();
    if (invocation.produced_output) {
        context << ", Output: " << *invocation.produced_output;
    }
    
    info(environment, "Invocation rendered", context.str());
    
    for (size_t i = 0; i < invocation.commands.size(); i++) {
        debug(environment, "Step " + std::to_string(i + 1) + ": " + invocation.commands[i]);
    }
}

void Logger::logExecutionResult(const std::string& environment, const ExecutionResult& result,
                                long duration_ms) {
    std::ostringstream context;
    context << "State: " << invocationStateName(result.state) << ", ";
    context << "Duration: " << duration_ms << "ms";
    
    if (result.succeeded()) {
        if (result.produced_output) {
            context << ", Output: " << *result.produced_output;
        }
        info(environment, "Invocation succeeded", context.str());
    } else {
        if (result.failed_step) {
            context << ", Step: " << (*result.failed_step + 1);
        }
        context << ", Exit code: " << result.exit_code;
        if (result.error) {
            context << ", Error: " << errorKindName(*result.error);
        }
        error(environment, "Invocation failed: " + result.reason, context.str());
        
        if (!result.diagnostic_output.empty()) {
            debug(environment, "Command output: " + result.diagnostic_output);
        }
    }
    
    for (const auto& removed : result.removed_inputs) {
        debug(environment, "Removed consumed input: " + removed);
    }
    for (const auto& cleanup_error : result.cleanup_errors) {
        warning(environment, "Cleanup failed", cleanup_error);
    }
}

void Logger::logUnmatched(const std::string& file_path) {
    warning("Router", "No environment matches file, leaving it untouched", file_path);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
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

std::string Logger::currentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_log_filename;
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }
    
    std::string formatted = formatEntry(entry, true);
    if (entry.level >= LogLevel::ERROR) {
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

    m_current_log_file.reset();
    
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        m_current_log_filename.clear();
    }
    
    removeOldLogFiles();
}

void Logger::removeOldLogFiles() {
    namespace fs = std::filesystem;
    
    // Only our own files; the log directory may be shared
    std::vector<fs::path> log_files;
    std::error_code ec;
    for (fs::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(kLogFilePrefix, 0) == 0 && it->path().extension() == ".log") {
            log_files.push_back(it->path());
        }
    }
    if (ec) {
        std::cerr << "[WARN] Cannot list log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return;
    }
    if (log_files.size() <= m_max_log_files) {
        return;
    }
    
    // File names carry the creation time, so name order is age order
    std::sort(log_files.begin(), log_files.end());
    const size_t excess = log_files.size() - m_max_log_files;
    for (size_t i = 0; i < excess; i++) {
        if (!fs::remove(log_files[i], ec) && ec) {
            std::cerr << "[WARN] Cannot remove old log file " << log_files[i] << ": " << ec.message() << std::endl;
        }
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;
    
    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    
    return oss.str();
}

void Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message()
                  << ", logging next to the working directory" << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    static unsigned sequence = 0;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
    localtime_r(&time_t, &local_time);
    
    // Rotations within the same second must not reopen the same file
    std::ostringstream filename;
    filename << m_log_dir << "/" << kLogFilePrefix;
    filename << std::put_time(&local_time, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(3) << (sequence++ % 1000);
    filename << ".log";
    
    return filename.str();
}

} // namespace Hotify
