// =================================================================
// src/Hotify/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Hotify/Core.hpp"
#include "Hotify/Errors.hpp"
#include "Hotify/FileWatcher.hpp"
#include "Hotify/HotFolderEngine.hpp"
#include "Hotify/HotFolderLayout.hpp"
#include "Hotify/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Hotify {

namespace {

// Self-pipe the signal handler writes the signal number into
int g_signal_pipe[2] = {-1, -1};

void onShutdownSignal(int signal_number) {
    const int saved_errno = errno;
    unsigned char byte = static_cast<unsigned char>(signal_number);
    ssize_t ignored = write(g_signal_pipe[1], &byte, 1);
    (void)ignored;
    errno = saved_errno;
}

bool installSignalHandlers() {
    if (g_signal_pipe[0] < 0 && pipe2(g_signal_pipe, O_CLOEXEC) != 0) {
        return false;
    }
    
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = onShutdownSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    
    for (int signal_number : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(signal_number, &action, nullptr) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands)
{
}

Core::~Core() = default;

int Core::run() {
    if (!installSignalHandlers()) {
        std::cerr << "[FATAL] Cannot install shutdown signal handlers: " << std::strerror(errno) << std::endl;
        return 1;
    }
    
    if (m_commands.verbose) {
        Logger::getInstance().setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_commands.quiet) {
        Logger::getInstance().setConsoleLogLevel(LogLevel::WARNING);
    }
    
    if (!loadConfiguration()) {
        return 1;
    }
    setupLogging();
    
    m_layout = std::make_unique<HotFolderLayout>(m_commands.base_path, m_config.hot_folder_name,
                                                 m_config.output_folder_name);
    try {
        m_layout->prepare(*m_registry);
    } catch (const fs::filesystem_error& e) {
        LOG_CRITICAL("Core", "Cannot create hot folders: " + std::string(e.what()));
        return 1;
    }
    
    const HotFolderLayout& layout = *m_layout;
    m_engine = std::make_unique<HotFolderEngine>(
        m_registry, buildEngineOptions(),
        [&layout](const Environment&, const std::vector<std::string>& inputs, TriggerMode mode) {
            return layout.outputPathFor(inputs, mode);
        });
    m_engine->start();
    
    if (!startWatching()) {
        shutdown();
        return 1;
    }
    
    if (!m_commands.no_initial_run) {
        runInitialScan();
    }
    
    int exit_code = waitForShutdownSignal();
    shutdown();
    return exit_code;
}

bool Core::loadConfiguration() {
    const std::string config_path = resolveConfigPath();
    
    try {
        m_config = HotifyConfig::loadFromFile(config_path);
    } catch (const ConfigurationError& e) {
        LOG_CRITICAL("Config", e.what());
        return false;
    }
    
    // Anything but the unset sentinel overrides; validate() rejects non-finite values
    if (!(m_commands.delay_seconds < 0.0)) {
        m_config.batch_delay_seconds = m_commands.delay_seconds;
    }
    if (m_commands.cleanup_inputs) {
        m_config.cleanup_inputs = true;
    }
    
    auto problems = m_config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            Logger::getInstance().error("Config", "Invalid configuration: " + problem, config_path);
        }
        return false;
    }
    for (const auto& warning : m_config.warnings()) {
        Logger::getInstance().warning("Config", warning, config_path);
    }
    
    try {
        m_registry = m_config.buildRegistry();
    } catch (const ConfigurationError& e) {
        Logger::getInstance().error("Config", "Invalid configuration: " + std::string(e.what()), config_path);
        return false;
    }
    
    Logger::getInstance().info("Config", "Configuration loaded",
        config_path + ", environments: " + std::to_string(m_registry->size()));
    for (const auto& environment : m_registry->getEnvironments()) {
        std::string patterns;
        for (const auto& pattern : environment.getPatterns().getPatterns()) {
            patterns += (patterns.empty() ? "" : " ") + pattern;
        }
        LOG_DEBUG("Config", environment.getName() + ": [" + patterns + "] " +
                  triggerModeName(environment.getMode()) + ", " +
                  std::to_string(environment.getCommands().size()) + " step(s)");
    }
    return true;
}

void Core::setupLogging() {
    if (m_commands.no_log_file) {
        return;
    }
    
    fs::path log_dir(m_config.log_dir);
    if (log_dir.is_relative()) {
        log_dir = fs::path(m_commands.base_path) / log_dir;
    }
    Logger::getInstance().initialize(log_dir.string());
}

EngineOptions Core::buildEngineOptions() const {
    EngineOptions options;
    options.batch_delay = std::chrono::milliseconds(
        static_cast<long long>(m_config.batch_delay_seconds * 1000.0));
    options.cleanup_inputs = m_config.cleanup_inputs;
    return options;
}

bool Core::startWatching() {
    try {
        m_watcher = std::make_unique<FileWatcher>(
            *m_layout, std::chrono::milliseconds(m_config.file_settle_interval_ms));
    } catch (const std::runtime_error& e) {
        LOG_CRITICAL("Core", "Cannot set up file notifications: " + std::string(e.what()));
        return false;
    }
    
    for (const auto& environment : m_registry->getEnvironments()) {
        if (!m_watcher->addWatchRecursive(m_layout->getEnvironmentFolder(environment.getName()))) {
            LOG_CRITICAL("Core", "Cannot watch hot folder of environment '" + environment.getName() + "'");
            return false;
        }
    }
    
    HotFolderEngine* engine = m_engine.get();
    m_watcher->start([engine](const FileEvent& event) { engine->onFileAppeared(event); });
    return true;
}

void Core::runInitialScan() {
    auto waiting = m_layout->existingFiles(*m_registry);
    if (waiting.empty()) {
        return;
    }
    
    Logger::getInstance().info("Core", "Processing files already waiting in hot folders",
                               "Files: " + std::to_string(waiting.size()));
    m_watcher->reportWaitingFiles(waiting);
}

int Core::waitForShutdownSignal() {
    for (;;) {
        unsigned char signal_number = 0;
        ssize_t n = read(g_signal_pipe[0], &signal_number, 1);
        if (n == 1) {
            Logger::getInstance().info("Core", "Shutting down", std::string("signal ") + strsignal(signal_number));
            return 0;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        LOG_ERROR("Core", "Signal pipe failed: " + std::string(n < 0 ? std::strerror(errno) : "closed"));
        return 1;
    }
}

void Core::shutdown() {
    if (m_watcher) {
        m_watcher->stop();
    }
    if (m_engine) {
        m_engine->shutdown();
    }
    if (m_commands.clean_on_exit && m_layout) {
        m_layout->clean();
    }
    Logger::getInstance().flush();
}

std::string Core::resolveConfigPath() const {
    if (!m_commands.config_path.empty()) {
        return m_commands.config_path;
    }
    return (fs::path(m_commands.base_path) / "hotify.yml").string();
}

} // namespace Hotify
