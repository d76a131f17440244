// =================================================================
// include/Hotify/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Hotify/CliParser.hpp"
#include "Hotify/HotifyConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Hotify {
    class HotFolderLayout;
    class HotFolderEngine;
    class FileWatcher;
    struct EngineOptions;
}

namespace Hotify {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Loads the configuration, prepares the hot folders and watches
     *        them until SIGINT or SIGTERM.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    bool loadConfiguration();
    void setupLogging();
    EngineOptions buildEngineOptions() const;
    bool startWatching();
    void runInitialScan();
    int waitForShutdownSignal();
    void shutdown();

    std::string resolveConfigPath() const;

    const Commands& m_commands;
    HotifyConfig m_config;
    EnvironmentRegistryPtr m_registry;
    std::unique_ptr<HotFolderLayout> m_layout;
    std::unique_ptr<HotFolderEngine> m_engine;
    std::unique_ptr<FileWatcher> m_watcher;
};

} // namespace Hotify
