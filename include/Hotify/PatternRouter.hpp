// =================================================================
// include/Hotify/PatternRouter.hpp
// =================================================================
// Maps an arriving file to the environment that owns it.

#pragma once

#include "Hotify/Environment.hpp"
#include <string>

namespace Hotify {

/**
 * @brief Selects the owning environment of a file by glob match on its base name
 *
 * Environments are tried in registry order and the first one with any
 * matching pattern wins. The router expects only "file is complete" events;
 * directories and temporary artifacts are filtered by the watcher.
 */
class PatternRouter {
public:
    explicit PatternRouter(EnvironmentRegistryPtr registry);

    /**
     * @brief Route a file across the whole registry
     * @param file_path Path of the arrived file
     * @return The owning environment, or nullptr when the file is unmatched
     */
    const Environment* route(const std::string& file_path) const;

    /**
     * @brief Route a file that arrived in a specific hot folder
     *
     * When hot_folder names a registered environment only that environment
     * is considered. Otherwise this behaves like route(file_path).
     *
     * @param file_path Path of the arrived file
     * @param hot_folder Name of the hot folder the file arrived in
     * @return The owning environment, or nullptr when the file is unmatched
     */
    const Environment* route(const std::string& file_path, const std::string& hot_folder) const;

private:
    EnvironmentRegistryPtr m_registry;
};

} // namespace Hotify
