// =================================================================
// include/Hotify/HotifyConfig.hpp
// =================================================================
// Configuration structure for hotify.yml and its command-line overrides.

#pragma once

#include "Hotify/Environment.hpp"
#include <string>
#include <vector>

namespace Hotify {

/**
 * @brief One environment entry as written in the configuration file
 */
struct EnvironmentConfig {
    std::string name;
    std::vector<std::string> patterns;   ///< in_pattern: string or list
    std::vector<std::string> triggers;   ///< trigger: string or list (chain)
};

/**
 * @brief Settings loaded from hotify.yml
 */
struct HotifyConfig {
    // Layout
    std::string hot_folder_name;
    std::string output_folder_name;

    // Engine tunables
    double batch_delay_seconds = -1.0;     ///< hotify_input_multiple_files_delay
    bool cleanup_inputs = false;           ///< hotify_cleanup_input_files
    size_t file_settle_interval_ms = 200;  ///< hotify_file_settle_interval_ms

    // Logging
    std::string log_dir = ".hotify/logs";

    std::vector<EnvironmentConfig> environments;

    /**
     * @brief Load configuration from a YAML file
     * @param config_path Path to hotify.yml
     * @return The loaded settings, not yet validated
     * @throws ConfigurationError if the file cannot be read or has the wrong shape
     */
    static HotifyConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Load configuration from YAML text
     * @throws ConfigurationError if the text cannot be parsed or has the wrong shape
     */
    static HotifyConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Check every setting
     * @return One message per problem; empty when the configuration is valid
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Suspicious but accepted settings
     */
    std::vector<std::string> warnings() const;

    /**
     * @brief Build the immutable environment registry
     * @throws ConfigurationError if an environment is invalid
     */
    EnvironmentRegistryPtr buildRegistry() const;
};

} // namespace Hotify
