// =================================================================
// src/Hotify/HotifyConfig.cpp
// =================================================================
// Implementation for hotify.yml loading and validation.

#include "Hotify/HotifyConfig.hpp"
#include "Hotify/Errors.hpp"
#include "Hotify/GlobPattern.hpp"
#include <cmath>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace Hotify {

namespace {

const char* const kHotFolderKey = "hotify_hot_folder_name";
const char* const kOutputFolderKey = "hotify_output_folder_name";
const char* const kDelayKey = "hotify_input_multiple_files_delay";
const char* const kEnvironmentsKey = "hotify_environments";
const char* const kCleanupKey = "hotify_cleanup_input_files";
const char* const kSettleKey = "hotify_file_settle_interval_ms";
const char* const kLogDirKey = "hotify_log_dir";

// One week; keeps the millisecond conversion and timer deadlines in range
constexpr double kMaxDelaySeconds = 7.0 * 24.0 * 60.0 * 60.0;

// A scalar or a sequence of scalars
std::vector<std::string> readStringList(const YAML::Node& node, const std::string& what) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw ConfigurationError(what + " must contain only strings");
            }
            values.push_back(item.as<std::string>());
        }
    } else {
        throw ConfigurationError(what + " must be a string or a list of strings");
    }
    return values;
}

HotifyConfig parseRoot(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigurationError("Configuration root must be a mapping");
    }
    
    HotifyConfig config;
    for (const char* key : {kHotFolderKey, kOutputFolderKey, kDelayKey, kEnvironmentsKey}) {
        if (!root[key]) {
            throw ConfigurationError(std::string("Missing required key '") + key + "'");
        }
    }
    
    config.hot_folder_name = root[kHotFolderKey].as<std::string>();
    config.output_folder_name = root[kOutputFolderKey].as<std::string>();
    config.batch_delay_seconds = root[kDelayKey].as<double>();
    
    if (root[kCleanupKey]) {
        config.cleanup_inputs = root[kCleanupKey].as<bool>();
    }
    if (root[kSettleKey]) {
        config.file_settle_interval_ms = root[kSettleKey].as<size_t>();
    }
    if (root[kLogDirKey]) {
        config.log_dir = root[kLogDirKey].as<std::string>();
    }
    
    const YAML::Node environments = root[kEnvironmentsKey];
    if (!environments.IsSequence()) {
        throw ConfigurationError(std::string("'") + kEnvironmentsKey + "' must be a list");
    }
    
    for (size_t i = 0; i < environments.size(); i++) {
        const YAML::Node env_node = environments[i];
        const std::string where = std::string(kEnvironmentsKey) + "[" + std::to_string(i) + "]";
        if (!env_node.IsMap()) {
            throw ConfigurationError(where + " must be a mapping");
        }
        
        EnvironmentConfig env;
        if (env_node["name"]) {
            env.name = env_node["name"].as<std::string>();
        }
        if (env_node["in_pattern"]) {
            env.patterns = readStringList(env_node["in_pattern"], where + ".in_pattern");
        }
        if (env_node["trigger"]) {
            env.triggers = readStringList(env_node["trigger"], where + ".trigger");
        }
        config.environments.push_back(env);
    }
    
    return config;
}

} // namespace

HotifyConfig HotifyConfig::loadFromFile(const std::string& config_path) {
    try {
        return parseRoot(YAML::LoadFile(config_path));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration file '" + config_path + "': " + e.what());
    }
}

HotifyConfig HotifyConfig::loadFromString(const std::string& yaml_text) {
    try {
        return parseRoot(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse configuration: ") + e.what());
    }
}

std::vector<std::string> HotifyConfig::validate() const {
    std::vector<std::string> problems;
    
    if (hot_folder_name.empty()) {
        problems.push_back(std::string(kHotFolderKey) + " must not be empty");
    }
    if (output_folder_name.empty()) {
        problems.push_back(std::string(kOutputFolderKey) + " must not be empty");
    }
    if (!hot_folder_name.empty() && hot_folder_name == output_folder_name) {
        problems.push_back("hot folder and output folder must differ");
    }
    if (!std::isfinite(batch_delay_seconds)) {
        problems.push_back(std::string(kDelayKey) + " must be a finite number");
    } else if (batch_delay_seconds < 0.0) {
        problems.push_back(std::string(kDelayKey) + " must not be negative");
    } else if (batch_delay_seconds > kMaxDelaySeconds) {
        problems.push_back(std::string(kDelayKey) + " is too large (at most " +
                           std::to_string(static_cast<long long>(kMaxDelaySeconds)) + " seconds)");
    }
    if (environments.empty()) {
        problems.push_back(std::string(kEnvironmentsKey) + " must define at least one environment");
    }
    
    std::unordered_set<std::string> names;
    for (size_t i = 0; i < environments.size(); i++) {
        const auto& env = environments[i];
        const std::string where = env.name.empty()
            ? std::string(kEnvironmentsKey) + "[" + std::to_string(i) + "]"
            : "environment '" + env.name + "'";
        
        if (env.name.empty()) {
            problems.push_back(where + ": name is required");
        } else if (!names.insert(env.name).second) {
            problems.push_back(where + ": duplicate name");
        }
        if (env.patterns.empty()) {
            problems.push_back(where + ": in_pattern is required");
        }
        for (const auto& pattern : env.patterns) {
            try {
                GlobPattern check(pattern);
            } catch (const ConfigurationError& e) {
                problems.push_back(where + ": " + e.what());
            }
        }
        if (env.triggers.empty()) {
            problems.push_back(where + ": trigger is required");
        }
        for (const auto& trigger : env.triggers) {
            if (trigger.find_first_not_of(" \t\r\n") == std::string::npos) {
                problems.push_back(where + ": trigger must not be empty");
            }
        }
    }
    
    return problems;
}

std::vector<std::string> HotifyConfig::warnings() const {
    std::vector<std::string> found;
    for (const auto& env : environments) {
        TemplateVariables variables = TemplateVariables::scan(env.triggers);
        if (variables.in_file && variables.in_files) {
            found.push_back("environment '" + env.name +
                            "': trigger mixes {in_file} and {in_files}; running in batch mode and {in_file} renders empty");
        }
    }
    if (batch_delay_seconds == 0.0) {
        found.push_back("batch settle delay is 0; batches fire as soon as a file arrives");
    }
    return found;
}

EnvironmentRegistryPtr HotifyConfig::buildRegistry() const {
    std::vector<Environment> built;
    built.reserve(environments.size());
    for (const auto& env : environments) {
        built.emplace_back(env.name, env.patterns, env.triggers);
    }
    return std::make_shared<const EnvironmentRegistry>(std::move(built));
}

} // namespace Hotify
