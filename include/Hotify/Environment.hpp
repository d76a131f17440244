// =================================================================
// include/Hotify/Environment.hpp
// =================================================================
// Environment definitions and the read-only registry that holds them.

#pragma once

#include "Hotify/GlobPattern.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Hotify {

/**
 * @brief How an environment consumes arriving files
 */
enum class TriggerMode {
    SingleFile,  ///< Every file fires its own invocation ({in_file})
    Batch        ///< Files are accumulated and fired together ({in_files})
};

std::string triggerModeName(TriggerMode mode);

/**
 * @brief Placeholder variables referenced by a command chain
 */
struct TemplateVariables {
    bool in_file = false;
    bool in_files = false;
    bool out_file = false;

    /**
     * @brief Scan one command template for recognized placeholders
     */
    static TemplateVariables scan(const std::string& command_template);

    /**
     * @brief Union of the variables of every template in a chain
     */
    static TemplateVariables scan(const std::vector<std::string>& command_chain);
};

/**
 * @brief A named hot-folder rule: patterns that claim files and the chain they trigger
 *
 * Immutable once constructed. The name doubles as the hot-folder directory name.
 */
class Environment {
public:
    /**
     * @brief Construct and validate an environment
     * @param name Unique name, also the directory name of the hot folder
     * @param patterns Glob patterns matched against file base names
     * @param commands Command chain (at least one template)
     * @throws ConfigurationError on an empty name, no patterns or no commands
     */
    Environment(std::string name, const std::vector<std::string>& patterns,
                std::vector<std::string> commands);

    const std::string& getName() const { return m_name; }
    const GlobPatternSet& getPatterns() const { return m_patterns; }
    const std::vector<std::string>& getCommands() const { return m_commands; }
    const TemplateVariables& getVariables() const { return m_variables; }

    /**
     * @brief Batch if any template references {in_files}, single-file otherwise
     */
    TriggerMode getMode() const;

    /**
     * @brief True when the chain mixes {in_file} and {in_files}
     *
     * Such an environment is treated as batch mode and {in_file} renders empty.
     */
    bool isAmbiguous() const { return m_variables.in_file && m_variables.in_files; }

    /**
     * @brief Check whether the file's base name matches any of the patterns
     */
    bool matches(const std::string& file_path) const;

private:
    std::string m_name;
    GlobPatternSet m_patterns;
    std::vector<std::string> m_commands;
    TemplateVariables m_variables;
};

/**
 * @brief Ordered, immutable collection of environments
 *
 * Built once at configuration load and shared read-only by all workers.
 */
class EnvironmentRegistry {
public:
    /**
     * @brief Build the registry
     * @param environments Environments in declaration order
     * @throws ConfigurationError on duplicate names
     */
    explicit EnvironmentRegistry(std::vector<Environment> environments);

    /**
     * @brief Look up an environment by name
     * @return Pointer into the registry, or nullptr if no such environment exists
     */
    const Environment* find(const std::string& name) const;

    const std::vector<Environment>& getEnvironments() const { return m_environments; }
    size_t size() const { return m_environments.size(); }
    bool empty() const { return m_environments.empty(); }

private:
    std::vector<Environment> m_environments;
};

using EnvironmentRegistryPtr = std::shared_ptr<const EnvironmentRegistry>;

} // namespace Hotify
