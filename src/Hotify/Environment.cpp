// =================================================================
// src/Hotify/Environment.cpp
// =================================================================

#include "Hotify/Environment.hpp"
#include "Hotify/Errors.hpp"
#include <unordered_set>

namespace Hotify {

std::string triggerModeName(TriggerMode mode) {
    return mode == TriggerMode::Batch ? "batch" : "single-file";
}

TemplateVariables TemplateVariables::scan(const std::string& command_template) {
    TemplateVariables variables;
    variables.in_file = command_template.find("{in_file}") != std::string::npos;
    variables.in_files = command_template.find("{in_files}") != std::string::npos;
    variables.out_file = command_template.find("{out_file}") != std::string::npos;
    return variables;
}

TemplateVariables TemplateVariables::scan(const std::vector<std::string>& command_chain) {
    TemplateVariables variables;
    for (const auto& command_template : command_chain) {
        TemplateVariables step = scan(command_template);
        variables.in_file = variables.in_file || step.in_file;
        variables.in_files = variables.in_files || step.in_files;
        variables.out_file = variables.out_file || step.out_file;
    }
    return variables;
}

Environment::Environment(std::string name, const std::vector<std::string>& patterns,
                         std::vector<std::string> commands)
    : m_name(std::move(name)),
      m_commands(std::move(commands))
{
    if (m_name.empty()) {
        throw ConfigurationError("Environment name must not be empty");
    }
    if (m_name == "." || m_name == ".." || m_name.find('/') != std::string::npos) {
        throw ConfigurationError("Environment name '" + m_name + "' is not a valid directory name");
    }
    if (patterns.empty()) {
        throw ConfigurationError("Environment '" + m_name + "' has no input patterns");
    }
    if (m_commands.empty()) {
        throw ConfigurationError("Environment '" + m_name + "' has no trigger command");
    }
    for (const auto& command : m_commands) {
        if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ConfigurationError("Environment '" + m_name + "' has an empty trigger command");
        }
    }
    
    for (const auto& pattern : patterns) {
        m_patterns.addPattern(pattern);
    }
    m_variables = TemplateVariables::scan(m_commands);
}

TriggerMode Environment::getMode() const {
    return m_variables.in_files ? TriggerMode::Batch : TriggerMode::SingleFile;
}

bool Environment::matches(const std::string& file_path) const {
    return m_patterns.matchesAny(file_path);
}

EnvironmentRegistry::EnvironmentRegistry(std::vector<Environment> environments)
    : m_environments(std::move(environments))
{
    std::unordered_set<std::string> names;
    for (const auto& environment : m_environments) {
        if (!names.insert(environment.getName()).second) {
            throw ConfigurationError("Duplicate environment name '" + environment.getName() + "'");
        }
    }
}

const Environment* EnvironmentRegistry::find(const std::string& name) const {
    for (const auto& environment : m_environments) {
        if (environment.getName() == name) {
            return &environment;
        }
    }
    return nullptr;
}

} // namespace Hotify
