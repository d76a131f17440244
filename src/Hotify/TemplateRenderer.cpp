// =================================================================
// src/Hotify/TemplateRenderer.cpp
// =================================================================
// Implementation for command template rendering.

#include "Hotify/TemplateRenderer.hpp"
#include "Hotify/Errors.hpp"
#include "Hotify/Logger.hpp"
#include <unordered_set>

namespace Hotify {

RenderContext RenderContext::forFile(const std::string& path) {
    RenderContext context;
    context.in_file = path;
    return context;
}

RenderContext RenderContext::forBatch(const std::vector<std::string>& paths) {
    RenderContext context;
    context.in_files = paths;
    return context;
}

TemplateRenderer::TemplateRenderer(OutputPathResolver resolver)
    : m_resolver(std::move(resolver))
{
}

CommandInvocation TemplateRenderer::render(const Environment& environment, const RenderContext& context,
                                           const std::string& instance) const {
    const TemplateVariables& variables = environment.getVariables();
    const TriggerMode mode = environment.getMode();
    
    CommandInvocation invocation;
    invocation.environment = environment.getName();
    invocation.instance = instance;
    
    Bindings bindings;
    if (mode == TriggerMode::Batch) {
        if (!context.in_files || context.in_files->empty()) {
            throw ConfigurationError("Environment '" + environment.getName() +
                                     "' references {in_files} but no input files were supplied");
        }
        std::unordered_set<std::string> seen;
        for (const auto& path : *context.in_files) {
            if (seen.insert(path).second) {
                invocation.consumed_inputs.push_back(path);
            }
        }
        bindings.in_files = joinQuoted(invocation.consumed_inputs);
        if (environment.isAmbiguous()) {
            LOG_WARNING(environment.getName(), "Chain mixes {in_file} and {in_files}; {in_file} renders empty");
        }
    } else {
        if (context.in_file) {
            bindings.in_file = *context.in_file;
            invocation.consumed_inputs.push_back(*context.in_file);
        } else if (variables.in_file) {
            throw ConfigurationError("Environment '" + environment.getName() +
                                     "' references {in_file} but no input file was supplied");
        }
    }
    
    if (variables.out_file) {
        if (context.out_file) {
            bindings.out_file = *context.out_file;
        } else if (m_resolver) {
            bindings.out_file = m_resolver(environment, invocation.consumed_inputs, mode);
        } else {
            throw ConfigurationError("Environment '" + environment.getName() +
                                     "' references {out_file} but no output path can be derived");
        }
        invocation.produced_output = bindings.out_file;
    }
    
    const bool drop_in_file = mode == TriggerMode::Batch;
    for (const auto& command_template : environment.getCommands()) {
        invocation.commands.push_back(substitute(command_template, bindings, drop_in_file));
    }
    
    return invocation;
}

std::string TemplateRenderer::joinQuoted(const std::vector<std::string>& paths) {
    std::string joined;
    for (size_t i = 0; i < paths.size(); i++) {
        if (i > 0) {
            joined += ' ';
        }
        joined += '"';
        for (char c : paths[i]) {
            // Characters that keep their meaning inside double quotes
            if (c == '"' || c == '\\' || c == '$' || c == '`') {
                joined += '\\';
            }
            joined += c;
        }
        joined += '"';
    }
    return joined;
}

std::string TemplateRenderer::substitute(const std::string& command_template, const Bindings& bindings,
                                         bool drop_in_file) const {
    std::string rendered;
    rendered.reserve(command_template.size());
    
    size_t pos = 0;
    while (pos < command_template.size()) {
        size_t open = command_template.find('{', pos);
        if (open == std::string::npos) {
            rendered.append(command_template, pos, std::string::npos);
            break;
        }
        size_t close = command_template.find('}', open + 1);
        if (close == std::string::npos) {
            rendered.append(command_template, pos, std::string::npos);
            break;
        }
        
        rendered.append(command_template, pos, open - pos);
        const std::string name = command_template.substr(open + 1, close - open - 1);
        if (name.find('{') != std::string::npos) {
            // Stray brace: keep it and rescan from the next character
            rendered += '{';
            pos = open + 1;
            continue;
        }
        const std::string token = command_template.substr(open, close - open + 1);
        
        if (name == "in_file" && drop_in_file) {
            // Batch mode has no single input; the token renders as nothing
            pos = close + 1;
            continue;
        }
        
        const std::optional<std::string>* binding = nullptr;
        if (name == "in_file") {
            binding = &bindings.in_file;
        } else if (name == "in_files") {
            binding = &bindings.in_files;
        } else if (name == "out_file") {
            binding = &bindings.out_file;
        }
        
        if (binding == nullptr) {
            // Not an engine variable: pass through unchanged
            rendered += token;
        } else if (!binding->has_value()) {
            throw ConfigurationError("Unresolved placeholder " + token + " in '" + command_template + "'");
        } else {
            rendered += **binding;
        }
        pos = close + 1;
    }
    
    return rendered;
}

} // namespace Hotify
