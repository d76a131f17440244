// =================================================================
// include/Hotify/TemplateRenderer.hpp
// =================================================================
// Substitutes placeholder variables into an environment's command chain.

#pragma once

#include "Hotify/Environment.hpp"
#include "Hotify/Invocation.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Hotify {

/**
 * @brief Variable bindings available for one invocation
 *
 * Single-file mode supplies in_file, batch mode supplies in_files.
 * out_file is optional; when absent it is derived by the output resolver.
 */
struct RenderContext {
    std::optional<std::string> in_file;
    std::optional<std::vector<std::string>> in_files;
    std::optional<std::string> out_file;

    static RenderContext forFile(const std::string& path);
    static RenderContext forBatch(const std::vector<std::string>& paths);
};

/**
 * @brief Derives out_file from the inputs of an invocation
 *
 * Called at most once per invocation, so the resulting path is stable for
 * every step of the chain.
 */
using OutputPathResolver =
    std::function<std::string(const Environment&, const std::vector<std::string>& inputs, TriggerMode mode)>;

/**
 * @brief Renders command templates into executable command strings
 * 
 * Recognized placeholders are {in_file}, {in_files} and {out_file}. Any
 * other {...} token is passed through unchanged. {in_file} and {out_file}
 * are substituted verbatim; {in_files} expands to every path wrapped in
 * double quotes and separated by a single space. In batch mode {in_file}
 * has no value and is removed from the command.
 */
class TemplateRenderer {
public:
    /**
     * @brief Construct a renderer
     * @param resolver Used when a chain references {out_file} and the context has none
     */
    explicit TemplateRenderer(OutputPathResolver resolver = nullptr);

    /**
     * @brief Render every template of an environment's chain with shared bindings
     * @param environment The owning environment
     * @param context Variable bindings for this invocation
     * @param instance Hot-folder instance recorded on the invocation
     * @return The rendered invocation
     * @throws ConfigurationError if a referenced variable cannot be bound
     */
    CommandInvocation render(const Environment& environment, const RenderContext& context,
                             const std::string& instance = "") const;

    /**
     * @brief Quote a path list for {in_files}
     */
    static std::string joinQuoted(const std::vector<std::string>& paths);

private:
    struct Bindings {
        std::optional<std::string> in_file;
        std::optional<std::string> in_files;
        std::optional<std::string> out_file;
    };

    /**
     * @brief Substitute the bindings into a single template
     * @param drop_in_file Render {in_file} as an empty string (batch mode)
     * @throws ConfigurationError for a recognized but unbound placeholder
     */
    std::string substitute(const std::string& command_template, const Bindings& bindings,
                           bool drop_in_file) const;

    OutputPathResolver m_resolver;
};

} // namespace Hotify
