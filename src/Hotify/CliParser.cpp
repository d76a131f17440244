// =================================================================
// src/Hotify/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Hotify/CliParser.hpp"

namespace Hotify {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Hotify: creates hot folder environments in BASE_PATH based on the configuration "
        "file (hotify.yml) and runs their shell commands on arriving files.");
    
    m_app->add_option("base_path", m_commands.base_path, "Directory that receives the hot and output folders")
        ->check(CLI::ExistingDirectory);
    m_app->add_option("--config", m_commands.config_path, "Configuration file (default: BASE_PATH/hotify.yml)")
        ->check(CLI::ExistingFile);
    m_app->add_flag("-c,--clean", m_commands.clean_on_exit, "Clean the hot folder on exit");
    m_app->add_flag("--cleanup-inputs", m_commands.cleanup_inputs,
                    "Delete input files after their commands succeeded");
    m_app->add_flag("--no-initial-run", m_commands.no_initial_run,
                    "Do not process files already waiting in hot folders");
    m_app->add_option("--delay", m_commands.delay_seconds,
                      "Batch settle delay in seconds (overrides the configuration)")
        ->check(CLI::NonNegativeNumber);
    
    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output");
    auto* quiet = m_app->add_flag("-q,--quiet", m_commands.quiet, "Only show warnings and errors");
    verbose->excludes(quiet);
    m_app->add_flag("--no-log-file", m_commands.no_log_file, "Log to the console only");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace Hotify
