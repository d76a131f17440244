// =================================================================
// include/Hotify/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Hotify {

// A simple struct to hold parsed command information.
struct Commands {
    std::string base_path = ".";   // Where the hot folder and output folder are created
    std::string config_path;       // Defaults to <base_path>/hotify.yml

    bool clean_on_exit = false;    // Remove the hot-folder tree on exit
    bool cleanup_inputs = false;   // Delete consumed inputs after success
    bool no_initial_run = false;   // Skip re-evaluating files already waiting
    double delay_seconds = -1.0;   // Overrides the configured batch delay unless negative

    bool verbose = false;
    bool quiet = false;
    bool no_log_file = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Hotify
