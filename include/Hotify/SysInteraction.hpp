// =================================================================
// include/Hotify/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations: running shell
// commands and removing consumed files.

#pragma once

#include <string>

namespace Hotify {

/**
 * @brief Result of one finished shell command
 */
struct ProcessOutcome {
    std::string output;     ///< Combined stdout and stderr
    int exit_code = 0;      ///< Exit status, or 128 + signal number when killed
    bool signaled = false;  ///< True if the process was terminated by a signal
};

class SysInteraction {
public:
    virtual ~SysInteraction() = default;

    /**
     * @brief Runs a command through /bin/sh and waits for it to finish.
     * @param command The fully rendered command line.
     * @return Captured output and exit status.
     * @throws ProcessSpawnError if the shell could not be started.
     */
    virtual ProcessOutcome runShellCommand(const std::string& command);

    /**
     * @brief Deletes a regular file.
     * @param file_path The file to delete.
     * @param error_message Receives the reason on failure.
     * @return True if the file was removed.
     */
    virtual bool removeFile(const std::string& file_path, std::string& error_message);
};

} // namespace Hotify
