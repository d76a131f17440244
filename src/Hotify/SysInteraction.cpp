// =================================================================
// src/Hotify/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Hotify/SysInteraction.hpp"
#include "Hotify/Errors.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/wait.h>

namespace Hotify {

ProcessOutcome SysInteraction::runShellCommand(const std::string& command) {
    // Group the command so the redirections apply to every part of it
    std::string full_command = "{ " + command + "\n} </dev/null 2>&1";
    
    errno = 0;
    FILE* raw_pipe = popen(full_command.c_str(), "re");
    if (raw_pipe == nullptr) {
        std::string reason = errno != 0 ? std::strerror(errno) : "popen failed";
        throw ProcessSpawnError("Failed to start shell for '" + command + "': " + reason);
    }
    std::unique_ptr<FILE, decltype(&pclose)> pipe(raw_pipe, pclose);
    
    std::array<char, 256> buffer;
    ProcessOutcome outcome;
    size_t bytes_read = 0;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        outcome.output.append(buffer.data(), bytes_read);
    }
    
    int status = pclose(pipe.release());
    if (status == -1) {
        throw ProcessSpawnError("Failed to wait for '" + command + "': " + std::strerror(errno));
    }
    
    // pclose returns the raw wait status
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signaled = true;
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }
    
    return outcome;
}

bool SysInteraction::removeFile(const std::string& file_path, std::string& error_message) {
    std::error_code ec;
    if (!std::filesystem::remove(file_path, ec)) {
        error_message = ec ? ec.message() : "file does not exist";
        return false;
    }
    return true;
}

} // namespace Hotify
