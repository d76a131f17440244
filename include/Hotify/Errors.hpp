// =================================================================
// include/Hotify/Errors.hpp
// =================================================================
// Error taxonomy shared by the environment engine.

#pragma once

#include <stdexcept>
#include <string>

namespace Hotify {

/**
 * @brief Kinds of failure the engine can report
 *
 * None of these is fatal for the process. Each one is local to a single
 * file or a single invocation.
 */
enum class ErrorKind {
    UnmatchedFile,       ///< No environment pattern matches the file
    ConfigurationError,  ///< Ambiguous or unresolvable template variables
    ProcessSpawnError,   ///< The command could not be started
    ProcessExitError,    ///< A chain step exited with a non-zero status
    CleanupError         ///< A consumed input could not be deleted
};

/**
 * @brief Get a printable name for an error kind
 */
std::string errorKindName(ErrorKind kind);

/**
 * @brief Base class for all exceptions thrown by Hotify
 */
class HotifyError : public std::runtime_error {
public:
    HotifyError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief Invalid configuration or template (aborts one invocation, or
 *        startup when raised while loading the configuration file)
 */
class ConfigurationError : public HotifyError {
public:
    explicit ConfigurationError(const std::string& message)
        : HotifyError(ErrorKind::ConfigurationError, message) {}
};

/**
 * @brief The shell for a chain step could not be started
 */
class ProcessSpawnError : public HotifyError {
public:
    explicit ProcessSpawnError(const std::string& message)
        : HotifyError(ErrorKind::ProcessSpawnError, message) {}
};

} // namespace Hotify
