// =================================================================
// src/Hotify/Errors.cpp
// =================================================================

#include "Hotify/Errors.hpp"

namespace Hotify {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnmatchedFile: return "UnmatchedFile";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::ProcessSpawnError: return "ProcessSpawnError";
        case ErrorKind::ProcessExitError: return "ProcessExitError";
        case ErrorKind::CleanupError: return "CleanupError";
        default: return "Unknown";
    }
}

} // namespace Hotify
