// =================================================================
// src/Hotify/Invocation.cpp
// =================================================================

#include "Hotify/Invocation.hpp"

namespace Hotify {

std::string invocationStateName(InvocationState state) {
    switch (state) {
        case InvocationState::Pending: return "Pending";
        case InvocationState::Rendering: return "Rendering";
        case InvocationState::Executing: return "Executing";
        case InvocationState::Succeeded: return "Succeeded";
        case InvocationState::Failed: return "Failed";
        case InvocationState::Cleaned: return "Cleaned";
        default: return "Unknown";
    }
}

} // namespace Hotify
