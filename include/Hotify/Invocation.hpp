// =================================================================
// include/Hotify/Invocation.hpp
// =================================================================
// Records passed from the template renderer to the command executor.

#pragma once

#include "Hotify/Errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Hotify {

/**
 * @brief Lifecycle of a single invocation
 *
 * Pending -> Rendering -> Executing(step i) -> Succeeded | Failed(step i),
 * and Succeeded -> Cleaned when consumed inputs were removed.
 */
enum class InvocationState {
    Pending,
    Rendering,
    Executing,
    Succeeded,
    Failed,
    Cleaned
};

std::string invocationStateName(InvocationState state);

/**
 * @brief A fully rendered command chain, consumed exactly once by the executor
 */
struct CommandInvocation {
    std::string environment;                    ///< Owning environment name
    std::string instance;                       ///< Hot-folder instance the inputs came from
    std::vector<std::string> commands;          ///< Rendered chain, in execution order
    std::vector<std::string> consumed_inputs;   ///< Input files, in arrival order
    std::optional<std::string> produced_output; ///< Bound out_file, if the chain references it
};

/**
 * @brief Outcome of executing one invocation
 */
struct ExecutionResult {
    InvocationState state = InvocationState::Pending;
    std::optional<size_t> failed_step;          ///< Zero-based index of the failing chain step
    int exit_code = 0;                          ///< Exit status of the failing step
    std::optional<ErrorKind> error;             ///< ProcessSpawnError or ProcessExitError on failure
    std::string reason;                         ///< Human readable failure description
    std::string diagnostic_output;              ///< Captured stdout/stderr of the failing step
    std::optional<std::string> produced_output;
    std::vector<std::string> removed_inputs;    ///< Inputs deleted by cleanup
    std::vector<std::string> cleanup_errors;    ///< One message per input that could not be deleted

    bool succeeded() const {
        return state == InvocationState::Succeeded || state == InvocationState::Cleaned;
    }
};

} // namespace Hotify
