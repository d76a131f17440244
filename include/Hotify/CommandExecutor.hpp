// =================================================================
// include/Hotify/CommandExecutor.hpp
// =================================================================
// Runs a rendered command chain and cleans up consumed inputs.

#pragma once

#include "Hotify/Invocation.hpp"
#include "Hotify/SysInteraction.hpp"
#include <functional>
#include <memory>

namespace Hotify {

/**
 * @brief Executes rendered invocations step by step
 *
 * Steps run strictly in order. The first step that cannot be started or
 * exits non-zero aborts the rest of the chain and the inputs are kept for
 * manual inspection. Earlier steps are not rolled back. On success, and
 * if cleanup is enabled, every consumed input is deleted; a deletion
 * failure is reported but does not turn the invocation into a failure.
 *
 * The executor holds no per-invocation state and may be shared by
 * concurrent workers.
 */
class CommandExecutor {
public:
    /**
     * @brief Callback invoked on every state transition
     * @param state The state entered
     * @param step Zero-based chain step for Executing and Failed, 0 otherwise
     */
    using StateObserver = std::function<void(const CommandInvocation&, InvocationState state, size_t step)>;

    /**
     * @brief Construct an executor
     * @param sys System access used to run commands and delete files
     * @param cleanup_inputs Delete consumed inputs after a successful chain
     */
    CommandExecutor(std::shared_ptr<SysInteraction> sys, bool cleanup_inputs);

    /**
     * @brief Run an invocation to completion
     * @param invocation The rendered chain
     * @return Success with the produced output, or failure with the failing step
     */
    ExecutionResult execute(const CommandInvocation& invocation) const;

    void setStateObserver(StateObserver observer);

    bool isCleanupEnabled() const { return m_cleanup_inputs; }

private:
    /**
     * @brief Delete consumed inputs and record the outcome on the result
     */
    void cleanupInputs(const CommandInvocation& invocation, ExecutionResult& result) const;

    void notify(const CommandInvocation& invocation, InvocationState state, size_t step) const;

    std::shared_ptr<SysInteraction> m_sys;
    bool m_cleanup_inputs;
    StateObserver m_observer;
};

} // namespace Hotify
