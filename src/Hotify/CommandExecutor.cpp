// =================================================================
// src/Hotify/CommandExecutor.cpp
// =================================================================
// Implementation for command chain execution.

#include "Hotify/CommandExecutor.hpp"
#include "Hotify/Errors.hpp"
#include <stdexcept>

namespace Hotify {

namespace {

// Exit statuses the shell uses when it cannot run the command at all
constexpr int kShellNotExecutable = 126;
constexpr int kShellNotFound = 127;

} // namespace

CommandExecutor::CommandExecutor(std::shared_ptr<SysInteraction> sys, bool cleanup_inputs)
    : m_sys(std::move(sys)),
      m_cleanup_inputs(cleanup_inputs)
{
    if (!m_sys) {
        throw std::invalid_argument("CommandExecutor requires a SysInteraction");
    }
}

void CommandExecutor::setStateObserver(StateObserver observer) {
    m_observer = std::move(observer);
}

ExecutionResult CommandExecutor::execute(const CommandInvocation& invocation) const {
    ExecutionResult result;
    
    for (size_t step = 0; step < invocation.commands.size(); step++) {
        result.state = InvocationState::Executing;
        notify(invocation, result.state, step);
        
        const std::string& command = invocation.commands[step];
        ProcessOutcome outcome;
        try {
            outcome = m_sys->runShellCommand(command);
        } catch (const ProcessSpawnError& e) {
            result.state = InvocationState::Failed;
            result.failed_step = step;
            result.exit_code = -1;
            result.error = ErrorKind::ProcessSpawnError;
            result.reason = e.what();
            notify(invocation, result.state, step);
            return result;
        }
        
        if (outcome.exit_code != 0) {
            result.state = InvocationState::Failed;
            result.failed_step = step;
            result.exit_code = outcome.exit_code;
            result.diagnostic_output = outcome.output;
            
            if (!outcome.signaled &&
                (outcome.exit_code == kShellNotFound || outcome.exit_code == kShellNotExecutable)) {
                result.error = ErrorKind::ProcessSpawnError;
                result.reason = "step " + std::to_string(step + 1) + " could not be started";
            } else if (outcome.signaled) {
                result.error = ErrorKind::ProcessExitError;
                result.reason = "step " + std::to_string(step + 1) + " was terminated by signal " +
                                std::to_string(outcome.exit_code - 128);
            } else {
                result.error = ErrorKind::ProcessExitError;
                result.reason = "step " + std::to_string(step + 1) + " exited with code " +
                                std::to_string(outcome.exit_code);
            }
            notify(invocation, result.state, step);
            return result;
        }
    }
    
    result.state = InvocationState::Succeeded;
    result.produced_output = invocation.produced_output;
    notify(invocation, result.state, 0);
    
    if (m_cleanup_inputs) {
        cleanupInputs(invocation, result);
    }
    
    return result;
}

void CommandExecutor::cleanupInputs(const CommandInvocation& invocation, ExecutionResult& result) const {
    for (const auto& input : invocation.consumed_inputs) {
        // Never delete what the chain just produced
        if (invocation.produced_output && *invocation.produced_output == input) {
            continue;
        }
        
        std::string error_message;
        if (m_sys->removeFile(input, error_message)) {
            result.removed_inputs.push_back(input);
        } else {
            result.cleanup_errors.push_back(input + ": " + error_message);
        }
    }
    
    if (result.cleanup_errors.empty()) {
        result.state = InvocationState::Cleaned;
        notify(invocation, result.state, 0);
    }
}

void CommandExecutor::notify(const CommandInvocation& invocation, InvocationState state, size_t step) const {
    if (m_observer) {
        m_observer(invocation, state, step);
    }
}

} // namespace Hotify
