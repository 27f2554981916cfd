/**
 * @file errors.hpp
 * @brief Error taxonomy raised by the sandbox pipeline
 *
 * Every failure leaving the pipeline is one of:
 * - InfrastructureError: runtime unreachable, pull/create/start/inspect/remove
 *   failure, unknown post-execution state
 * - ResourceLimitViolation: container killed for exceeding its memory ceiling
 * - ExecutionIOError: attaching to or reading from the container failed
 *
 * Raw runtime exceptions are always wrapped into one of these; the wrapped
 * message is kept in cause().
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sandrun {
namespace core {

/**
 * @class SandboxError
 * @brief Base of all errors raised by the pipeline
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(Termination termination, const std::string& message,
                 const std::string& cause = "")
        : std::runtime_error(cause.empty() ? message : message + " (" + cause + ")")
        , termination_(termination)
        , cause_(cause) {}

    Termination termination() const { return termination_; }

    /// Message of the wrapped runtime error, empty if none
    const std::string& cause() const { return cause_; }

    /**
     * @brief Output captured before the failure, if the Runner completed
     *
     * Set when teardown fails after a successful execution so that callers can
     * still present what the code printed.
     */
    const std::optional<ExecutionResult>& captured() const { return captured_; }

    void set_captured(ExecutionResult result) { captured_ = std::move(result); }

private:
    Termination termination_;
    std::string cause_;
    std::optional<ExecutionResult> captured_;
};

class InfrastructureError : public SandboxError {
public:
    explicit InfrastructureError(const std::string& message, const std::string& cause = "")
        : SandboxError(Termination::INFRASTRUCTURE_ERROR, message, cause) {}
};

class ResourceLimitViolation : public SandboxError {
public:
    explicit ResourceLimitViolation(const std::string& message = "Container memory limit exceeded")
        : SandboxError(Termination::RESOURCE_LIMIT, message) {}
};

class ExecutionIOError : public SandboxError {
public:
    explicit ExecutionIOError(const std::string& message, const std::string& cause = "")
        : SandboxError(Termination::EXECUTION_ERROR, message, cause) {}
};

} // namespace core
} // namespace sandrun
