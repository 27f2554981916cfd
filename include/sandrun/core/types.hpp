/**
 * @file types.hpp
 * @brief Request, policy and result types shared by the sandbox pipeline
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sandrun {
namespace core {

/**
 * @enum Termination
 * @brief How an execution ended
 */
enum class Termination {
    NORMAL,                ///< Interpreter ran to completion (any exit code)
    RESOURCE_LIMIT,        ///< Container killed for exceeding its memory ceiling
    EXECUTION_ERROR,       ///< Attaching to / reading from the container failed
    INFRASTRUCTURE_ERROR   ///< Runtime failure outside the user's code
};

/// Human-readable name of a termination classification
const char* TerminationToString(Termination termination);

/**
 * @struct ExecutionRequest
 * @brief One submission: where its code lives and which image runs it
 *
 * Constructed once per submission and not modified afterwards.
 */
struct ExecutionRequest {
    std::filesystem::path host_source_path;      ///< Absolute host path of the staged code
    std::filesystem::path container_mount_path;  ///< Where it appears in the sandbox
    std::string image;                           ///< Runtime image reference
};

/**
 * @struct ResourcePolicy
 * @brief Isolation and resource constraints applied to every sandbox
 */
struct ResourcePolicy {
    static constexpr std::int64_t kDefaultMemoryLimitBytes = 32 * 1024 * 1024;
    static constexpr std::size_t kDefaultOutputLimitBytes = 1024;

    std::int64_t memory_limit_bytes{kDefaultMemoryLimitBytes};  ///< Hard memory ceiling
    bool network_disabled{true};                                ///< Always true for this sandbox
    bool stdin_open{true};                                      ///< Keep container stdin open
    bool bind_read_only{true};                                  ///< Always true for this sandbox
    std::size_t stdout_limit_bytes{kDefaultOutputLimitBytes};   ///< Captured stdout ceiling
    std::size_t stderr_limit_bytes{kDefaultOutputLimitBytes};   ///< Captured stderr ceiling
};

/**
 * @struct ExecutionResult
 * @brief Bounded output of one execution
 *
 * stdout_output and stderr_output are always present (possibly empty), have
 * been cut to the policy's byte ceiling and are whitespace-trimmed.
 */
struct ExecutionResult {
    std::string stdout_output;                ///< Captured stdout
    std::string stderr_output;                ///< Captured stderr
    int exit_code{0};                         ///< Interpreter exit code
    bool stdout_truncated{false};             ///< stdout exceeded its ceiling
    bool stderr_truncated{false};             ///< stderr exceeded its ceiling
    Termination termination{Termination::NORMAL};
};

/**
 * @class PolicyBuilder
 * @brief Fluent API for constructing resource policies
 *
 * **Usage Example**:
 * @code
 * auto policy = PolicyBuilder()
 *     .WithMemoryLimit(64 * 1024 * 1024)
 *     .WithOutputLimits(4096, 1024)
 *     .Build();
 * @endcode
 */
class PolicyBuilder {
public:
    PolicyBuilder& WithMemoryLimit(std::int64_t bytes) {
        policy_.memory_limit_bytes = bytes;
        return *this;
    }

    PolicyBuilder& WithOutputLimits(std::size_t stdout_bytes, std::size_t stderr_bytes) {
        policy_.stdout_limit_bytes = stdout_bytes;
        policy_.stderr_limit_bytes = stderr_bytes;
        return *this;
    }

    PolicyBuilder& WithStdinOpen(bool open = true) {
        policy_.stdin_open = open;
        return *this;
    }

    ResourcePolicy Build() const {
        return policy_;
    }

private:
    ResourcePolicy policy_;  ///< Policy being built
};

} // namespace core
} // namespace sandrun
