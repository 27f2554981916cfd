/**
 * @file execution_runner.hpp
 * @brief Runner contract and bounded output capture
 *
 * A Runner knows how to invoke one language's interpreter inside a running
 * sandbox and collect what it prints. Every Runner bounds the captured
 * stdout and stderr independently: bytes past the ceiling are read and
 * dropped, so a runaway interpreter neither blocks nor grows memory.
 *
 * Runners do not impose a timeout. Execute() returns once the interpreter
 * exits or its streams close; a process that never does is ended by the
 * reaper's kill step.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/sandbox_handle.hpp"
#include "sandrun/core/types.hpp"
#include "sandrun/runtime/container_runtime.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sandrun {
namespace runners {

/**
 * @struct OutputLimits
 * @brief Byte ceilings of the captured streams
 */
struct OutputLimits {
    std::size_t stdout_bytes{core::ResourcePolicy::kDefaultOutputLimitBytes};
    std::size_t stderr_bytes{core::ResourcePolicy::kDefaultOutputLimitBytes};

    static OutputLimits FromPolicy(const core::ResourcePolicy& policy) {
        return OutputLimits{policy.stdout_limit_bytes, policy.stderr_limit_bytes};
    }
};

/**
 * @class ExecutionRunner
 * @brief Per-language execution strategy
 */
class ExecutionRunner {
public:
    virtual ~ExecutionRunner() = default;

    /**
     * @brief Run the submission mounted in @p handle and capture its output
     * @throws core::ExecutionIOError if attaching or reading fails
     */
    virtual core::ExecutionResult Execute(const core::SandboxHandle& handle) = 0;

    /// Language served by this runner
    virtual std::string GetLanguage() const = 0;
};

/**
 * @class BoundedOutputCollector
 * @brief OutputSink keeping at most N bytes of each stream
 */
class BoundedOutputCollector : public runtime::OutputSink {
public:
    explicit BoundedOutputCollector(const OutputLimits& limits);

    void OnStdout(const char* data, std::size_t size) override;
    void OnStderr(const char* data, std::size_t size) override;

    const std::string& GetStdout() const { return stdout_; }
    const std::string& GetStderr() const { return stderr_; }
    bool IsStdoutTruncated() const { return stdout_truncated_; }
    bool IsStderrTruncated() const { return stderr_truncated_; }

    /**
     * @brief Build the final result: bounded output, whitespace-trimmed
     * @param exit_code Exit code of the interpreter
     */
    core::ExecutionResult ToResult(int exit_code) const;

private:
    OutputLimits limits_;
    std::string stdout_;
    std::string stderr_;
    bool stdout_truncated_{false};
    bool stderr_truncated_{false};

    static void Append(std::string& buffer, std::size_t limit, bool& truncated,
                       const char* data, std::size_t size);
};

/**
 * @class InterpreterRunner
 * @brief Runner that executes `<interpreter...> <entry_file>` in the sandbox
 *
 * Language variants only supply their default interpreter and name.
 */
class InterpreterRunner : public ExecutionRunner {
public:
    core::ExecutionResult Execute(const core::SandboxHandle& handle) override;

    /// Full command executed inside the container
    std::vector<std::string> BuildCommand() const;

    const std::string& GetEntryFile() const { return entry_file_; }

protected:
    /**
     * @param interpreter Interpreter and flags; empty selects @p default_interpreter
     * @param default_interpreter Fallback interpreter for the language
     * @param entry_file Submission file, relative to the mount point
     * @param limits Output ceilings
     */
    InterpreterRunner(std::vector<std::string> interpreter,
                      std::vector<std::string> default_interpreter,
                      std::string entry_file,
                      OutputLimits limits);

private:
    std::vector<std::string> interpreter_;
    std::string entry_file_;
    OutputLimits limits_;
};

/**
 * @brief Run @p command in the sandbox and capture bounded output
 *
 * @throws core::ExecutionIOError if the runtime fails while attaching or
 *         reading
 */
core::ExecutionResult RunInterpreter(const core::SandboxHandle& handle,
                                     const std::vector<std::string>& command,
                                     const OutputLimits& limits);

} // namespace runners
} // namespace sandrun
