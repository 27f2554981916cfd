/**
 * @file execution_runner.cpp
 * @brief Bounded output capture shared by all runner variants
 *
 * @date 2025
 */

#include "sandrun/runners/execution_runner.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sandrun {
namespace runners {

using utils::StringUtils;

BoundedOutputCollector::BoundedOutputCollector(const OutputLimits& limits)
    : limits_(limits) {
    stdout_.reserve(limits_.stdout_bytes);
    stderr_.reserve(limits_.stderr_bytes);
}

void BoundedOutputCollector::OnStdout(const char* data, std::size_t size) {
    Append(stdout_, limits_.stdout_bytes, stdout_truncated_, data, size);
}

void BoundedOutputCollector::OnStderr(const char* data, std::size_t size) {
    Append(stderr_, limits_.stderr_bytes, stderr_truncated_, data, size);
}

namespace {

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

void BoundedOutputCollector::Append(std::string& buffer, std::size_t limit, bool& truncated,
                                    const char* data, std::size_t size) {
    if (truncated || size == 0) {
        return;
    }

    std::size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
    std::size_t take = std::min(room, size);
    buffer.append(data, take);
    if (take == size) {
        return;
    }
    truncated = true;

    // Cut landed inside a multi-byte UTF-8 sequence; drop its leading bytes
    if (IsContinuationByte(data[take])) {
        // A sequence has at most three continuation bytes
        for (int i = 0; i < 3 && !buffer.empty() && IsContinuationByte(buffer.back()); ++i) {
            buffer.pop_back();
        }
        if (!buffer.empty() && (static_cast<unsigned char>(buffer.back()) & 0xC0) == 0xC0) {
            buffer.pop_back();
        }
    }
}

core::ExecutionResult BoundedOutputCollector::ToResult(int exit_code) const {
    core::ExecutionResult result;
    result.stdout_output = StringUtils::Trim(stdout_);
    result.stderr_output = StringUtils::Trim(stderr_);
    result.stdout_truncated = stdout_truncated_;
    result.stderr_truncated = stderr_truncated_;
    result.exit_code = exit_code;
    result.termination = core::Termination::NORMAL;
    return result;
}

core::ExecutionResult RunInterpreter(const core::SandboxHandle& handle,
                                     const std::vector<std::string>& command,
                                     const OutputLimits& limits) {
    BoundedOutputCollector collector(limits);

    spdlog::debug("Running '{}' in {}", StringUtils::Join(command, " "),
                  handle.GetContainerId().substr(0, 12));

    int exit_code = 0;
    try {
        exit_code = handle.GetRuntime().AttachAndCollect(handle.GetContainerId(), command, collector);
    }
    catch (const runtime::RuntimeError& e) {
        throw core::ExecutionIOError("Interpreter exception occurred", e.what());
    }

    if (collector.IsStdoutTruncated() || collector.IsStderrTruncated()) {
        spdlog::debug("Output truncated (stdout: {}, stderr: {})",
                      collector.IsStdoutTruncated(), collector.IsStderrTruncated());
    }

    return collector.ToResult(exit_code);
}

InterpreterRunner::InterpreterRunner(std::vector<std::string> interpreter,
                                     std::vector<std::string> default_interpreter,
                                     std::string entry_file,
                                     OutputLimits limits)
    : interpreter_(interpreter.empty() ? std::move(default_interpreter) : std::move(interpreter))
    , entry_file_(std::move(entry_file))
    , limits_(limits) {
}

std::vector<std::string> InterpreterRunner::BuildCommand() const {
    std::vector<std::string> command = interpreter_;
    command.push_back(entry_file_);
    return command;
}

core::ExecutionResult InterpreterRunner::Execute(const core::SandboxHandle& handle) {
    return RunInterpreter(handle, BuildCommand(), limits_);
}

} // namespace runners
} // namespace sandrun
