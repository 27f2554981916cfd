/**
 * @file process_utils.hpp
 * @brief Child process execution with separate stdout/stderr capture
 *
 * Used by the docker runtime client to drive the docker command-line tool.
 * Output is delivered as chunks through callbacks so that callers can bound
 * how much of it they keep.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandrun {
namespace utils {

/**
 * @brief Raised when a child process cannot be spawned or its pipes fail
 */
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct CommandResult
 * @brief Fully collected result of a short command
 */
struct CommandResult {
    int exit_code{0};       ///< Exit status (128 + signal when killed by a signal)
    std::string output;     ///< Captured stdout
    std::string error;      ///< Captured stderr

    bool Success() const { return exit_code == 0; }
};

/// Receives one chunk of bytes read from a child stream
using ChunkCallback = std::function<void(const char* data, std::size_t size)>;

/**
 * @brief Spawn @p argv and pump its stdout and stderr until both close
 *
 * The child inherits no stdin (it reads from /dev/null). Both pipes are
 * drained until EOF regardless of what the callbacks keep, so the child never
 * blocks on a full pipe.
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH
 * @param on_stdout Called for each stdout chunk (may be empty)
 * @param on_stderr Called for each stderr chunk (may be empty)
 * @return Exit status of the child (128 + signal number when signaled)
 *
 * @throws ProcessError if the process cannot be spawned, a pipe read fails,
 *         or the child cannot be reaped
 */
int RunProcess(const std::vector<std::string>& argv,
               const ChunkCallback& on_stdout,
               const ChunkCallback& on_stderr);

/**
 * @brief Run @p argv to completion and collect all of its output
 * @throws ProcessError on spawn or pipe failure
 */
CommandResult RunCommand(const std::vector<std::string>& argv);

} // namespace utils
} // namespace sandrun
