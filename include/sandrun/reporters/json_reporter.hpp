/**
 * @file json_reporter.hpp
 * @brief Machine-readable rendering of execution results and sandbox errors
 *
 * Used by the CLI's `--json` mode. Program output is arbitrary bytes, so
 * invalid UTF-8 is replaced with U+FFFD rather than rejected.
 *
 * **Result Format**:
 * ```json
 * {
 *   "stdout": "hello",
 *   "stderr": "",
 *   "exit_code": 0,
 *   "stdout_truncated": false,
 *   "stderr_truncated": false
 * }
 * ```
 *
 * Errors render as `{"error": ..., "message": ..., "captured": <result>}`,
 * with `captured` present only when the error carries output.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/errors.hpp"
#include "sandrun/core/types.hpp"

#include <string>

namespace sandrun {
namespace reporters {

/**
 * @class JsonReporter
 * @brief Renders results and errors as JSON text
 */
class JsonReporter {
public:
    /// @param indent Spaces per level; negative gives compact output
    explicit JsonReporter(int indent = 2) : indent_(indent) {}

    std::string FormatResult(const core::ExecutionResult& result) const;

    std::string FormatError(const core::SandboxError& error) const;

private:
    int indent_;
};

} // namespace reporters
} // namespace sandrun
