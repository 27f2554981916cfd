/**
 * @file javascript_runner.cpp
 * @brief Implementation of the JavaScript runner
 *
 * @date 2025
 */

#include "sandrun/runners/javascript_runner.hpp"

#include <utility>

namespace sandrun {
namespace runners {

JavaScriptRunner::JavaScriptRunner(std::vector<std::string> interpreter,
                                   std::string entry_file,
                                   OutputLimits limits)
    : InterpreterRunner(std::move(interpreter), {"node"}, std::move(entry_file), limits) {
}

} // namespace runners
} // namespace sandrun
