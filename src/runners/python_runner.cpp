/**
 * @file python_runner.cpp
 * @brief Implementation of the Python runner
 *
 * @date 2025
 */

#include "sandrun/runners/python_runner.hpp"

#include <utility>

namespace sandrun {
namespace runners {

PythonRunner::PythonRunner(std::vector<std::string> interpreter,
                           std::string entry_file,
                           OutputLimits limits)
    : InterpreterRunner(std::move(interpreter), {"python3", "-B"}, std::move(entry_file), limits) {
}

} // namespace runners
} // namespace sandrun
