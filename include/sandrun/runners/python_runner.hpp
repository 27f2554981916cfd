/**
 * @file python_runner.hpp
 * @brief Python runner variant
 *
 * @date 2025
 */

#pragma once

#include "sandrun/runners/execution_runner.hpp"

#include <string>
#include <vector>

namespace sandrun {
namespace runners {

/**
 * @class PythonRunner
 * @brief Executes Python submissions
 *
 * Runs CPython on the submission's entry script. `-B` keeps the interpreter
 * from writing bytecode caches, which the read-only mount would reject.
 */
class PythonRunner : public InterpreterRunner {
public:
    explicit PythonRunner(std::vector<std::string> interpreter = {},
                          std::string entry_file = "main.py",
                          OutputLimits limits = OutputLimits{});

    std::string GetLanguage() const override { return "python"; }
};

} // namespace runners
} // namespace sandrun
