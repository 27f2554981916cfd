/**
 * @file javascript_runner.hpp
 * @brief JavaScript runner variant
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
 * @class JavaScriptRunner
 * @brief Executes JavaScript submissions
 *
 * Runs Node.js on the submission's entry module.
 */
class JavaScriptRunner : public InterpreterRunner {
public:
    explicit JavaScriptRunner(std::vector<std::string> interpreter = {},
                              std::string entry_file = "main.js",
                              OutputLimits limits = OutputLimits{});

    std::string GetLanguage() const override { return "javascript"; }
};

} // namespace runners
} // namespace sandrun
