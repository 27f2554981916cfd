/**
 * @file ruby_runner.hpp
 * @brief Ruby runner variant
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
 * @class RubyRunner
 * @brief Executes Ruby submissions
 */
class RubyRunner : public InterpreterRunner {
public:
    explicit RubyRunner(std::vector<std::string> interpreter = {},
                        std::string entry_file = "main.rb",
                        OutputLimits limits = OutputLimits{});

    std::string GetLanguage() const override { return "ruby"; }
};

} // namespace runners
} // namespace sandrun
