/**
 * @file ruby_runner.cpp
 * @brief Implementation of the Ruby runner
 *
 * @date 2025
 */

#include "sandrun/runners/ruby_runner.hpp"

#include <utility>

namespace sandrun {
namespace runners {

RubyRunner::RubyRunner(std::vector<std::string> interpreter,
                       std::string entry_file,
                       OutputLimits limits)
    : InterpreterRunner(std::move(interpreter), {"ruby"}, std::move(entry_file), limits) {
}

} // namespace runners
} // namespace sandrun
