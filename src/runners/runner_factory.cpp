/**
 * @file runner_factory.cpp
 * @brief Runner variant selection
 *
 * @date 2025
 */

#include "sandrun/runners/runner_factory.hpp"
#include "sandrun/runners/javascript_runner.hpp"
#include "sandrun/runners/python_runner.hpp"
#include "sandrun/runners/ruby_runner.hpp"

#include <spdlog/spdlog.h>

namespace sandrun {
namespace runners {

std::unique_ptr<ExecutionRunner> CreateRunner(const core::LanguageProfile& profile,
                                              const core::ResourcePolicy& policy) {
    auto limits = OutputLimits::FromPolicy(policy);

    spdlog::debug("Creating '{}' runner for language '{}'", profile.runner, profile.name);

    if (profile.runner == "python") {
        return std::make_unique<PythonRunner>(profile.command, profile.entry_file, limits);
    }
    if (profile.runner == "javascript") {
        return std::make_unique<JavaScriptRunner>(profile.command, profile.entry_file, limits);
    }
    if (profile.runner == "ruby") {
        return std::make_unique<RubyRunner>(profile.command, profile.entry_file, limits);
    }

    throw core::ConfigError("Unknown runner '" + profile.runner +
                            "' for language '" + profile.name + "'");
}

std::vector<std::string> SupportedRunners() {
    return {"python", "javascript", "ruby"};
}

} // namespace runners
} // namespace sandrun
