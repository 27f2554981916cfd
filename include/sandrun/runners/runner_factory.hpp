/**
 * @file runner_factory.hpp
 * @brief Selects the runner variant for a configured language
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/config.hpp"
#include "sandrun/runners/execution_runner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sandrun {
namespace runners {

/**
 * @brief Create the runner named by @p profile.runner
 *
 * The profile's command and entry file are passed through; output limits come
 * from @p policy.
 *
 * @throws core::ConfigError for an unknown runner variant
 */
std::unique_ptr<ExecutionRunner> CreateRunner(const core::LanguageProfile& profile,
                                              const core::ResourcePolicy& policy);

/// Runner variant names understood by CreateRunner
std::vector<std::string> SupportedRunners();

} // namespace runners
} // namespace sandrun
