/**
 * @file execution_pipeline.cpp
 * @brief Implementation of the sandbox execution pipeline
 *
 * **Guaranteed Cleanup**:
 * Once Provision() has returned a handle, the runner's outcome (result or
 * exception) is held aside, the reaper runs, and only then is the outcome
 * delivered. A failing Provision() throws before a handle exists, so neither
 * execute nor teardown is attempted.
 *
 * @date 2025
 */

#include "sandrun/core/execution_pipeline.hpp"
#include "sandrun/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace sandrun {
namespace core {

namespace {

std::unique_ptr<runners::ExecutionRunner> RequireRunner(
    std::unique_ptr<runners::ExecutionRunner> runner) {
    if (!runner) {
        throw std::invalid_argument("ExecutionPipeline requires a runner");
    }
    return runner;
}

} // anonymous namespace

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                     std::string image,
                                     ResourcePolicy policy,
                                     std::unique_ptr<runners::ExecutionRunner> runner)
    : policy_(std::move(policy))
    , runner_(RequireRunner(std::move(runner)))
    , provisioner_(std::move(runtime), std::move(image)) {

    spdlog::info("Execution pipeline ready: {} on {}", runner_->GetLanguage(), provisioner_.GetImage());
    spdlog::debug("Memory limit: {} bytes", policy_.memory_limit_bytes);
    spdlog::debug("Output limits: stdout {} bytes, stderr {} bytes",
                  policy_.stdout_limit_bytes, policy_.stderr_limit_bytes);
}

ExecutionResult ExecutionPipeline::Run(const std::filesystem::path& host_path,
                                       const std::filesystem::path& container_path) {
    ExecutionRequest request;
    request.host_source_path = host_path;
    request.container_mount_path = container_path;
    request.image = provisioner_.GetImage();
    return Run(request);
}

ExecutionResult ExecutionPipeline::Run(const ExecutionRequest& request) {
    spdlog::debug("Running {} submission from {}", runner_->GetLanguage(),
                  request.host_source_path.string());

    if (request.image != provisioner_.GetImage()) {
        throw InfrastructureError("Image " + request.image +
                                  " was not pulled by this pipeline (expected " +
                                  provisioner_.GetImage() + ")");
    }

    SandboxHandle handle = provisioner_.Provision(request, policy_);

    std::optional<ExecutionResult> result;
    std::exception_ptr execution_error;

    try {
        result = runner_->Execute(handle);
    }
    catch (const SandboxError& e) {
        spdlog::error("Execution failed in {}: {}", handle.GetContainerId().substr(0, 12), e.what());
        execution_error = std::current_exception();
    }
    catch (const std::exception& e) {
        spdlog::error("Execution failed in {}: {}", handle.GetContainerId().substr(0, 12), e.what());
        execution_error = std::make_exception_ptr(
            ExecutionIOError("Interpreter exception occurred", e.what()));
    }

    try {
        reaper_.Teardown(handle);
    }
    catch (ResourceLimitViolation& e) {
        if (result) {
            e.set_captured(*result);
        }
        throw;
    }
    catch (InfrastructureError& e) {
        if (execution_error) {
            spdlog::error("Teardown also failed: {}", e.what());
            std::rethrow_exception(execution_error);
        }
        if (result) {
            e.set_captured(*result);
        }
        throw;
    }

    if (execution_error) {
        std::rethrow_exception(execution_error);
    }

    spdlog::debug("Execution finished with exit code {}", result->exit_code);
    return std::move(*result);
}

} // namespace core
} // namespace sandrun
