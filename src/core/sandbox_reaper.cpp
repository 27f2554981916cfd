/**
 * @file sandbox_reaper.cpp
 * @brief Implementation of sandbox teardown
 *
 * **Error Precedence**:
 * ```
 * ResourceLimitViolation / unknown state (inspect)
 *   > kill failure
 *     > remove failure
 * ```
 * Lower-priority failures are logged and dropped.
 *
 * @date 2025
 */

#include "sandrun/core/sandbox_reaper.hpp"
#include "sandrun/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace sandrun {
namespace core {

void SandboxReaper::Teardown(SandboxHandle& handle) const {
    if (handle.IsReleased()) {
        throw InfrastructureError("Sandbox already torn down: " + handle.GetContainerId());
    }
    handle.MarkReleased();

    const std::string& container_id = handle.GetContainerId();
    runtime::ContainerRuntime& runtime = handle.GetRuntime();

    std::exception_ptr failure;

    try {
        KillContainer(runtime, container_id);
    }
    catch (const SandboxError& e) {
        spdlog::error("{}", e.what());
        failure = std::current_exception();
    }

    try {
        CheckExecutionState(runtime, container_id);
    }
    catch (const SandboxError&) {
        failure = std::current_exception();
    }

    try {
        RemoveContainer(runtime, container_id);
    }
    catch (const SandboxError& e) {
        if (failure) {
            spdlog::error("{}", e.what());
        } else {
            failure = std::current_exception();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void SandboxReaper::KillContainer(runtime::ContainerRuntime& runtime,
                                  const std::string& container_id) const {
    spdlog::debug("Killing container. ContainerId : {}", container_id);
    try {
        runtime.KillContainer(container_id);
    }
    catch (const std::exception& e) {
        throw InfrastructureError("Failed to kill container " + container_id, e.what());
    }
    spdlog::debug("Container killed. ContainerId : {}", container_id);
}

void SandboxReaper::CheckExecutionState(runtime::ContainerRuntime& runtime,
                                        const std::string& container_id) const {
    runtime::ContainerInfo info;
    try {
        info = runtime.InspectContainer(container_id);
    }
    catch (const std::exception& e) {
        throw InfrastructureError("Error occurred while checking after execution state", e.what());
    }

    if (!info.state) {
        spdlog::error("Container {} reported no state", container_id);
        throw InfrastructureError("Code execution failed with unknown state");
    }

    if (info.state->oom_killed) {
        spdlog::warn("Container {} exceeded its memory limit", container_id);
        throw ResourceLimitViolation();
    }

    spdlog::info("Interpreter execution completed on container {} (status: {}, exit code: {})",
                 container_id.substr(0, 12), info.state->status, info.state->exit_code);
}

void SandboxReaper::RemoveContainer(runtime::ContainerRuntime& runtime,
                                    const std::string& container_id) const {
    spdlog::debug("Removing container. ContainerId : {}", container_id);
    try {
        runtime.RemoveContainer(container_id);
    }
    catch (const std::exception& e) {
        throw InfrastructureError("Failed to remove container " + container_id, e.what());
    }
    spdlog::debug("Container removed. ContainerId : {}", container_id);
}

} // namespace core
} // namespace sandrun
