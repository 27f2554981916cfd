/**
 * @file sandbox_provisioner.cpp
 * @brief Implementation of sandbox container provisioning
 *
 * **Provisioning Workflow**:
 * 1. Validate request (image set, container path absolute, host path exists)
 * 2. Build isolation configuration from the resource policy
 * 3. Create container, log runtime warnings
 * 4. Start container (remove it again if start fails)
 *
 * @date 2025
 */

#include "sandrun/core/sandbox_provisioner.hpp"
#include "sandrun/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandrun {
namespace core {

SandboxProvisioner::SandboxProvisioner(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                       std::string image)
    : runtime_(std::move(runtime))
    , image_(std::move(image)) {

    if (!runtime_) {
        throw InfrastructureError("No container runtime configured");
    }
    if (image_.empty()) {
        throw InfrastructureError("No sandbox image configured");
    }

    try {
        runtime_->PullImage(image_);
    }
    catch (const runtime::RuntimeError& e) {
        spdlog::error("Failed to pull sandbox image {}: {}", image_, e.what());
        throw InfrastructureError("Failed to pull sandbox image " + image_, e.what());
    }
}

SandboxHandle SandboxProvisioner::Provision(const ExecutionRequest& request,
                                            const ResourcePolicy& policy) const {
    ValidateRequest(request);

    auto config = BuildContainerConfig(request, policy);

    runtime::ContainerCreation creation;
    try {
        creation = runtime_->CreateContainer(config);
    }
    catch (const runtime::RuntimeError& e) {
        throw InfrastructureError("Interpreter exception occurred while container starting", e.what());
    }

    for (const auto& warning : creation.warnings) {
        spdlog::warn("Container {}: {}", creation.id, warning);
    }

    try {
        runtime_->StartContainer(creation.id);
    }
    catch (const runtime::RuntimeError& e) {
        // Never started, so a plain remove is enough
        try {
            runtime_->RemoveContainer(creation.id);
        }
        catch (const runtime::RuntimeError& remove_error) {
            spdlog::error("Failed to remove container {} after start failure: {}",
                          creation.id, remove_error.what());
        }
        throw InfrastructureError("Interpreter exception occurred while container starting", e.what());
    }

    spdlog::info("Sandbox started: {} ({})", creation.id.substr(0, 12), request.image);

    return SandboxHandle(runtime_, creation.id, request.container_mount_path);
}

runtime::ContainerConfig SandboxProvisioner::BuildContainerConfig(const ExecutionRequest& request,
                                                                  const ResourcePolicy& policy) {
    runtime::ContainerConfig config;
    config.image = request.image;

    runtime::BindMount bind;
    bind.host_path = request.host_source_path;
    bind.container_path = request.container_mount_path;
    bind.read_only = policy.bind_read_only;
    config.binds.push_back(bind);

    config.memory_limit_bytes = policy.memory_limit_bytes;
    config.memory_swap_limit_bytes = policy.memory_limit_bytes;
    config.network_disabled = policy.network_disabled;
    config.open_stdin = policy.stdin_open;
    config.working_dir = request.container_mount_path;

    return config;
}

void SandboxProvisioner::ValidateRequest(const ExecutionRequest& request) const {
    if (request.image.empty()) {
        throw InfrastructureError("Execution request has no image");
    }

    if (!request.container_mount_path.is_absolute()) {
        throw InfrastructureError("Container path must be absolute: " +
                                  request.container_mount_path.string());
    }

    std::error_code ec;
    if (!request.host_source_path.is_absolute() ||
        !std::filesystem::exists(request.host_source_path, ec)) {
        throw InfrastructureError("Host source path not found: " +
                                  request.host_source_path.string());
    }
}

} // namespace core
} // namespace sandrun
