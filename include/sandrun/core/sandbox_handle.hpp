/**
 * @file sandbox_handle.hpp
 * @brief Exclusive ownership of one running sandbox container
 *
 * @date 2025
 */

#pragma once

#include "sandrun/runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace sandrun {
namespace core {

/**
 * @class SandboxHandle
 * @brief A provisioned container and the runtime that owns it
 *
 * Move-only. Created by SandboxProvisioner, consumed by an ExecutionRunner
 * and released by SandboxReaper within a single pipeline call.
 *
 * A handle destroyed without having been released (which the pipeline never
 * does) kills and removes its container on a best-effort basis and logs what
 * went wrong, so no container outlives its request.
 */
class SandboxHandle {
public:
    SandboxHandle(std::shared_ptr<runtime::ContainerRuntime> runtime,
                  std::string container_id,
                  std::filesystem::path mount_path);

    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    SandboxHandle(SandboxHandle&& other) noexcept;
    SandboxHandle& operator=(SandboxHandle&& other) noexcept;

    const std::string& GetContainerId() const { return container_id_; }

    /// Path of the submission inside the container (also its working directory)
    const std::filesystem::path& GetMountPath() const { return mount_path_; }

    runtime::ContainerRuntime& GetRuntime() const { return *runtime_; }

    bool IsReleased() const { return released_; }

    /// Called by the reaper before it starts tearing the container down
    void MarkReleased() { released_ = true; }

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;  ///< Runtime client
    std::string container_id_;                            ///< Runtime-assigned ID
    std::filesystem::path mount_path_;                    ///< Mount point in container
    bool released_{false};                                ///< Reaper took over

    void ReleaseQuietly() noexcept;
};

} // namespace core
} // namespace sandrun
