/**
 * @file sandbox_handle.cpp
 * @brief Implementation of sandbox container ownership
 *
 * @date 2025
 */

#include "sandrun/core/sandbox_handle.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandrun {
namespace core {

SandboxHandle::SandboxHandle(std::shared_ptr<runtime::ContainerRuntime> runtime,
                             std::string container_id,
                             std::filesystem::path mount_path)
    : runtime_(std::move(runtime))
    , container_id_(std::move(container_id))
    , mount_path_(std::move(mount_path)) {
}

SandboxHandle::~SandboxHandle() {
    ReleaseQuietly();
}

SandboxHandle::SandboxHandle(SandboxHandle&& other) noexcept
    : runtime_(std::move(other.runtime_))
    , container_id_(std::move(other.container_id_))
    , mount_path_(std::move(other.mount_path_))
    , released_(other.released_) {
    other.released_ = true;
}

SandboxHandle& SandboxHandle::operator=(SandboxHandle&& other) noexcept {
    if (this != &other) {
        ReleaseQuietly();
        runtime_ = std::move(other.runtime_);
        container_id_ = std::move(other.container_id_);
        mount_path_ = std::move(other.mount_path_);
        released_ = other.released_;
        other.released_ = true;
    }
    return *this;
}

void SandboxHandle::ReleaseQuietly() noexcept {
    if (released_ || !runtime_ || container_id_.empty()) {
        return;
    }
    released_ = true;

    spdlog::warn("Sandbox {} was not torn down, removing it", container_id_);

    try {
        runtime_->KillContainer(container_id_);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to kill abandoned container {}: {}", container_id_, e.what());
    }

    try {
        runtime_->RemoveContainer(container_id_);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to remove abandoned container {}: {}", container_id_, e.what());
    }
}

} // namespace core
} // namespace sandrun
