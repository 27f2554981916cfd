/**
 * @file sandbox_provisioner.hpp
 * @brief Turns an execution request into a running, isolated container
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/sandbox_handle.hpp"
#include "sandrun/core/types.hpp"
#include "sandrun/runtime/container_runtime.hpp"

#include <memory>
#include <string>

namespace sandrun {
namespace core {

/**
 * @class SandboxProvisioner
 * @brief Creates and starts sandbox containers
 *
 * The image is pulled once when the provisioner is constructed, so an
 * unavailable image fails before any request is accepted.
 *
 * **Isolation Settings** applied to every container:
 * - Single bind mount host → container path, read-only
 * - Memory ceiling from the policy (swap pinned to the same value)
 * - Networking disabled
 * - stdin kept open
 * - Working directory at the mount point
 *
 * **Usage Example**:
 * @code
 * SandboxProvisioner provisioner(docker, "python:3-alpine");
 * SandboxHandle handle = provisioner.Provision(request, policy);
 * @endcode
 */
class SandboxProvisioner {
public:
    /**
     * @brief Construct provisioner and pull @p image
     * @throws InfrastructureError if the image cannot be pulled
     */
    SandboxProvisioner(std::shared_ptr<runtime::ContainerRuntime> runtime,
                       std::string image);

    /**
     * @brief Create and start a container for @p request
     *
     * Warnings reported by the runtime at creation are logged, not raised.
     *
     * @return Handle owning the running container
     * @throws InfrastructureError if the request is invalid or the runtime
     *         fails to create or start the container; a container that was
     *         created but failed to start is removed first
     */
    SandboxHandle Provision(const ExecutionRequest& request,
                            const ResourcePolicy& policy) const;

    /// Isolation configuration for @p request under @p policy
    static runtime::ContainerConfig BuildContainerConfig(const ExecutionRequest& request,
                                                         const ResourcePolicy& policy);

    const std::string& GetImage() const { return image_; }

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;  ///< Runtime client
    std::string image_;                                   ///< Pulled image

    void ValidateRequest(const ExecutionRequest& request) const;
};

} // namespace core
} // namespace sandrun
