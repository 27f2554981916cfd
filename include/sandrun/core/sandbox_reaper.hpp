/**
 * @file sandbox_reaper.hpp
 * @brief Unconditional teardown of sandbox containers
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/sandbox_handle.hpp"

#include <string>

namespace sandrun {
namespace core {

/**
 * @class SandboxReaper
 * @brief Kills, inspects and removes a sandbox container
 *
 * Steps run strictly in order, since inspect must observe the killed state
 * before removal destroys it:
 * 1. **Kill**: force-stop; a container that already exited is fine
 * 2. **Inspect**: missing state → InfrastructureError, OOM kill →
 *    ResourceLimitViolation
 * 3. **Remove**: always attempted, even when step 1 or 2 failed
 *
 * When several steps fail, the inspect classification is reported; a kill or
 * remove failure is reported only if nothing more significant happened.
 * Nothing is retried.
 */
class SandboxReaper {
public:
    /**
     * @brief Tear down the container owned by @p handle
     *
     * Marks the handle released before doing anything, so a handle is never
     * torn down twice.
     *
     * @throws ResourceLimitViolation if the container was OOM killed
     * @throws InfrastructureError if the handle was already released, the final
     *         state is unknown or a runtime call failed
     */
    void Teardown(SandboxHandle& handle) const;

private:
    void KillContainer(runtime::ContainerRuntime& runtime, const std::string& container_id) const;
    void CheckExecutionState(runtime::ContainerRuntime& runtime, const std::string& container_id) const;
    void RemoveContainer(runtime::ContainerRuntime& runtime, const std::string& container_id) const;
};

} // namespace core
} // namespace sandrun
