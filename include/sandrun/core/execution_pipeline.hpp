/**
 * @file execution_pipeline.hpp
 * @brief Provision → execute → teardown for one submission
 *
 * Entry point consumed by the service layer. One pipeline serves one
 * language: it is configured with a resource policy and a runner variant, and
 * owns the provisioner (which pulls the image when the pipeline is built).
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/sandbox_provisioner.hpp"
#include "sandrun/core/sandbox_reaper.hpp"
#include "sandrun/core/types.hpp"
#include "sandrun/runners/execution_runner.hpp"
#include "sandrun/runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace sandrun {
namespace core {

/**
 * @class ExecutionPipeline
 * @brief Runs untrusted code in a fresh sandbox per call
 *
 * **Workflow of Run()**:
 * 1. Provision: create and start an isolated container
 * 2. Execute: runner invokes the interpreter, captures bounded output
 * 3. Teardown: kill, inspect, remove; always runs once step 1 succeeded
 *
 * **Reported Error** when several steps fail:
 * - ResourceLimitViolation from teardown wins over everything
 * - otherwise the runner's failure wins over other teardown failures
 * - a teardown failure after a successful run carries the captured result
 *   (SandboxError::captured())
 *
 * **Thread Safety**: Run() keeps no state between calls and may be called
 * concurrently provided the runner and runtime are thread-safe, which the
 * shipped ones are.
 *
 * **Usage Example**:
 * @code
 * auto docker = std::make_shared<runtime::DockerRuntime>();
 * ExecutionPipeline pipeline(docker, "python:3-alpine", ResourcePolicy{},
 *                            std::make_unique<runners::PythonRunner>(
 *                                std::vector<std::string>{}));
 *
 * try {
 *     auto result = pipeline.Run("/tmp/submission-42", "/sandbox");
 *     std::cout << result.stdout_output;
 * } catch (const ResourceLimitViolation& e) {
 *     std::cout << "Memory limit exceeded" << std::endl;
 * }
 * @endcode
 */
class ExecutionPipeline {
public:
    /**
     * @brief Construct pipeline and pull @p image
     * @throws InfrastructureError if the image cannot be pulled
     * @throws std::invalid_argument if @p runner is null
     */
    ExecutionPipeline(std::shared_ptr<runtime::ContainerRuntime> runtime,
                      std::string image,
                      ResourcePolicy policy,
                      std::unique_ptr<runners::ExecutionRunner> runner);

    ExecutionPipeline(const ExecutionPipeline&) = delete;
    ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

    /**
     * @brief Execute the code at @p host_path, mounted at @p container_path
     * @return Trimmed, byte-bounded stdout and stderr
     * @throws InfrastructureError, ResourceLimitViolation, ExecutionIOError
     */
    ExecutionResult Run(const std::filesystem::path& host_path,
                        const std::filesystem::path& container_path);

    /**
     * @brief Same as above with an explicit request
     * @throws InfrastructureError if @p request names an image other than
     *         the one pulled at construction
     */
    ExecutionResult Run(const ExecutionRequest& request);

    const ResourcePolicy& GetPolicy() const { return policy_; }
    const std::string& GetImage() const { return provisioner_.GetImage(); }
    const runners::ExecutionRunner& GetRunner() const { return *runner_; }

private:
    ResourcePolicy policy_;                            ///< Applied to every run
    std::unique_ptr<runners::ExecutionRunner> runner_; ///< Language variant
    SandboxProvisioner provisioner_;                   ///< Create + start
    SandboxReaper reaper_;                             ///< Kill + inspect + remove
};

} // namespace core
} // namespace sandrun
