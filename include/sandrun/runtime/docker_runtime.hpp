/**
 * @file docker_runtime.hpp
 * @brief ContainerRuntime implementation backed by the docker CLI
 *
 * Drives the docker command-line client (or any CLI-compatible binary such as
 * podman) as a child process. Holds no per-container state, so one instance
 * can be shared by every pipeline in the process.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/runtime/container_runtime.hpp"

#include <string>
#include <vector>

namespace sandrun {
namespace runtime {

/**
 * @class DockerRuntime
 * @brief Container lifecycle through `docker pull/create/start/exec/kill/inspect/rm`
 *
 * **Command Mapping**:
 * | Operation         | Command                                    |
 * |-------------------|--------------------------------------------|
 * | PullImage         | docker pull IMAGE                          |
 * | CreateContainer   | docker create -i --network none ... IMAGE  |
 * | StartContainer    | docker start ID                            |
 * | AttachAndCollect  | docker exec ID CMD...                      |
 * | KillContainer     | docker kill ID                             |
 * | InspectContainer  | docker inspect --type container ID         |
 * | RemoveContainer   | docker rm -v ID                            |
 *
 * **Usage Example**:
 * @code
 * auto docker = std::make_shared<DockerRuntime>();
 * docker->PullImage("python:3-alpine");
 * @endcode
 */
class DockerRuntime : public ContainerRuntime {
public:
    /**
     * @brief Construct runtime client
     * @param docker_binary Docker CLI executable (looked up in PATH)
     * @throws RuntimeUnavailable if the binary does not answer `--version`
     */
    explicit DockerRuntime(std::string docker_binary = "docker");

    void PullImage(const std::string& image) override;
    ContainerCreation CreateContainer(const ContainerConfig& config) override;
    void StartContainer(const std::string& container_id) override;
    int AttachAndCollect(const std::string& container_id,
                         const std::vector<std::string>& command,
                         OutputSink& sink) override;
    void KillContainer(const std::string& container_id) override;
    ContainerInfo InspectContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id) override;

    /**
     * @brief Check if the docker CLI can be executed
     * @param docker_binary Docker CLI executable
     * @return true if `docker_binary --version` succeeds
     */
    static bool IsRuntimeAvailable(const std::string& docker_binary = "docker");

    /**
     * @brief Build the argument list for `docker create` (without the binary)
     * @throws RuntimeError if a bind path cannot be expressed as a --mount option
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

    /**
     * @brief Parse `docker inspect` JSON output
     * @throws RuntimeError if the output is not valid inspect JSON
     */
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /// Extract `WARNING:` lines from `docker create` stderr
    static std::vector<std::string> ParseWarnings(const std::string& stderr_output);

    /// True if docker's error text says the container already stopped
    static bool IsNotRunningError(const std::string& stderr_output);

    const std::string& GetDockerBinary() const { return docker_binary_; }

private:
    std::string docker_binary_;  ///< CLI executable

    std::string RunDocker(const std::vector<std::string>& args,
                          const std::string& operation,
                          std::string* stderr_output = nullptr) const;
};

} // namespace runtime
} // namespace sandrun
