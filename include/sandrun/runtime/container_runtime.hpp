/**
 * @file container_runtime.hpp
 * @brief Capability interface consumed from the container runtime
 *
 * The sandbox core never talks to a container daemon directly. It drives the
 * narrow ContainerRuntime interface below; DockerRuntime implements it on top
 * of the docker command-line client and tests substitute a scripted fake.
 *
 * Implementations report failures with RuntimeError (and RuntimeUnavailable
 * for image pulls). These are raw runtime errors: the sandbox core wraps them
 * into its own error taxonomy and never lets them reach its callers.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandrun {
namespace runtime {

/**
 * @brief Raw failure reported by a container runtime
 */
class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Runtime or image registry cannot be reached / image cannot be fetched
 */
class RuntimeUnavailable : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

/**
 * @struct BindMount
 * @brief Host path exposed inside the container
 */
struct BindMount {
    std::filesystem::path host_path;       ///< Source on the host
    std::filesystem::path container_path;  ///< Target inside the container
    bool read_only{true};                  ///< Mount read-only
};

/**
 * @struct ContainerConfig
 * @brief Everything needed to create one sandbox container
 */
struct ContainerConfig {
    std::string image;                        ///< Image reference
    std::vector<BindMount> binds;             ///< Bind mounts
    std::int64_t memory_limit_bytes{0};       ///< Hard memory ceiling (0 = none)
    std::int64_t memory_swap_limit_bytes{0};  ///< Memory + swap ceiling (0 = runtime default)
    bool network_disabled{true};              ///< No network interfaces besides loopback
    bool open_stdin{true};                    ///< Keep stdin attached and open
    std::filesystem::path working_dir;        ///< Working directory inside the container
};

/**
 * @struct ContainerCreation
 * @brief Result of a create call
 */
struct ContainerCreation {
    std::string id;                     ///< Runtime-assigned container ID
    std::vector<std::string> warnings;  ///< Non-fatal warnings from the runtime
};

/**
 * @struct ContainerState
 * @brief Final state reported by inspect
 */
struct ContainerState {
    std::string status;     ///< "running", "exited", ...
    bool running{false};    ///< Still running
    bool oom_killed{false}; ///< Killed for exceeding its memory ceiling
    int exit_code{0};       ///< Exit code of the container's main process
};

/**
 * @struct ContainerInfo
 * @brief Inspect result; state may be missing
 */
struct ContainerInfo {
    std::string id;
    std::string image;
    std::optional<ContainerState> state;
};

/**
 * @brief Receives output of a process running inside a container
 *
 * The two streams are delivered independently; chunks of the same stream
 * arrive in order.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void OnStdout(const char* data, std::size_t size) = 0;
    virtual void OnStderr(const char* data, std::size_t size) = 0;
};

/**
 * @class ContainerRuntime
 * @brief Container lifecycle operations the sandbox depends on
 *
 * Every call blocks on the runtime. Implementations must be safe to share
 * between concurrently running pipelines.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Make @p image available locally
     * @throws RuntimeUnavailable if the image cannot be fetched
     */
    virtual void PullImage(const std::string& image) = 0;

    /**
     * @brief Create (but do not start) a container
     * @throws RuntimeError on failure
     */
    virtual ContainerCreation CreateContainer(const ContainerConfig& config) = 0;

    /// @throws RuntimeError on failure
    virtual void StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Run @p command inside a running container and stream its output
     *
     * Returns once the command exits and both streams are closed.
     *
     * @return Exit code of @p command
     * @throws RuntimeError if the container cannot be attached to or a stream
     *         read fails
     */
    virtual int AttachAndCollect(const std::string& container_id,
                                 const std::vector<std::string>& command,
                                 OutputSink& sink) = 0;

    /**
     * @brief Force-stop a container
     *
     * Killing a container that already stopped is not an error.
     *
     * @throws RuntimeError on failure
     */
    virtual void KillContainer(const std::string& container_id) = 0;

    /// @throws RuntimeError if the container cannot be inspected
    virtual ContainerInfo InspectContainer(const std::string& container_id) = 0;

    /**
     * @brief Delete a container and its writable layer
     * @throws RuntimeError on failure
     */
    virtual void RemoveContainer(const std::string& container_id) = 0;
};

} // namespace runtime
} // namespace sandrun
