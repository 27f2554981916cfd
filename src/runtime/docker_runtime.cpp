/**
 * @file docker_runtime.cpp
 * @brief Implementation of the docker CLI backed container runtime
 *
 * **Sandbox Container Settings** (see BuildCreateArgs):
 * - `-i`: stdin kept open so interpreter images idle in their REPL until
 *   the submission is exec'd
 * - `--network none`: no network interfaces besides loopback
 * - `--memory` / `--memory-swap`: hard memory ceiling, swap pinned to it so
 *   an overrun ends in an OOM kill instead of swapping
 * - `--mount type=bind,...,readonly`: submission exposed read-only
 * - `-w`: working directory at the mount point
 *
 * Every docker failure is reported as RuntimeError with docker's own stderr
 * text, except `kill` on an already stopped container which is tolerated.
 *
 * @date 2025
 */

#include "sandrun/runtime/docker_runtime.hpp"
#include "sandrun/utils/process_utils.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace sandrun {
namespace runtime {

using utils::StringUtils;

// ============================================================================
// CONSTRUCTOR / RUNTIME DETECTION
// ============================================================================

DockerRuntime::DockerRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::debug("Docker runtime using binary: {}", docker_binary_);

    // Verify runtime is available before proceeding
    if (!IsRuntimeAvailable(docker_binary_)) {
        spdlog::error("Container runtime not available: {}", docker_binary_);
        throw RuntimeUnavailable("Container runtime not available: " + docker_binary_);
    }
}

bool DockerRuntime::IsRuntimeAvailable(const std::string& docker_binary) {
    try {
        auto result = utils::RunCommand({docker_binary, "--version"});
        if (result.Success()) {
            spdlog::debug("Runtime version: {}", StringUtils::Trim(result.output));
            return true;
        }
    }
    catch (const utils::ProcessError& e) {
        spdlog::debug("Runtime check failed: {}", e.what());
    }
    return false;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

void DockerRuntime::PullImage(const std::string& image) {
    spdlog::info("Pulling image: {}", image);

    try {
        RunDocker({"pull", "--quiet", image}, "pull");
    }
    catch (const RuntimeError& e) {
        throw RuntimeUnavailable(e.what());
    }

    spdlog::info("Image available: {}", image);
}

ContainerCreation DockerRuntime::CreateContainer(const ContainerConfig& config) {
    auto args = BuildCreateArgs(config);

    std::string err;
    std::string out = RunDocker(args, "create", &err);

    ContainerCreation creation;
    creation.id = StringUtils::Trim(out);
    creation.warnings = ParseWarnings(err);

    if (creation.id.empty()) {
        throw RuntimeError("docker create returned no container ID");
    }

    return creation;
}

void DockerRuntime::StartContainer(const std::string& container_id) {
    RunDocker({"start", container_id}, "start");
}

int DockerRuntime::AttachAndCollect(const std::string& container_id,
                                    const std::vector<std::string>& command,
                                    OutputSink& sink) {
    std::vector<std::string> argv = {docker_binary_, "exec", container_id};
    argv.insert(argv.end(), command.begin(), command.end());

    spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));

    try {
        return utils::RunProcess(
            argv,
            [&sink](const char* data, std::size_t size) { sink.OnStdout(data, size); },
            [&sink](const char* data, std::size_t size) { sink.OnStderr(data, size); });
    }
    catch (const utils::ProcessError& e) {
        throw RuntimeError(std::string("docker exec failed: ") + e.what());
    }
}

void DockerRuntime::KillContainer(const std::string& container_id) {
    std::string err;
    try {
        RunDocker({"kill", container_id}, "kill", &err);
    }
    catch (const RuntimeError&) {
        if (IsNotRunningError(err)) {
            spdlog::debug("Container {} already stopped", container_id);
            return;
        }
        throw;
    }
}

ContainerInfo DockerRuntime::InspectContainer(const std::string& container_id) {
    std::string out = RunDocker({"inspect", "--type", "container", container_id}, "inspect");
    return ParseInspectOutput(out);
}

void DockerRuntime::RemoveContainer(const std::string& container_id) {
    // -v also drops anonymous volumes created for the container
    RunDocker({"rm", "-v", container_id}, "rm");
}

// ============================================================================
// ARGUMENT CONSTRUCTION / OUTPUT PARSING
// ============================================================================

std::vector<std::string> DockerRuntime::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (config.open_stdin) {
        args.push_back("--interactive");
    }

    if (config.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }

    if (config.memory_limit_bytes > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_bytes));
    }

    if (config.memory_swap_limit_bytes > 0) {
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_swap_limit_bytes));
    }

    for (const auto& bind : config.binds) {
        const std::string source = bind.host_path.string();
        const std::string target = bind.container_path.string();

        // --mount is comma separated; refuse paths that would split the option
        if (StringUtils::Contains(source, ",") || StringUtils::Contains(target, ",")) {
            throw RuntimeError("Bind mount path must not contain ',': " + source + " -> " + target);
        }

        std::string mount = "type=bind,source=" + source + ",target=" + target;
        if (bind.read_only) {
            mount += ",readonly";
        }
        args.push_back("--mount");
        args.push_back(mount);
    }

    if (!config.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last)
    args.push_back(config.image);

    return args;
}

ContainerInfo DockerRuntime::ParseInspectOutput(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    }
    catch (const json::exception& e) {
        throw RuntimeError(std::string("Malformed inspect output: ") + e.what());
    }

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw RuntimeError("Inspect returned no container");
        }
        j = j[0];
    }

    if (!j.is_object()) {
        throw RuntimeError("Unexpected inspect output");
    }

    ContainerInfo info;
    try {
        info.id = j.value("Id", "");
        if (j.contains("Config") && j["Config"].is_object()) {
            info.image = j["Config"].value("Image", "");
        }

        auto state_it = j.find("State");
        if (state_it != j.end() && state_it->is_object()) {
            ContainerState state;
            state.status = state_it->value("Status", "");
            state.running = state_it->value("Running", false);
            state.oom_killed = state_it->value("OOMKilled", false);
            state.exit_code = state_it->value("ExitCode", 0);
            info.state = state;
        }
    }
    catch (const json::exception& e) {
        throw RuntimeError(std::string("Unexpected inspect field: ") + e.what());
    }

    return info;
}

std::vector<std::string> DockerRuntime::ParseWarnings(const std::string& stderr_output) {
    std::vector<std::string> warnings;
    for (const auto& line : StringUtils::Split(stderr_output, '\n')) {
        std::string trimmed = StringUtils::Trim(line);
        if (StringUtils::StartsWith(trimmed, "WARNING:")) {
            warnings.push_back(StringUtils::Trim(trimmed.substr(8)));
        }
    }
    return warnings;
}

bool DockerRuntime::IsNotRunningError(const std::string& stderr_output) {
    return StringUtils::Contains(StringUtils::ToLower(stderr_output), "is not running");
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::string DockerRuntime::RunDocker(const std::vector<std::string>& args,
                                     const std::string& operation,
                                     std::string* stderr_output) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));

    utils::CommandResult result;
    try {
        result = utils::RunCommand(argv);
    }
    catch (const utils::ProcessError& e) {
        throw RuntimeError("docker " + operation + " failed: " + e.what());
    }

    if (stderr_output) {
        *stderr_output = result.error;
    }

    if (!result.Success()) {
        throw RuntimeError("docker " + operation + " failed (exit " +
                           std::to_string(result.exit_code) + "): " +
                           StringUtils::Trim(result.error));
    }

    return result.output;
}

} // namespace runtime
} // namespace sandrun
