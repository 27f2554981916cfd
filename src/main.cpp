/**
 * @file main.cpp
 * @brief sandrun - run a source file in a disposable sandbox container
 *
 * Command-line front end of the sandbox pipeline. Stages the given source
 * file, runs it through the configured language's pipeline and prints the
 * captured output.
 *
 * **Exit Codes**:
 * - 0: execution completed (whatever the program's own exit code)
 * - 1: infrastructure, configuration or staging error
 * - 2: memory limit exceeded
 * - 3: execution I/O error
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandrun/core/config.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/core/execution_pipeline.hpp"
#include "sandrun/reporters/json_reporter.hpp"
#include "sandrun/runners/runner_factory.hpp"
#include "sandrun/runtime/docker_runtime.hpp"
#include "sandrun/utils/source_stager.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

constexpr int kExitInfrastructure = 1;
constexpr int kExitResourceLimit = 2;
constexpr int kExitExecutionError = 3;

void PrintResult(const sandrun::core::ExecutionResult& result, bool as_json) {
    if (as_json) {
        std::cout << sandrun::reporters::JsonReporter().FormatResult(result) << std::endl;
        return;
    }

    if (!result.stdout_output.empty()) {
        std::cout << result.stdout_output << std::endl;
    }
    if (!result.stderr_output.empty()) {
        std::cerr << result.stderr_output << std::endl;
    }
    spdlog::info("Exit code: {}", result.exit_code);
}

int ReportError(const sandrun::core::SandboxError& e, bool as_json) {
    using sandrun::core::Termination;

    if (as_json) {
        std::cout << sandrun::reporters::JsonReporter().FormatError(e) << std::endl;
    } else {
        spdlog::error("[{}] {}", sandrun::core::TerminationToString(e.termination()), e.what());
        if (e.captured()) {
            PrintResult(*e.captured(), false);
        }
    }

    switch (e.termination()) {
        case Termination::RESOURCE_LIMIT: return kExitResourceLimit;
        case Termination::EXECUTION_ERROR: return kExitExecutionError;
        default: return kExitInfrastructure;
    }
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{"sandrun - execute untrusted code in a disposable container"};

    std::string source_path;
    std::string language = "python";
    std::string config_path;
    std::string container_path;
    long long memory_limit = 0;
    bool verbose = false;
    bool json_output = false;

    app.add_option("source", source_path, "Source file to execute")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-l,--language", language, "Language profile to use")
        ->default_val("python");
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-m,--memory", memory_limit, "Memory ceiling in bytes (overrides config)")
        ->check(CLI::PositiveNumber);
    app.add_option("--container-path", container_path,
                   "Mount point of the submission inside the sandbox (overrides config)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--json", json_output, "Print the result as JSON");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        sandrun::core::SandboxConfig config = config_path.empty()
            ? sandrun::core::DefaultConfig()
            : sandrun::core::LoadConfig(config_path);

        if (memory_limit > 0) {
            config.policy.memory_limit_bytes = memory_limit;
        }
        if (!container_path.empty()) {
            config.container_mount_path = container_path;
        }
        sandrun::core::ValidateConfig(config);

        // Configure logging level
        spdlog::set_level(verbose ? spdlog::level::debug
                                  : spdlog::level::from_str(config.log_level));
        if (json_output) {
            // Keep stdout machine-readable
            spdlog::set_default_logger(spdlog::stderr_color_mt("sandrun"));
            spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
            spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
        }

        const auto& profile = sandrun::core::FindLanguage(config, language);

        auto docker = std::make_shared<sandrun::runtime::DockerRuntime>(config.docker_binary);

        sandrun::core::ExecutionPipeline pipeline(
            docker,
            profile.image,
            config.policy,
            sandrun::runners::CreateRunner(profile, config.policy));

        sandrun::utils::SourceStager staged(ReadFile(source_path), profile.entry_file);

        auto result = pipeline.Run(staged.GetDirectory(), config.container_mount_path);
        PrintResult(result, json_output);
        return 0;

    } catch (const sandrun::core::SandboxError& e) {
        return ReportError(e, json_output);
    } catch (const sandrun::core::ConfigError& e) {
        spdlog::error("[config] {}", e.what());
        return kExitInfrastructure;
    } catch (const sandrun::runtime::RuntimeError& e) {
        spdlog::error("[runtime] {}", e.what());
        return kExitInfrastructure;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitInfrastructure;
    }
}
