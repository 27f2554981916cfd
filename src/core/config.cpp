/**
 * @file config.cpp
 * @brief Loading and validation of sandbox configuration
 *
 * @date 2025
 */

#include "sandrun/core/config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace sandrun {
namespace core {

namespace {

// Docker refuses memory limits below 6 MiB
constexpr std::int64_t kMinimumMemoryLimitBytes = 6 * 1024 * 1024;

LanguageProfile MakeProfile(const std::string& name, const std::string& image,
                            std::vector<std::string> command, const std::string& entry_file) {
    LanguageProfile profile;
    profile.name = name;
    profile.runner = name;
    profile.image = image;
    profile.command = std::move(command);
    profile.entry_file = entry_file;
    return profile;
}

void ApplyLanguage(const std::string& name, const json& j, LanguageProfile& profile) {
    if (!j.is_object()) {
        throw ConfigError("Language '" + name + "' must be an object");
    }

    profile.name = name;
    profile.runner = j.value("runner", profile.runner.empty() ? name : profile.runner);
    profile.image = j.value("image", profile.image);
    profile.entry_file = j.value("entry_file", profile.entry_file);
    if (j.contains("command")) {
        profile.command = j.at("command").get<std::vector<std::string>>();
    }
}

} // anonymous namespace

void ValidateConfig(const SandboxConfig& config) {
    if (config.docker_binary.empty()) {
        throw ConfigError("docker_binary must not be empty");
    }
    if (config.policy.memory_limit_bytes < kMinimumMemoryLimitBytes) {
        throw ConfigError("memory_limit_bytes must be at least " +
                          std::to_string(kMinimumMemoryLimitBytes));
    }
    if (config.policy.stdout_limit_bytes == 0 || config.policy.stderr_limit_bytes == 0) {
        throw ConfigError("Output limits must be positive");
    }
    if (!config.container_mount_path.is_absolute()) {
        throw ConfigError("container_mount_path must be absolute");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        throw ConfigError("Unknown log_level: " + config.log_level);
    }

    for (const auto& [name, profile] : config.languages) {
        if (profile.image.empty()) {
            throw ConfigError("Language '" + name + "' has no image");
        }
        if (profile.entry_file.empty() ||
            std::filesystem::path(profile.entry_file).is_absolute()) {
            throw ConfigError("Language '" + name + "' needs a relative entry_file");
        }
    }
}

SandboxConfig DefaultConfig() {
    SandboxConfig config;
    config.languages["python"] =
        MakeProfile("python", "python:3-alpine", {"python3", "-B"}, "main.py");
    config.languages["javascript"] =
        MakeProfile("javascript", "node:lts-alpine", {"node"}, "main.js");
    config.languages["ruby"] =
        MakeProfile("ruby", "ruby:alpine", {"ruby"}, "main.rb");
    return config;
}

SandboxConfig ParseConfig(const std::string& json_text) {
    SandboxConfig config = DefaultConfig();

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw ConfigError("Config root must be an object");
        }

        config.docker_binary = j.value("docker_binary", config.docker_binary);
        config.policy.memory_limit_bytes =
            j.value("memory_limit_bytes", config.policy.memory_limit_bytes);
        config.policy.stdout_limit_bytes =
            j.value("stdout_limit_bytes", config.policy.stdout_limit_bytes);
        config.policy.stderr_limit_bytes =
            j.value("stderr_limit_bytes", config.policy.stderr_limit_bytes);
        config.log_level = j.value("log_level", config.log_level);

        if (j.contains("container_mount_path")) {
            config.container_mount_path = j.at("container_mount_path").get<std::string>();
        }

        if (j.contains("languages")) {
            const json& languages = j.at("languages");
            if (!languages.is_object()) {
                throw ConfigError("languages must be an object");
            }
            for (auto it = languages.begin(); it != languages.end(); ++it) {
                ApplyLanguage(it.key(), it.value(), config.languages[it.key()]);
            }
        }
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    ValidateConfig(config);
    return config;
}

SandboxConfig LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();

    spdlog::debug("Loading config from {}", path.string());
    return ParseConfig(content.str());
}

const LanguageProfile& FindLanguage(const SandboxConfig& config, const std::string& language) {
    auto it = config.languages.find(language);
    if (it == config.languages.end()) {
        throw ConfigError("Unsupported language: " + language);
    }
    return it->second;
}

} // namespace core
} // namespace sandrun
