/**
 * @file config.hpp
 * @brief Sandbox configuration and per-language profiles
 *
 * Configuration is plain data: which docker binary to drive, the resource
 * policy applied to every sandbox, and for each supported language the image,
 * interpreter command and entry file name. Defaults cover Python, JavaScript
 * and Ruby; a JSON file may override any of it.
 *
 * **Config File Format**:
 * @code{.json}
 * {
 *   "docker_binary": "docker",
 *   "memory_limit_bytes": 33554432,
 *   "stdout_limit_bytes": 1024,
 *   "stderr_limit_bytes": 1024,
 *   "container_mount_path": "/sandbox",
 *   "log_level": "info",
 *   "languages": {
 *     "python": {
 *       "runner": "python",
 *       "image": "python:3-alpine",
 *       "command": ["python3", "-B"],
 *       "entry_file": "main.py"
 *     }
 *   }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/types.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/**
 * @brief Raised for unreadable or invalid configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct LanguageProfile
 * @brief How one language is run inside the sandbox
 */
struct LanguageProfile {
    std::string name;                  ///< Language key ("python", ...)
    std::string runner;                ///< Runner variant ("python", "javascript", "ruby")
    std::string image;                 ///< Container image with the interpreter
    std::vector<std::string> command;  ///< Interpreter and flags; entry file is appended
    std::string entry_file;            ///< Submission file name inside the mount
};

/**
 * @struct SandboxConfig
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    std::string docker_binary{"docker"};                        ///< Docker CLI executable
    ResourcePolicy policy;                                      ///< Applied to every sandbox
    std::filesystem::path container_mount_path{"/sandbox"};     ///< Mount point of submissions
    std::string log_level{"info"};                              ///< spdlog level name
    std::map<std::string, LanguageProfile> languages;           ///< Supported languages
};

/// Configuration with the built-in language profiles
SandboxConfig DefaultConfig();

/**
 * @brief Check limits, paths and language profiles
 * @throws ConfigError describing the first invalid setting
 */
void ValidateConfig(const SandboxConfig& config);

/**
 * @brief Apply a JSON document on top of DefaultConfig()
 * @throws ConfigError if the document is malformed or fails validation
 */
SandboxConfig ParseConfig(const std::string& json_text);

/**
 * @brief Read and parse a JSON config file
 * @throws ConfigError if the file cannot be read or parsed
 */
SandboxConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Look up a language profile
 * @throws ConfigError if @p language is not configured
 */
const LanguageProfile& FindLanguage(const SandboxConfig& config, const std::string& language);

} // namespace core
} // namespace sandrun
