#include <gtest/gtest.h>

#include <sandrun/core/config.hpp>

#include <filesystem>
#include <fstream>

using namespace sandrun::core;

TEST(Config, Defaults) {
  auto config = DefaultConfig();
  EXPECT_EQ(config.docker_binary, "docker");
  EXPECT_EQ(config.policy.memory_limit_bytes, 32 * 1024 * 1024);
  EXPECT_EQ(config.policy.stdout_limit_bytes, 1024u);
  EXPECT_EQ(config.policy.stderr_limit_bytes, 1024u);
  EXPECT_TRUE(config.policy.network_disabled);
  EXPECT_TRUE(config.policy.bind_read_only);
  EXPECT_EQ(config.container_mount_path.string(), "/sandbox");
  ASSERT_EQ(config.languages.size(), 3u);

  const auto& python = FindLanguage(config, "python");
  EXPECT_EQ(python.image, "python:3-alpine");
  EXPECT_EQ(python.entry_file, "main.py");
  EXPECT_EQ(FindLanguage(config, "javascript").image, "node:lts-alpine");
  EXPECT_EQ(FindLanguage(config, "ruby").runner, "ruby");
}

TEST(Config, UnknownLanguage) {
  EXPECT_THROW(FindLanguage(DefaultConfig(), "cobol"), ConfigError);
}

TEST(Config, ParseOverrides) {
  auto config = ParseConfig(R"({
    "docker_binary": "/usr/local/bin/docker",
    "memory_limit_bytes": 67108864,
    "stdout_limit_bytes": 2048,
    "container_mount_path": "/code",
    "log_level": "debug",
    "languages": {
      "python": {"image": "python:3.12-slim"},
      "pypy": {"runner": "python", "image": "pypy:3", "command": ["pypy3"], "entry_file": "main.py"}
    }
  })");
  EXPECT_EQ(config.docker_binary, "/usr/local/bin/docker");
  EXPECT_EQ(config.policy.memory_limit_bytes, 67108864);
  EXPECT_EQ(config.policy.stdout_limit_bytes, 2048u);
  EXPECT_EQ(config.policy.stderr_limit_bytes, 1024u);
  EXPECT_EQ(config.container_mount_path.string(), "/code");
  EXPECT_EQ(config.log_level, "debug");

  // Partial override keeps the rest of the built-in profile
  const auto& python = FindLanguage(config, "python");
  EXPECT_EQ(python.image, "python:3.12-slim");
  EXPECT_EQ(python.command, (std::vector<std::string>{"python3", "-B"}));

  const auto& pypy = FindLanguage(config, "pypy");
  EXPECT_EQ(pypy.runner, "python");
  EXPECT_EQ(pypy.command, std::vector<std::string>{"pypy3"});
  EXPECT_EQ(config.languages.size(), 4u);
}

TEST(Config, RejectsInvalidValues) {
  EXPECT_THROW(ParseConfig("{"), ConfigError);
  EXPECT_THROW(ParseConfig("[]"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"memory_limit_bytes": 1024})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"memory_limit_bytes": "lots"})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"stdout_limit_bytes": 0})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"container_mount_path": "sandbox"})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"log_level": "chatty"})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"docker_binary": ""})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"languages": {"go": {"entry_file": "main.go"}}})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"languages": {"python": {"entry_file": "/main.py"}}})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"languages": {"python": "python:3"}})"), ConfigError);
}

TEST(Config, ValidateAfterOverrides) {
  auto config = DefaultConfig();
  EXPECT_NO_THROW(ValidateConfig(config));

  config.policy.memory_limit_bytes = 1024 * 1024;
  EXPECT_THROW(ValidateConfig(config), ConfigError);

  config = DefaultConfig();
  config.container_mount_path = "relative";
  EXPECT_THROW(ValidateConfig(config), ConfigError);
}

TEST(Config, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "sandrun_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"log_level": "warn"})";
  }
  auto config = LoadConfig(path);
  EXPECT_EQ(config.log_level, "warn");
  std::filesystem::remove(path);

  EXPECT_THROW(LoadConfig("/nonexistent/sandrun.json"), ConfigError);
}
