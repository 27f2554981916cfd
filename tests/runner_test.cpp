#include <gtest/gtest.h>

#include <sandrun/core/config.hpp>
#include <sandrun/core/errors.hpp>
#include <sandrun/runners/javascript_runner.hpp>
#include <sandrun/runners/python_runner.hpp>
#include <sandrun/runners/ruby_runner.hpp>
#include <sandrun/runners/runner_factory.hpp>

#include <memory>

#include "fake_container_runtime.h"

using namespace sandrun::runners;
using sandrun::core::ConfigError;
using sandrun::core::DefaultConfig;
using sandrun::core::ResourcePolicy;
using sandrun::core::SandboxHandle;

using Command = std::vector<std::string>;

TEST(Runners, DefaultCommands) {
  EXPECT_EQ(PythonRunner(Command{}).BuildCommand(), (Command{"python3", "-B", "main.py"}));
  EXPECT_EQ(JavaScriptRunner(Command{}).BuildCommand(), (Command{"node", "main.js"}));
  EXPECT_EQ(RubyRunner(Command{}).BuildCommand(), (Command{"ruby", "main.rb"}));
}

TEST(Runners, CustomInterpreter) {
  PythonRunner runner({"pypy3"}, "solution.py");
  EXPECT_EQ(runner.BuildCommand(), (Command{"pypy3", "solution.py"}));
  EXPECT_EQ(runner.GetLanguage(), "python");
}

TEST(Runners, VariantsShareInterpreterRunner) {
  std::unique_ptr<InterpreterRunner> runner = std::make_unique<RubyRunner>();
  EXPECT_EQ(runner->GetEntryFile(), "main.rb");
  EXPECT_EQ(runner->BuildCommand(), (Command{"ruby", "main.rb"}));
  EXPECT_EQ(runner->GetLanguage(), "ruby");
}

TEST(Runners, FactoryBuildsEveryDefaultLanguage) {
  auto config = DefaultConfig();
  for (const auto& name : SupportedRunners()) {
    auto runner = CreateRunner(config.languages.at(name), config.policy);
    ASSERT_NE(runner.get(), nullptr);
    EXPECT_EQ(runner->GetLanguage(), name);
  }
}

TEST(Runners, FactoryRejectsUnknownRunner) {
  auto profile = DefaultConfig().languages.at("python");
  profile.runner = "cobol";
  EXPECT_THROW(CreateRunner(profile, ResourcePolicy{}), ConfigError);
}

TEST(Runners, ExecuteUsesPolicyLimits) {
  auto runtime = std::make_shared<FakeContainerRuntime>();
  runtime->program_stdout = std::string(100, 'r');
  runtime->program_stderr = std::string(100, 'e');
  SandboxHandle handle(runtime, "c1", "/sandbox");

  auto policy = sandrun::core::PolicyBuilder().WithOutputLimits(10, 50).Build();
  auto runner = CreateRunner(DefaultConfig().languages.at("ruby"), policy);
  auto result = runner->Execute(handle);

  EXPECT_EQ(result.stdout_output, std::string(10, 'r'));
  EXPECT_EQ(result.stderr_output, std::string(50, 'e'));
  EXPECT_TRUE(result.stdout_truncated);
  EXPECT_TRUE(result.stderr_truncated);
  EXPECT_EQ(runtime->LastCommand(), (Command{"ruby", "main.rb"}));
  handle.MarkReleased();
}

TEST(Runners, AttachFailureBecomesExecutionIOError) {
  auto runtime = std::make_shared<FakeContainerRuntime>();
  runtime->attach_error = "exec failed";
  SandboxHandle handle(runtime, "c1", "/sandbox");
  JavaScriptRunner runner(Command{});
  EXPECT_THROW(runner.Execute(handle), sandrun::core::ExecutionIOError);
  handle.MarkReleased();
}
