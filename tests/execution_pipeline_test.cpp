#include <gtest/gtest.h>

#include <sandrun/core/errors.hpp>
#include <sandrun/core/execution_pipeline.hpp>
#include <sandrun/runners/python_runner.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fake_container_runtime.h"

using namespace sandrun::core;
using sandrun::runners::ExecutionRunner;
using sandrun::runners::PythonRunner;

namespace {

class ThrowingRunner : public ExecutionRunner {
 public:
  ExecutionResult Execute(const SandboxHandle&) override {
    throw std::runtime_error("interpreter went away");
  }
  std::string GetLanguage() const override { return "broken"; }
};

class ExecutionPipelineTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeContainerRuntime> runtime = std::make_shared<FakeContainerRuntime>();
  std::filesystem::path host = std::filesystem::temp_directory_path();

  std::unique_ptr<ExecutionPipeline> Pipeline(std::unique_ptr<ExecutionRunner> runner = nullptr) {
    if (!runner) runner = std::make_unique<PythonRunner>(std::vector<std::string>{});
    return std::make_unique<ExecutionPipeline>(runtime, "python:3-alpine", ResourcePolicy{},
                                               std::move(runner));
  }

  void ExpectTornDownOnce() {
    EXPECT_EQ(runtime->CountCalls("kill:"), 1);
    EXPECT_EQ(runtime->CountCalls("inspect:"), 1);
    EXPECT_EQ(runtime->CountCalls("remove:"), 1);
  }
};

} // namespace

TEST_F(ExecutionPipelineTest, HelloWorld) {
  runtime->program_stdout = "hello\n";
  auto pipeline = Pipeline();
  auto result = pipeline->Run(host, "/sandbox");
  EXPECT_EQ(result.stdout_output, "hello");
  EXPECT_EQ(result.stderr_output, "");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.termination, Termination::NORMAL);
  EXPECT_EQ(runtime->Calls(), (std::vector<std::string>{
      "pull:python:3-alpine", "create:python:3-alpine", "start:container-1",
      "attach:container-1", "kill:container-1", "inspect:container-1", "remove:container-1"}));
  EXPECT_EQ(runtime->LastCommand(), (std::vector<std::string>{"python3", "-B", "main.py"}));
}

TEST_F(ExecutionPipelineTest, StreamsStaySeparate) {
  runtime->program_stdout = "out";
  runtime->program_stderr = "Traceback (most recent call last):\n  boom\n";
  runtime->program_exit_code = 1;
  auto result = Pipeline()->Run(host, "/sandbox");
  EXPECT_EQ(result.stdout_output, "out");
  EXPECT_EQ(result.stderr_output, "Traceback (most recent call last):\n  boom");
  EXPECT_EQ(result.exit_code, 1);
}

TEST_F(ExecutionPipelineTest, OomKillIsReported) {
  runtime->state = sandrun::runtime::ContainerState{"exited", false, true, 137};
  runtime->program_stdout = "allocating";
  auto pipeline = Pipeline();
  try {
    pipeline->Run(host, "/sandbox");
    FAIL() << "expected ResourceLimitViolation";
  } catch (const ResourceLimitViolation& e) {
    ASSERT_TRUE(e.captured().has_value());
    EXPECT_EQ(e.captured()->stdout_output, "allocating");
  }
  ExpectTornDownOnce();
}

TEST_F(ExecutionPipelineTest, LongOutputIsTruncated) {
  runtime->program_stdout = std::string(5000, 'a');
  runtime->chunk_size = 4096;
  auto result = Pipeline()->Run(host, "/sandbox");
  EXPECT_EQ(result.stdout_output.size(), 1024u);
  EXPECT_TRUE(result.stdout_truncated);
  EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(ExecutionPipelineTest, PullFailureFailsConstruction) {
  runtime->pull_error = "pull access denied";
  EXPECT_THROW(Pipeline(), InfrastructureError);
  EXPECT_EQ(runtime->CountCalls("create:"), 0);
}

TEST_F(ExecutionPipelineTest, RequiresRunner) {
  EXPECT_THROW(ExecutionPipeline(runtime, "python:3-alpine", ResourcePolicy{}, nullptr),
               std::invalid_argument);
}

TEST_F(ExecutionPipelineTest, AttachFailureIsExecutionError) {
  runtime->attach_error = "broken pipe";
  try {
    Pipeline()->Run(host, "/sandbox");
    FAIL() << "expected ExecutionIOError";
  } catch (const ExecutionIOError& e) {
    EXPECT_EQ(e.termination(), Termination::EXECUTION_ERROR);
    EXPECT_EQ(e.cause(), "broken pipe");
  }
  ExpectTornDownOnce();
}

TEST_F(ExecutionPipelineTest, ForeignRunnerExceptionIsWrapped) {
  try {
    Pipeline(std::make_unique<ThrowingRunner>())->Run(host, "/sandbox");
    FAIL() << "expected ExecutionIOError";
  } catch (const ExecutionIOError& e) {
    EXPECT_EQ(e.cause(), "interpreter went away");
  }
  ExpectTornDownOnce();
}

TEST_F(ExecutionPipelineTest, OomKillWinsOverExecutionError) {
  runtime->attach_error = "connection reset";
  runtime->state = sandrun::runtime::ContainerState{"exited", false, true, 137};
  EXPECT_THROW(Pipeline()->Run(host, "/sandbox"), ResourceLimitViolation);
  ExpectTornDownOnce();
}

TEST_F(ExecutionPipelineTest, ExecutionErrorWinsOverTeardownFailure) {
  runtime->attach_error = "connection reset";
  runtime->remove_error = "device busy";
  EXPECT_THROW(Pipeline()->Run(host, "/sandbox"), ExecutionIOError);
  ExpectTornDownOnce();
}

TEST_F(ExecutionPipelineTest, TeardownFailureAfterSuccessKeepsOutput) {
  runtime->program_stdout = "done\n";
  runtime->remove_error = "device busy";
  try {
    Pipeline()->Run(host, "/sandbox");
    FAIL() << "expected InfrastructureError";
  } catch (const InfrastructureError& e) {
    ASSERT_TRUE(e.captured().has_value());
    EXPECT_EQ(e.captured()->stdout_output, "done");
  }
}

TEST_F(ExecutionPipelineTest, ProvisionFailureSkipsExecutionAndTeardown) {
  runtime->create_error = "image not found";
  EXPECT_THROW(Pipeline()->Run(host, "/sandbox"), InfrastructureError);
  EXPECT_EQ(runtime->CountCalls("attach:"), 0);
  EXPECT_EQ(runtime->CountCalls("kill:"), 0);
  EXPECT_EQ(runtime->CountCalls("remove:"), 0);
}

TEST_F(ExecutionPipelineTest, InvalidMountPathIsRejected) {
  EXPECT_THROW(Pipeline()->Run(host, "relative/path"), InfrastructureError);
  EXPECT_EQ(runtime->CountCalls("create:"), 0);
}

TEST_F(ExecutionPipelineTest, RequestForUnpulledImageIsRejected) {
  auto pipeline = Pipeline();
  ExecutionRequest request;
  request.host_source_path = host;
  request.container_mount_path = "/sandbox";
  request.image = "ruby:alpine";
  EXPECT_THROW(pipeline->Run(request), InfrastructureError);
  EXPECT_EQ(runtime->CountCalls("pull:"), 1);
  EXPECT_EQ(runtime->CountCalls("create:"), 0);

  request.image = pipeline->GetImage();
  EXPECT_NO_THROW(pipeline->Run(request));
}

TEST_F(ExecutionPipelineTest, ConcurrentRunsUseSeparateContainers) {
  runtime->program_stdout = "hi";
  auto pipeline = Pipeline();
  constexpr int kRuns = 8;
  std::vector<std::thread> threads;
  std::vector<std::string> outputs(kRuns);
  for (int i = 0; i < kRuns; ++i) {
    threads.emplace_back([&, i] { outputs[i] = pipeline->Run(host, "/sandbox").stdout_output; });
  }
  for (auto& t : threads) t.join();
  for (const auto& out : outputs) EXPECT_EQ(out, "hi");
  EXPECT_EQ(runtime->CountCalls("pull:"), 1);
  EXPECT_EQ(runtime->CountCalls("create:"), kRuns);
  EXPECT_EQ(runtime->CountCalls("remove:"), kRuns);
}
