#include <gtest/gtest.h>

#include <sandrun/utils/process_utils.hpp>

#include <string>

using sandrun::utils::ProcessError;
using sandrun::utils::RunCommand;
using sandrun::utils::RunProcess;

TEST(ProcessUtils, SeparatesStreams) {
  auto result = RunCommand({"sh", "-c", "echo out; echo err >&2; exit 3"});
  EXPECT_EQ(result.output, "out\n");
  EXPECT_EQ(result.error, "err\n");
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_FALSE(result.Success());
}

TEST(ProcessUtils, StdinIsEmpty) {
  auto result = RunCommand({"sh", "-c", "cat; echo done"});
  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.output, "done\n");
}

TEST(ProcessUtils, LargeOutputOnBothStreams) {
  // Large enough to fill both pipe buffers at once
  std::size_t out_bytes = 0, err_bytes = 0;
  int code = RunProcess(
      {"sh", "-c", "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"},
      [&](const char*, std::size_t n) { out_bytes += n; },
      [&](const char*, std::size_t n) { err_bytes += n; });
  EXPECT_EQ(code, 0);
  EXPECT_EQ(out_bytes, 200000u);
  EXPECT_EQ(err_bytes, 200000u);
}

TEST(ProcessUtils, SignalledChildReports128PlusSignal) {
  auto result = RunCommand({"sh", "-c", "kill -9 $$"});
  EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(ProcessUtils, MissingExecutableThrows) {
  EXPECT_THROW(RunCommand({"/nonexistent/binary"}), ProcessError);
  EXPECT_THROW(RunCommand({}), ProcessError);
}
