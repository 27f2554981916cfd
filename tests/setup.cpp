#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>

namespace {

spdlog::level::level_enum log_level = spdlog::level::warn;

class LoggingEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
  }
};

} // namespace

testing::Environment* const logging_env = testing::AddGlobalTestEnvironment(new LoggingEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
