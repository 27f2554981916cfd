#include <gtest/gtest.h>

#include <sandrun/utils/source_stager.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using sandrun::utils::SourceStager;
using sandrun::utils::StagingError;

namespace fs = std::filesystem;

TEST(SourceStager, WritesEntryFileAndCleansUp) {
  fs::path directory;
  {
    SourceStager staged("print('hello')\n", "main.py");
    directory = staged.GetDirectory();
    EXPECT_TRUE(directory.is_absolute());
    ASSERT_TRUE(fs::is_directory(directory));
    EXPECT_TRUE(staged.GetEntryPath() == directory / "main.py");

    std::ifstream in(staged.GetEntryPath());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "print('hello')\n");

    auto perms = fs::status(staged.GetEntryPath()).permissions();
    EXPECT_NE(perms & fs::perms::others_read, fs::perms::none);
  }
  EXPECT_FALSE(fs::exists(directory));
}

TEST(SourceStager, DirectoriesAreUnique) {
  SourceStager a("1", "main.rb");
  SourceStager b("2", "main.rb");
  EXPECT_TRUE(a.GetDirectory() != b.GetDirectory());
}

TEST(SourceStager, RejectsNestedEntryFile) {
  EXPECT_THROW(SourceStager("x", "../main.py"), StagingError);
  EXPECT_THROW(SourceStager("x", ""), StagingError);
}

TEST(SourceStager, MissingBaseDirectory) {
  EXPECT_THROW(SourceStager("x", "main.py", "/nonexistent/sandrun/base"), StagingError);
}
