#include "application/workspace.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <unistd.h>

using namespace transcode_service;

namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
      ("workspace_test_" + std::to_string(getpid()) + "_" +
       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

TEST_F(WorkspaceTest, Layout)
{
  auto workspace = Workspace::create(root_, "job_1_abcdef01", "uploads/clip.final.MOV");
  ASSERT_TRUE(workspace.has_value()) << workspace.error().message;

  EXPECT_EQ(workspace->directory().string(), (root_ / "job_1_abcdef01").string());
  EXPECT_EQ(workspace->inputPath().string(), (root_ / "job_1_abcdef01" / "input.MOV").string());
  EXPECT_EQ(workspace->outputDir().string(), (root_ / "job_1_abcdef01" / "output").string());
  EXPECT_TRUE(fs::is_directory(workspace->outputDir()));
}

TEST_F(WorkspaceTest, KeyWithoutExtension)
{
  auto workspace = Workspace::create(root_, "job_2", "raw/upload");
  ASSERT_TRUE(workspace.has_value());
  EXPECT_EQ(workspace->inputPath().filename().string(), "input");
}

TEST_F(WorkspaceTest, RemoveDeletesEverything)
{
  auto workspace = Workspace::create(root_, "job_3", "a.mp4");
  ASSERT_TRUE(workspace.has_value());
  std::ofstream(workspace->inputPath()) << "data";
  std::ofstream(workspace->outputDir() / "0.m3u8") << "#EXTM3U\n";

  EXPECT_TRUE(workspace->remove().has_value());
  EXPECT_FALSE(fs::exists(root_ / "job_3"));
  EXPECT_TRUE(fs::exists(root_));
}

TEST_F(WorkspaceTest, DestructorRemoves)
{
  {
    auto workspace = Workspace::create(root_, "job_4", "a.mp4");
    ASSERT_TRUE(workspace.has_value());
    std::ofstream(workspace->outputDir() / "0_segment0.ts") << "ts";
    Workspace moved{std::move(*workspace)};
    EXPECT_TRUE(fs::exists(moved.directory()));
  }
  EXPECT_FALSE(fs::exists(root_ / "job_4"));
}

TEST_F(WorkspaceTest, ExistingDirectoryIsRejected)
{
  fs::create_directories(root_ / "job_5");
  auto workspace = Workspace::create(root_, "job_5", "a.mp4");
  ASSERT_FALSE(workspace.has_value());
  EXPECT_EQ(workspace.error().kind, ErrorKind::StorageUnavailable);
  EXPECT_TRUE(fs::exists(root_ / "job_5"));
}

TEST(WorkspaceCleanup, FoldsIntoOutcome)
{
  const Error cleanup_error{ErrorKind::StorageUnavailable, "Failed to remove workspace /w/job_1"};

  {
    auto outcome = withCleanup({}, {});
    EXPECT_TRUE(outcome.has_value());
  }

  {
    auto outcome = withCleanup({}, std::unexpected(cleanup_error));
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::StorageUnavailable);
    EXPECT_EQ(outcome.error().message, cleanup_error.message);
  }

  {
    auto outcome = withCleanup(std::unexpected(Error{ErrorKind::TranscodeFailed, "ffmpeg exited with code 1"}),
                               std::unexpected(cleanup_error));
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::TranscodeFailed);
    EXPECT_EQ(outcome.error().message,
              "ffmpeg exited with code 1; Failed to remove workspace /w/job_1");
  }

  {
    auto outcome = withCleanup(std::unexpected(Error{ErrorKind::ObjectNotFound, "Object not found: a.mp4"}), {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::ObjectNotFound);
    EXPECT_EQ(outcome.error().message, "Object not found: a.mp4");
  }
}
