#include "dagrun/run/workspace.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>

using namespace dagrun;

TEST(WorkspaceTest, CreateUnderRootWithPrefix) {
  dagrun::test::TempDir root;
  auto ws = Workspace::create(root.path(), "unit");
  ASSERT_TRUE(ws.has_value()) << ws.error().message();
  EXPECT_TRUE(ws->valid());
  EXPECT_TRUE(ws->path().is_absolute());
  EXPECT_TRUE(std::filesystem::is_directory(ws->path()));
  EXPECT_EQ(ws->path().parent_path(), std::filesystem::absolute(root.path()));
  EXPECT_TRUE(ws->path().filename().string().starts_with("unit-"));
}

TEST(WorkspaceTest, RemovedOnDestruction) {
  std::filesystem::path path;
  {
    auto ws = Workspace::create();
    ASSERT_TRUE(ws.has_value());
    path = ws->path();
    auto slot = ws->init_output_slot(TaskId("A"));
    ASSERT_TRUE(slot.has_value());
    dagrun::test::write_file(*slot, "content");
    EXPECT_TRUE(std::filesystem::exists(path));
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(WorkspaceTest, MoveTransfersOwnership) {
  auto created = Workspace::create();
  ASSERT_TRUE(created.has_value());
  const auto path = created->path();

  Workspace moved = std::move(*created);
  EXPECT_FALSE(created->valid());
  EXPECT_EQ(moved.path(), path);

  created->destroy();
  EXPECT_TRUE(std::filesystem::exists(path));
  moved.destroy();
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(moved.valid());
}

TEST(WorkspaceTest, OutputSlotIsTruncated) {
  auto ws = Workspace::create();
  ASSERT_TRUE(ws.has_value());
  auto slot = ws->output_slot(TaskId("B"));
  EXPECT_EQ(slot, ws->path() / "B.out");

  dagrun::test::write_file(slot, "stale");
  auto created = ws->init_output_slot(TaskId("B"));
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(*created, slot);
  EXPECT_EQ(std::filesystem::file_size(slot), 0U);
}

TEST(WorkspaceTest, MissingRootFails) {
  auto ws = Workspace::create("/nonexistent/dagrun/root");
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::WorkspaceError));
}
