// tests/node_test.cpp - Raw tree scanner tests
#include "core/errors.hpp"
#include "core/node.hpp"
#include "defs.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace modulate;
using namespace modulate::test;

TEST(ScanTree, BuildsDirectoriesAndFiles) {
  TempDir tmp;
  write_file(tmp / "src/a.txt", "a");
  write_file(tmp / "src/common/x.txt", "x");
  write_file(tmp / "src/common/deep/y.txt", "y");
  fs::create_directories(tmp / "src/empty");

  RawNode root = scan_tree(tmp / "src");

  EXPECT_EQ(root.name, "src");
  ASSERT_TRUE(root.is_dir());
  ASSERT_EQ(root.children.size(), 3u);
  EXPECT_FALSE(root.children.at("a.txt").is_dir());
  const RawNode &common = root.children.at("common");
  ASSERT_TRUE(common.is_dir());
  EXPECT_FALSE(common.children.at("x.txt").is_dir());
  EXPECT_TRUE(common.children.at("deep").is_dir());
  EXPECT_TRUE(root.children.at("empty").is_dir());
  EXPECT_TRUE(root.children.at("empty").children.empty());
  EXPECT_EQ(root.count_files(), 3u);
}

TEST(ScanTree, SkipsMetadataFileAtEveryLevel) {
  TempDir tmp;
  write_file(tmp / "src" / METADATA_FILE_NAME, "name = \"x\"");
  write_file(tmp / "src/sub" / METADATA_FILE_NAME, "");
  write_file(tmp / "src/sub/keep.txt", "k");

  RawNode root = scan_tree(tmp / "src");

  EXPECT_EQ(root.children.count(METADATA_FILE_NAME), 0u);
  const RawNode &sub = root.children.at("sub");
  EXPECT_EQ(sub.children.count(METADATA_FILE_NAME), 0u);
  EXPECT_EQ(sub.children.count("keep.txt"), 1u);
}

TEST(ScanTree, DirectorySymlinksAreLeaves) {
  TempDir tmp;
  write_file(tmp / "target/inner.txt", "i");
  fs::create_directories(tmp / "src");
  fs::create_directory_symlink(tmp / "target", tmp / "src/link");

  RawNode root = scan_tree(tmp / "src");

  ASSERT_EQ(root.children.count("link"), 1u);
  EXPECT_FALSE(root.children.at("link").is_dir());
}

TEST(ScanTree, MissingRootIsSourceNotFound) {
  TempDir tmp;
  try {
    scan_tree(tmp / "nope");
    FAIL() << "expected OverlayError";
  } catch (const OverlayError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::SourceNotFound);
  }
}

TEST(ScanTree, FileRootIsSourceNotFound) {
  TempDir tmp;
  write_file(tmp / "file.txt", "f");
  try {
    scan_tree(tmp / "file.txt");
    FAIL() << "expected OverlayError";
  } catch (const OverlayError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::SourceNotFound);
  }
}
