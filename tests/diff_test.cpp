// tests/diff_test.cpp - Diff engine tests
#include "core/diff.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace modulate;
using namespace modulate::test;

namespace {

const SourceHandle A{0, 1};
const SourceHandle B{1, 1};

ProvenancedNode tree_of(const RawNode &raw, SourceHandle source) {
  return merge_sources({{source, &raw}});
}

size_t index_of(const std::vector<Operation> &ops, OperationKind kind,
                const std::string &path) {
  for (size_t i = 0; i < ops.size(); ++i) {
    if (ops[i].kind == kind && ops[i].path == path) {
      return i;
    }
  }
  return ops.size();
}

} // namespace

TEST(Diff, SameTreeIsEmpty) {
  RawNode raw = raw_dir("m", {raw_file("a"), raw_dir("d", {raw_file("b")})});
  ProvenancedNode tree = tree_of(raw, A);
  EXPECT_TRUE(diff_trees(tree, tree).empty());
  EXPECT_TRUE(diff_trees(ProvenancedNode::empty_root(),
                         ProvenancedNode::empty_root())
                  .empty());
}

TEST(Diff, CreationIsPreOrder) {
  RawNode raw = raw_dir("m", {raw_dir("dir", {raw_dir("sub", {raw_file("file")})})});
  std::vector<Operation> ops =
      diff_trees(ProvenancedNode::empty_root(), tree_of(raw, A));

  std::vector<Operation> expected = {
      {OperationKind::CreateDir, "dir", {}},
      {OperationKind::CreateDir, "dir/sub", {}},
      {OperationKind::CreateFile, "dir/sub/file", A},
  };
  EXPECT_EQ(ops, expected);
}

TEST(Diff, RemovalIsPostOrder) {
  RawNode raw = raw_dir("m", {raw_dir("dir", {raw_dir("sub", {raw_file("file")})})});
  std::vector<Operation> ops =
      diff_trees(tree_of(raw, A), ProvenancedNode::empty_root());

  std::vector<Operation> expected = {
      {OperationKind::RemoveFile, "dir/sub/file", {}},
      {OperationKind::RemoveDir, "dir/sub", {}},
      {OperationKind::RemoveDir, "dir", {}},
  };
  EXPECT_EQ(ops, expected);
}

TEST(Diff, SourceChangeOnlyWhenProvenanceDiffers) {
  RawNode a = raw_dir("a", {raw_file("a.txt"), raw_dir("common", {raw_file("x.txt")})});
  RawNode b = raw_dir("b", {raw_file("b.txt"), raw_dir("common", {raw_file("x.txt")})});

  ProvenancedNode old_tree = merge_sources({{A, &a}});
  ProvenancedNode new_tree = merge_sources({{A, &a}, {B, &b}});
  std::vector<Operation> ops = diff_trees(old_tree, new_tree);

  std::vector<Operation> expected = {
      {OperationKind::ChangeSource, "common/x.txt", B},
      {OperationKind::CreateFile, "b.txt", B},
  };
  EXPECT_EQ(ops, expected);
}

TEST(Diff, DeactivatingHigherSourceRevertsToLower) {
  RawNode a = raw_dir("a", {raw_file("a.txt"), raw_dir("common", {raw_file("x.txt")})});
  RawNode b = raw_dir("b", {raw_file("b.txt"), raw_dir("common", {raw_file("x.txt")})});

  std::vector<Operation> ops = diff_trees(merge_sources({{A, &a}, {B, &b}}),
                                          merge_sources({{A, &a}}));

  std::vector<Operation> expected = {
      {OperationKind::RemoveFile, "b.txt", {}},
      {OperationKind::ChangeSource, "common/x.txt", A},
  };
  EXPECT_EQ(ops, expected);
}

TEST(Diff, RemovalsOfChildrenPrecedeParentRemoval) {
  RawNode a = raw_dir("a", {raw_dir("dir", {raw_file("one"), raw_dir("sub", {raw_file("two")})}),
                            raw_file("top")});
  std::vector<Operation> ops =
      diff_trees(tree_of(a, A), ProvenancedNode::empty_root());

  size_t dir = index_of(ops, OperationKind::RemoveDir, "dir");
  size_t sub = index_of(ops, OperationKind::RemoveDir, "dir/sub");
  size_t one = index_of(ops, OperationKind::RemoveFile, "dir/one");
  size_t two = index_of(ops, OperationKind::RemoveFile, "dir/sub/two");
  ASSERT_LT(dir, ops.size());
  EXPECT_LT(two, sub);
  EXPECT_LT(sub, dir);
  EXPECT_LT(one, dir);
  EXPECT_EQ(ops.size(), 5u);
}

TEST(Diff, TypeChangeRemovesThenCreates) {
  RawNode file_version = raw_dir("a", {raw_file("thing")});
  RawNode dir_version = raw_dir("b", {raw_dir("thing", {raw_file("inner")})});

  std::vector<Operation> ops =
      diff_trees(tree_of(file_version, A), tree_of(dir_version, B));
  std::vector<Operation> expected = {
      {OperationKind::RemoveFile, "thing", {}},
      {OperationKind::CreateDir, "thing", {}},
      {OperationKind::CreateFile, "thing/inner", B},
  };
  EXPECT_EQ(ops, expected);

  ops = diff_trees(tree_of(dir_version, B), tree_of(file_version, A));
  expected = {
      {OperationKind::RemoveFile, "thing/inner", {}},
      {OperationKind::RemoveDir, "thing", {}},
      {OperationKind::CreateFile, "thing", A},
  };
  EXPECT_EQ(ops, expected);
}

TEST(Diff, DescribeNamesKindPathAndSource) {
  Operation op{OperationKind::CreateFile, "common/x.txt", B};
  EXPECT_EQ(describe(op), "CreateFile common/x.txt (#1v1)");
  Operation rm{OperationKind::RemoveDir, "common", {}};
  EXPECT_EQ(describe(rm), "RemoveDir common");
}

TEST(ApplyToTree, FullListReachesTarget) {
  RawNode a = raw_dir("a", {raw_file("a.txt"), raw_file("thing"),
                            raw_dir("common", {raw_file("x.txt")})});
  RawNode b = raw_dir("b", {raw_file("b.txt"),
                            raw_dir("thing", {raw_dir("deep", {raw_file("f")})}),
                            raw_dir("common", {raw_file("x.txt")})});
  ProvenancedNode old_tree = tree_of(a, A);
  ProvenancedNode new_tree = tree_of(b, B);
  std::vector<Operation> ops = diff_trees(old_tree, new_tree);

  EXPECT_EQ(apply_to_tree(old_tree, ops, ops.size()), new_tree);
  EXPECT_EQ(apply_to_tree(old_tree, ops, 0), old_tree);
}

TEST(ApplyToTree, PrefixLeavesLaterPathsAsBefore) {
  RawNode a = raw_dir("a", {raw_file("a.txt"), raw_dir("common", {raw_file("x.txt")})});
  RawNode b = raw_dir("b", {raw_file("b.txt"), raw_dir("common", {raw_file("x.txt")})});
  ProvenancedNode old_tree = tree_of(a, A);
  std::vector<Operation> ops = diff_trees(old_tree, merge_sources({{A, &a}, {B, &b}}));
  ASSERT_EQ(ops.size(), 2u);

  // Stopped before "CreateFile b.txt"
  ProvenancedNode partial = apply_to_tree(old_tree, ops, 1);
  EXPECT_EQ(partial.find("common/x.txt")->source, B);
  EXPECT_EQ(partial.find("a.txt")->source, A);
  EXPECT_EQ(partial.find("b.txt"), nullptr);
}
