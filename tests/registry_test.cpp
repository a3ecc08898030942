// tests/registry_test.cpp - Source registry tests
#include "core/errors.hpp"
#include "core/registry.hpp"
#include "test_helpers.hpp"
#include <functional>
#include <gtest/gtest.h>

using namespace modulate;
using namespace modulate::test;

namespace {

class RegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    a = registry.add_source(make_source(tmp / "a", "alpha", UUID_A, {{"a.txt", "a"}}));
    b = registry.add_source(make_source(tmp / "b", "beta", UUID_B, {{"b.txt", "b"}}));
  }

  ErrorKind error_of(const std::function<void()> &fn) {
    try {
      fn();
    } catch (const OverlayError &e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected OverlayError";
    return ErrorKind::StateInvalid;
  }

  TempDir tmp;
  SourceRegistry registry;
  SourceHandle a;
  SourceHandle b;
};

} // namespace

TEST_F(RegistryTest, NewSourcesAreInactive) {
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_TRUE(registry.contains(a));
  EXPECT_FALSE(registry.is_active(a));
  EXPECT_TRUE(registry.active_handles().empty());
  EXPECT_EQ(registry.inactive_handles().size(), 2u);
  EXPECT_EQ(registry.get(a).metadata.name, "alpha");
  EXPECT_EQ(registry.root_of(b), fs::canonical(tmp / "b"));
}

TEST_F(RegistryTest, ActivationAppendsWithTopPriority) {
  registry.activate(b);
  registry.activate(a);
  std::vector<SourceHandle> expected = {b, a};
  EXPECT_EQ(registry.active_handles(), expected);

  std::vector<SourceTree> trees = registry.active_sources();
  ASSERT_EQ(trees.size(), 2u);
  EXPECT_EQ(trees[0].first, b);
  EXPECT_EQ(trees[1].first, a);
  EXPECT_EQ(trees[1].second, &registry.get(a).tree);
}

TEST_F(RegistryTest, DeactivateMovesBackToInactive) {
  registry.activate(a);
  registry.activate(b);
  registry.deactivate(a);
  EXPECT_EQ(registry.active_handles(), std::vector<SourceHandle>{b});
  EXPECT_FALSE(registry.is_active(a));
  EXPECT_EQ(error_of([&] { registry.deactivate(a); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(error_of([&] { registry.activate(b); }), ErrorKind::InvalidHandle);
}

TEST_F(RegistryTest, ReorderRequiresPermutation) {
  registry.activate(a);
  registry.activate(b);

  registry.reorder({b, a});
  std::vector<SourceHandle> expected = {b, a};
  EXPECT_EQ(registry.active_handles(), expected);

  EXPECT_EQ(error_of([&] { registry.reorder({a}); }), ErrorKind::InvalidOrder);
  EXPECT_EQ(error_of([&] { registry.reorder({a, a}); }), ErrorKind::InvalidOrder);
  EXPECT_EQ(error_of([&] { registry.reorder({a, b, SourceHandle{9, 1}}); }),
            ErrorKind::InvalidOrder);
  EXPECT_EQ(registry.active_handles(), expected);
}

TEST_F(RegistryTest, RemovedHandleGoesStale) {
  registry.remove_source(a);
  EXPECT_FALSE(registry.contains(a));
  EXPECT_FALSE(registry.root_of(a).has_value());
  EXPECT_EQ(error_of([&] { registry.get(a); }), ErrorKind::InvalidHandle);

  // The slot is reused under a new generation
  SourceHandle c =
      registry.add_source(make_source(tmp / "c", "gamma", UUID_C, {{"c.txt", "c"}}));
  EXPECT_EQ(c.index, a.index);
  EXPECT_NE(c.generation, a.generation);
  EXPECT_NE(c, a);
  EXPECT_FALSE(registry.contains(a));
  EXPECT_EQ(registry.get(c).metadata.name, "gamma");
}

TEST_F(RegistryTest, ActiveSourceCannotBeRemoved) {
  registry.activate(a);
  EXPECT_EQ(error_of([&] { registry.remove_source(a); }), ErrorKind::SourceActive);
  EXPECT_TRUE(registry.contains(a));
}

TEST_F(RegistryTest, DuplicateUuidIsRejected) {
  fs::path copy = make_source(tmp / "copy", "alpha copy", UUID_A, {});
  EXPECT_EQ(error_of([&] { registry.add_source(copy); }),
            ErrorKind::DuplicateSource);
  EXPECT_EQ(registry.size(), 2u);
}

TEST_F(RegistryTest, FindByUuidOrName) {
  EXPECT_EQ(registry.find(UUID_B), b);
  EXPECT_EQ(registry.find("beta"), b);
  EXPECT_EQ(registry.find("alpha"), a);
  EXPECT_FALSE(registry.find("gamma").has_value());
}

TEST_F(RegistryTest, DefaultHandleIsInvalid) {
  SourceHandle none;
  EXPECT_FALSE(none.valid());
  EXPECT_FALSE(registry.contains(none));
  EXPECT_EQ(to_string(none), "#invalid");
}
