// tests/analysis/test_context_window.cpp - Unit tests for guard lookups
//

#include <gtest/gtest.h>

#include <string>

#include "defcheck/test_support/parse_helpers.hpp"

using namespace defcheck;

// ============================================================================
// Helper Functions
// ============================================================================

/// First node of a kind whose text equals `text`
static NodeId find_node(const SyntaxTree & tree, NodeKind kind, std::string_view text)
{
  for (const NodeId id : tree.nodes_of_kind(kind)) {
    if (tree.text(id) == text) return id;
  }
  return k_invalid_node;
}

// ============================================================================
// has_prior_check Tests
// ============================================================================

TEST(ContextWindowTest, NoneCheckWithinLookback)
{
  auto unit = test_support::parse(R"(def f(user):
    if user is not None:
        print(user.name)
)");
  ASSERT_TRUE(unit.ok());
  EXPECT_TRUE(unit.window->has_prior_check(3, "user", CheckKind::NoneCheck));
  EXPECT_FALSE(unit.window->has_prior_check(3, "account", CheckKind::NoneCheck));
  // The statement's own line is not part of the window.
  EXPECT_FALSE(unit.window->has_prior_check(2, "user", CheckKind::NoneCheck));
}

TEST(ContextWindowTest, CheckOutsideLookbackIsIgnored)
{
  auto unit = test_support::parse(R"(def f(user):
    if user is not None:
        a = 1
        b = 2
        c = 3
        d = 4
        e = 5
        print(user.name)
)");
  ASSERT_TRUE(unit.ok());
  EXPECT_FALSE(unit.window->has_prior_check(8, "user", CheckKind::NoneCheck));
  EXPECT_TRUE(unit.window->has_prior_check(7, "user", CheckKind::NoneCheck));
}

TEST(ContextWindowTest, KeyAndBoundsChecks)
{
  auto unit = test_support::parse(R"(def f(data, items):
    if 'name' in data and len(items) > 2:
        return data['name'], items[2]
    if len(items) >= 4:
        return items[3]
)");
  ASSERT_TRUE(unit.ok());
  EXPECT_TRUE(unit.window->has_prior_check(3, "data", CheckKind::KeyCheck, "name"));
  EXPECT_FALSE(unit.window->has_prior_check(3, "data", CheckKind::KeyCheck, "email"));
  EXPECT_TRUE(unit.window->has_prior_check(3, "items", CheckKind::BoundsCheck, "2"));
  EXPECT_TRUE(unit.window->has_prior_check(5, "items", CheckKind::BoundsCheck, "3"));
  EXPECT_FALSE(unit.window->has_prior_check(5, "items", CheckKind::BoundsCheck, "5"));
}

TEST(ContextWindowTest, EmptyAndZeroChecks)
{
  auto unit = test_support::parse(R"(def f(stack, divisor):
    if stack:
        stack.pop()
    if divisor != 0:
        return 10 / divisor
)");
  ASSERT_TRUE(unit.ok());
  EXPECT_TRUE(unit.window->has_prior_check(3, "stack", CheckKind::EmptyCheck));
  EXPECT_TRUE(unit.window->has_prior_check(5, "divisor", CheckKind::ZeroCheck));
  EXPECT_FALSE(unit.window->has_prior_check(3, "divisor", CheckKind::ZeroCheck));
}

TEST(ContextWindowTest, VariableNamesAreMatchedWholeWord)
{
  auto unit = test_support::parse(R"(def f(user, superuser):
    if superuser is not None:
        print(user.name)
)");
  ASSERT_TRUE(unit.ok());
  EXPECT_FALSE(unit.window->has_prior_check(3, "user", CheckKind::NoneCheck));
}

// ============================================================================
// is_inside_guarded_block Tests
// ============================================================================

TEST(ContextWindowTest, TryBodyButNotHandler)
{
  auto unit = test_support::parse(R"(try:
    first()
except ValueError:
    second()
)");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;

  const NodeId first = find_node(tree, NodeKind::Call, "first()");
  const NodeId second = find_node(tree, NodeKind::Call, "second()");
  ASSERT_NE(first, k_invalid_node);
  ASSERT_NE(second, k_invalid_node);
  EXPECT_TRUE(unit.window->is_inside_guarded_block(first, GuardKind::Try));
  EXPECT_FALSE(unit.window->is_inside_guarded_block(second, GuardKind::Try));
}

TEST(ContextWindowTest, TryAroundDefDoesNotCoverBody)
{
  auto unit = test_support::parse(R"(try:
    def inner():
        return risky()
except Exception:
    pass
)");
  ASSERT_TRUE(unit.ok());
  const NodeId call = find_node(*unit.tree, NodeKind::Call, "risky()");
  ASSERT_NE(call, k_invalid_node);
  EXPECT_FALSE(unit.window->is_inside_guarded_block(call, GuardKind::Try));
}

TEST(ContextWindowTest, WithAndLockBlocks)
{
  auto unit = test_support::parse(R"(with open(path) as fh:
    read_all(fh)
with self._lock:
    update()
)");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;

  const NodeId read = find_node(tree, NodeKind::Call, "read_all(fh)");
  const NodeId update = find_node(tree, NodeKind::Call, "update()");
  ASSERT_NE(read, k_invalid_node);
  ASSERT_NE(update, k_invalid_node);

  EXPECT_TRUE(unit.window->is_inside_guarded_block(read, GuardKind::With));
  EXPECT_FALSE(unit.window->is_inside_guarded_block(read, GuardKind::Lock));
  EXPECT_TRUE(unit.window->is_inside_guarded_block(update, GuardKind::With));
  EXPECT_TRUE(unit.window->is_inside_guarded_block(update, GuardKind::Lock));
}
