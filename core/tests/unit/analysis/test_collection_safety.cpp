// tests/analysis/test_collection_safety.cpp - Unit tests for the collection safety detector
//

#include <gtest/gtest.h>

#include <string>

#include "defcheck/test_support/parse_helpers.hpp"

using namespace defcheck;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<Violation> run_collection_safety(const std::string & src)
{
  auto unit = test_support::parse(src);
  EXPECT_TRUE(unit.ok()) << (unit.error ? unit.error->message : "");
  if (!unit.ok()) return {};
  return detect_collection_safety(unit.context(test_support::builtin_patterns()));
}

// ============================================================================
// Index Access Tests
// ============================================================================

TEST(CollectionSafetyTest, UncheckedConstantIndex)
{
  const auto vs = run_collection_safety(R"(def first_two(items):
    return items[0], items[1]
)");
  ASSERT_EQ(vs.size(), 2U);
  EXPECT_EQ(vs[0].type, ViolationType::CollectionSafety);
  EXPECT_EQ(vs[0].severity, Severity::Warning);
  EXPECT_EQ(vs[0].description, "List access 'items[0]' without bounds check");
  EXPECT_EQ(vs[0].suggestion, "if len(items) > 0:\n    return items[0], items[1]");
  EXPECT_EQ(vs[1].description, "List access 'items[1]' without bounds check");
}

TEST(CollectionSafetyTest, BoundsCheckSuppresses)
{
  const auto vs = run_collection_safety(R"(def second(items):
    if len(items) > 1:
        return items[1]
    if len(items) >= 3:
        return items[2]
)");
  EXPECT_TRUE(vs.empty());
}

TEST(CollectionSafetyTest, NonLiteralAndNegativeIndexesAreSkipped)
{
  const auto vs = run_collection_safety(R"(def f(items, i):
    a = items[i]
    b = items[-1]
    c = items[0x1]
    d = os.environ['HOME']
    return a, b, c, d
)");
  EXPECT_TRUE(vs.empty());
}

// ============================================================================
// pop() Tests
// ============================================================================

TEST(CollectionSafetyTest, UncheckedPop)
{
  const auto vs = run_collection_safety(R"(def take(stack):
    return stack.pop()
)");
  ASSERT_EQ(vs.size(), 1U);
  EXPECT_EQ(vs[0].description, "Call to 'stack.pop()' without empty check");
  EXPECT_EQ(vs[0].suggestion, "if stack:\n    return stack.pop()");
}

TEST(CollectionSafetyTest, EmptinessCheckSuppressesPop)
{
  const auto vs = run_collection_safety(R"(def take(stack, queue):
    if stack:
        stack.pop()
    while len(queue):
        queue.pop()
)");
  EXPECT_TRUE(vs.empty());
}

TEST(CollectionSafetyTest, PopWithArgumentsIsSkipped)
{
  const auto vs = run_collection_safety(R"(def take(cache, items):
    a = cache.pop('key', None)
    b = items.pop(0)
    return a, b
)");
  EXPECT_TRUE(vs.empty());
}
