// tests/analysis/test_type_and_bounds_safety.cpp - Unit tests for conversion and division checks
//

#include <gtest/gtest.h>

#include <string>

#include "defcheck/test_support/parse_helpers.hpp"

using namespace defcheck;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<Violation> run_detector(
  const std::string & src, std::vector<Violation> (*detector)(const DetectorContext &))
{
  auto unit = test_support::parse(src);
  EXPECT_TRUE(unit.ok()) << (unit.error ? unit.error->message : "");
  if (!unit.ok()) return {};
  return detector(unit.context(test_support::builtin_patterns()));
}

// ============================================================================
// Type Safety Tests
// ============================================================================

TEST(TypeSafetyTest, ConversionOutsideTry)
{
  const auto vs = run_detector(R"(def parse(text):
    return int(text)
)", detect_type_safety);
  ASSERT_EQ(vs.size(), 1U);
  EXPECT_EQ(vs[0].type, ViolationType::TypeSafety);
  EXPECT_EQ(vs[0].severity, Severity::Warning);
  EXPECT_EQ(vs[0].description, "int() conversion without exception handling");
  EXPECT_EQ(
    vs[0].suggestion,
    "try:\n    return int(text)\nexcept ValueError:\n    # handle invalid input");
}

TEST(TypeSafetyTest, JsonLoadsOutsideTry)
{
  const auto vs = run_detector(R"(import json
payload = json.loads(raw)
)", detect_type_safety);
  ASSERT_EQ(vs.size(), 1U);
  EXPECT_EQ(vs[0].description, "json.loads() without exception handling");
  EXPECT_NE(vs[0].suggestion.find("json.JSONDecodeError"), std::string::npos);
}

TEST(TypeSafetyTest, TryBodyAndLiteralsAreSafe)
{
  const auto vs = run_detector(R"(import json
try:
    a = float(text)
    b = json.load(fh)
except ValueError:
    a = int(0)
c = int(5)
d = float(2.5)
e = int()
)", detect_type_safety);
  EXPECT_TRUE(vs.empty());
}

TEST(TypeSafetyTest, ConversionInsideHandlerIsReported)
{
  const auto vs = run_detector(R"(try:
    value = compute()
except ValueError:
    value = int(fallback)
)", detect_type_safety);
  ASSERT_EQ(vs.size(), 1U);
  EXPECT_EQ(vs[0].line, 4U);
}

// ============================================================================
// Bounds Safety Tests
// ============================================================================

TEST(BoundsSafetyTest, DivisionByUncheckedVariable)
{
  const auto vs = run_detector(R"(def average(total, count):
    return total / count
)", detect_bounds_safety);
  ASSERT_EQ(vs.size(), 1U);
  EXPECT_EQ(vs[0].type, ViolationType::BoundsSafety);
  EXPECT_EQ(vs[0].severity, Severity::Warning);
  EXPECT_EQ(vs[0].description, "Division/modulo operation without zero check on 'count'");
  EXPECT_EQ(vs[0].suggestion, "if count != 0:\n    return total / count");
}

TEST(BoundsSafetyTest, AllDivisionOperatorsAreChecked)
{
  const auto vs = run_detector(R"(def f(a, b):
    x = a // b
    y = a % b
    a /= b
    a //= b
    a %= b
    return x, y
)", detect_bounds_safety);
  EXPECT_EQ(vs.size(), 5U);
}

TEST(BoundsSafetyTest, ZeroCheckAndConstantsSuppress)
{
  const auto vs = run_detector(R"(def f(a, b, name):
    if b != 0:
        x = a / b
    y = a / 2
    z = "%s items" % name
    w = a * b
    return x, y, z, w
)", detect_bounds_safety);
  EXPECT_TRUE(vs.empty());
}

TEST(BoundsSafetyTest, PositiveCheckSuppresses)
{
  const auto vs = run_detector(R"(def f(a, n):
    if n > 0:
        return a % n
)", detect_bounds_safety);
  EXPECT_TRUE(vs.empty());
}
