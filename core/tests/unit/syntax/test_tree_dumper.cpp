// tests/syntax/test_tree_dumper.cpp - Unit tests for JSON tree dumps
//

#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "defcheck/syntax/frontend.hpp"
#include "defcheck/syntax/tree_dumper.hpp"

using namespace defcheck;

static bool test_debug_enabled() { return std::getenv("DEFCHECK_TEST_DEBUG") != nullptr; }

// ============================================================================
// Tests
// ============================================================================

TEST(TreeDumperTest, RootCarriesFileAndModule)
{
  auto result = parse_source("dump.py", "x = a / b\n");
  ASSERT_TRUE(result.success());

  const nlohmann::json j = to_json(*result.tree);
  EXPECT_EQ(j["file"], "dump.py");
  EXPECT_EQ(j["root"]["kind"], "module");
  EXPECT_EQ(j["root"]["line"], 1);
  ASSERT_TRUE(j["root"].contains("children"));
}

TEST(TreeDumperTest, OperatorsAndFieldsAreDumped)
{
  auto result = parse_source("dump.py", "x = a / b\n");
  ASSERT_TRUE(result.success());
  const SyntaxTree & tree = *result.tree;

  const auto bins = tree.nodes_of_kind(NodeKind::BinaryOperator);
  ASSERT_EQ(bins.size(), 1U);

  const nlohmann::json j = to_json(tree, bins[0]);
  EXPECT_EQ(j["kind"], "binary_operator");
  EXPECT_EQ(j["field"], "right");
  EXPECT_EQ(j["operator"], "/");
  ASSERT_EQ(j["children"].size(), 2U);
  EXPECT_EQ(j["children"][0]["field"], "left");
  EXPECT_EQ(j["children"][0]["text"], "a");
}

TEST(TreeDumperTest, InvalidNodeIsMarkedMissing)
{
  auto result = parse_source("dump.py", "pass\n");
  ASSERT_TRUE(result.success());
  const nlohmann::json j = to_json(*result.tree, k_invalid_node);
  EXPECT_EQ(j["kind"], "Missing");
}

TEST(TreeDumperTest, DumpIsValidJson)
{
  auto result = parse_source("dump.py", "def f(x):\n    return x\n");
  ASSERT_TRUE(result.success());

  const std::string text = dump_tree_json(*result.tree, 2);
  if (test_debug_enabled()) {
    std::cerr << text << "\n";
  }
  const auto parsed = nlohmann::json::parse(text);
  EXPECT_EQ(parsed["root"]["kind"], "module");
}
