// tests/analysis/test_tree_queries.cpp - Unit tests for structural tree queries
//

#include <gtest/gtest.h>

#include <string>

#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/test_support/parse_helpers.hpp"

using namespace defcheck;

// ============================================================================
// Helper Functions
// ============================================================================

static NodeId first_of(const SyntaxTree & tree, NodeKind kind)
{
  const auto ids = tree.nodes_of_kind(kind);
  return ids.empty() ? k_invalid_node : ids.front();
}

// ============================================================================
// Call Tests
// ============================================================================

TEST(TreeQueriesTest, CallShape)
{
  auto unit = test_support::parse("resp = requests.get(url, params, timeout=5, **extra)\n");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const NodeId call = first_of(tree, NodeKind::Call);

  const NodeId fn = tree.child_by_role(call, FieldRole::Function);
  EXPECT_EQ(qualified_name(tree, fn).value_or(""), "requests.get");
  EXPECT_EQ(callee_short_name(tree, call), "get");
  EXPECT_TRUE(is_method_call(tree, call));
  EXPECT_EQ(receiver_name(tree, call), "requests");
  EXPECT_TRUE(has_keyword_argument(tree, call, "timeout"));
  EXPECT_FALSE(has_keyword_argument(tree, call, "verify"));
  EXPECT_EQ(positional_argument_count(tree, call), 2U);
  EXPECT_TRUE(has_kwargs_splat(tree, call));
}

TEST(TreeQueriesTest, PlainFunctionCall)
{
  auto unit = test_support::parse("value = int(text)\n");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const NodeId call = first_of(tree, NodeKind::Call);

  EXPECT_EQ(callee_short_name(tree, call), "int");
  EXPECT_FALSE(is_method_call(tree, call));
  EXPECT_TRUE(receiver_name(tree, call).empty());
  EXPECT_FALSE(has_kwargs_splat(tree, call));
}

TEST(TreeQueriesTest, NestedReceiverUsesLastAttribute)
{
  auto unit = test_support::parse("self.logger.info('x')\n");
  ASSERT_TRUE(unit.ok());
  const NodeId call = first_of(*unit.tree, NodeKind::Call);
  EXPECT_EQ(receiver_name(*unit.tree, call), "logger");
}

TEST(TreeQueriesTest, QualifiedNameRejectsComplexExpressions)
{
  auto unit = test_support::parse("make().run()\n");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const NodeId outer = first_of(tree, NodeKind::Call);
  EXPECT_FALSE(qualified_name(tree, tree.child_by_role(outer, FieldRole::Function)).has_value());
  EXPECT_FALSE(qualified_name(tree, k_invalid_node).has_value());
}

// ============================================================================
// String Tests
// ============================================================================

TEST(TreeQueriesTest, StringPrefixesAndInterpolation)
{
  auto unit = test_support::parse(R"(a = f"id={x}"
b = "plain"
c = Rb'raw'
d = f"static"
)");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const auto strings = tree.nodes_of_kind(NodeKind::String);
  ASSERT_EQ(strings.size(), 4U);

  EXPECT_EQ(string_prefix(tree, strings[0]), "f");
  EXPECT_TRUE(is_interpolated_string(tree, strings[0]));
  EXPECT_EQ(string_prefix(tree, strings[1]), "");
  EXPECT_FALSE(is_interpolated_string(tree, strings[1]));
  EXPECT_EQ(string_prefix(tree, strings[2]), "rb");
  EXPECT_FALSE(is_interpolated_string(tree, strings[3]));
  EXPECT_TRUE(is_string_literal(tree, strings[1]));
}

// ============================================================================
// Definition Tests
// ============================================================================

TEST(TreeQueriesTest, FunctionDetails)
{
  auto unit = test_support::parse(R"(@app.route("/users")
@login_required
def list_users(self, limit: int = 10, *args, **kwargs):
    """List every user."""
    return []
)");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const NodeId def = first_of(tree, NodeKind::FunctionDefinition);

  EXPECT_EQ(function_name(tree, def), "list_users");
  EXPECT_EQ(docstring(tree, def).value_or(""), "List every user.");

  const auto params = parameter_names(tree, def);
  ASSERT_EQ(params.size(), 4U);
  EXPECT_EQ(params[0], "self");
  EXPECT_EQ(params[1], "limit");
  EXPECT_EQ(params[2], "args");
  EXPECT_EQ(params[3], "kwargs");

  const auto decos = decorators(tree, *unit.parents, def);
  ASSERT_EQ(decos.size(), 2U);
  EXPECT_EQ(decos[0], "app.route(\"/users\")");
  EXPECT_EQ(decos[1], "login_required");
}

TEST(TreeQueriesTest, NoDocstringWhenBodyStartsWithCode)
{
  auto unit = test_support::parse("def f():\n    x = 1\n    \"\"\"late\"\"\"\n");
  ASSERT_TRUE(unit.ok());
  const NodeId def = first_of(*unit.tree, NodeKind::FunctionDefinition);
  EXPECT_FALSE(docstring(*unit.tree, def).has_value());
  EXPECT_TRUE(decorators(*unit.tree, *unit.parents, def).empty());
}

TEST(TreeQueriesTest, EnclosingFunction)
{
  auto unit = test_support::parse("top()\ndef f():\n    inner()\n");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;
  const auto calls = tree.nodes_of_kind(NodeKind::Call);
  ASSERT_EQ(calls.size(), 2U);
  EXPECT_EQ(enclosing_function(*unit.parents, calls[0]), k_invalid_node);
  EXPECT_EQ(
    enclosing_function(*unit.parents, calls[1]), first_of(tree, NodeKind::FunctionDefinition));
}

// ============================================================================
// Import Tests
// ============================================================================

TEST(TreeQueriesTest, ImportedNamesAndModules)
{
  auto unit = test_support::parse(R"(import os.path
import numpy as np
from components.billing import client as billing_client, Invoice
def f():
    import json
)");
  ASSERT_TRUE(unit.ok());
  const SyntaxTree & tree = *unit.tree;

  const auto names = imported_names(tree);
  EXPECT_EQ(names.count("os"), 1U);
  EXPECT_EQ(names.count("np"), 1U);
  EXPECT_EQ(names.count("numpy"), 0U);
  EXPECT_EQ(names.count("billing_client"), 1U);
  EXPECT_EQ(names.count("Invoice"), 1U);
  EXPECT_EQ(names.count("json"), 1U);

  const auto modules = imported_modules(tree);
  ASSERT_EQ(modules.size(), 4U);
  EXPECT_EQ(modules[0], "os.path");
  EXPECT_EQ(modules[1], "numpy");
  EXPECT_EQ(modules[2], "components.billing");
  EXPECT_EQ(modules[3], "json");
}
