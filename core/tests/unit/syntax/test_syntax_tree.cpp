// tests/syntax/test_syntax_tree.cpp - Unit tests for SyntaxTree and ParentIndex
//

#include <gtest/gtest.h>

#include <string>

#include "defcheck/syntax/frontend.hpp"

using namespace defcheck;

// ============================================================================
// Helper Functions
// ============================================================================

static std::unique_ptr<SyntaxTree> must_parse(const std::string & src)
{
  auto result = parse_source("tree.py", src);
  EXPECT_TRUE(result.success()) << (result.error ? result.error->message : "");
  return std::move(result.tree);
}

// ============================================================================
// Tree Shape Tests
// ============================================================================

TEST(SyntaxTreeTest, IdsAreInSourceOrder)
{
  auto tree = must_parse("a = 1\nb = 2\nc = 3\n");
  ASSERT_NE(tree, nullptr);

  const auto assigns = tree->nodes_of_kind(NodeKind::Assignment);
  ASSERT_EQ(assigns.size(), 3U);
  EXPECT_LT(assigns[0], assigns[1]);
  EXPECT_LT(assigns[1], assigns[2]);
  EXPECT_EQ(tree->node(assigns[0]).start_line, 1U);
  EXPECT_EQ(tree->node(assigns[2]).start_line, 3U);
}

TEST(SyntaxTreeTest, FieldRolesAreRecorded)
{
  auto tree = must_parse("result = client.fetch(url, timeout=5)\n");
  ASSERT_NE(tree, nullptr);

  const auto calls = tree->nodes_of_kind(NodeKind::Call);
  ASSERT_EQ(calls.size(), 1U);

  const NodeId fn = tree->child_by_role(calls[0], FieldRole::Function);
  ASSERT_NE(fn, k_invalid_node);
  EXPECT_EQ(tree->kind(fn), NodeKind::Attribute);
  EXPECT_EQ(tree->text(fn), "client.fetch");

  const NodeId obj = tree->child_by_role(fn, FieldRole::Object);
  EXPECT_EQ(tree->text(obj), "client");

  const NodeId args = tree->child_by_role(calls[0], FieldRole::Arguments);
  ASSERT_NE(args, k_invalid_node);
  EXPECT_EQ(tree->kind(args), NodeKind::ArgumentList);
  EXPECT_EQ(tree->nodes_of_kind(NodeKind::KeywordArgument).size(), 1U);
}

TEST(SyntaxTreeTest, OperatorRangeIsKept)
{
  auto tree = must_parse("ratio = total / count\ncount //= step\n");
  ASSERT_NE(tree, nullptr);

  const auto bins = tree->nodes_of_kind(NodeKind::BinaryOperator);
  ASSERT_EQ(bins.size(), 1U);
  EXPECT_EQ(tree->source().get_slice(tree->node(bins[0]).operator_range), "/");

  const auto augs = tree->nodes_of_kind(NodeKind::AugmentedAssignment);
  ASSERT_EQ(augs.size(), 1U);
  EXPECT_EQ(tree->source().get_slice(tree->node(augs[0]).operator_range), "//=");
}

TEST(SyntaxTreeTest, InvalidIdsAreHandled)
{
  auto tree = must_parse("x = 1\n");
  ASSERT_NE(tree, nullptr);
  EXPECT_FALSE(tree->is_valid(k_invalid_node));
  EXPECT_TRUE(tree->text(k_invalid_node).empty());
  EXPECT_EQ(tree->child_by_role(k_invalid_node, FieldRole::Body), k_invalid_node);
  EXPECT_FALSE(tree->is(k_invalid_node, NodeKind::Module));
}

// ============================================================================
// ParentIndex Tests
// ============================================================================

TEST(ParentIndexTest, EnclosingWalksAncestors)
{
  auto tree = must_parse("class C:\n    def m(self):\n        return self.x\n");
  ASSERT_NE(tree, nullptr);
  const ParentIndex parents(*tree);

  const auto attrs = tree->nodes_of_kind(NodeKind::Attribute);
  ASSERT_EQ(attrs.size(), 1U);

  const NodeId fn = parents.enclosing(attrs[0], NodeKind::FunctionDefinition);
  const NodeId cls = parents.enclosing(attrs[0], NodeKind::ClassDefinition);
  ASSERT_NE(fn, k_invalid_node);
  ASSERT_NE(cls, k_invalid_node);
  EXPECT_EQ(parents.enclosing(fn, NodeKind::ClassDefinition), cls);
  EXPECT_EQ(parents.enclosing(cls, NodeKind::FunctionDefinition), k_invalid_node);
  EXPECT_EQ(parents.parent(tree->root()), k_invalid_node);
  EXPECT_EQ(parents.enclosing(attrs[0], NodeKind::TryStatement), k_invalid_node);
}

// ============================================================================
// NodeKind Mapping Tests
// ============================================================================

TEST(NodeKindTest, GrammarNamesRoundTrip)
{
  EXPECT_EQ(node_kind_from_grammar("function_definition"), NodeKind::FunctionDefinition);
  EXPECT_EQ(node_kind_from_grammar("not_a_node"), NodeKind::Other);
  EXPECT_EQ(to_string(NodeKind::ExceptClause), "except_clause");
  EXPECT_EQ(field_role_from_grammar("module_name"), FieldRole::ModuleName);
  EXPECT_EQ(field_role_from_grammar("bogus"), FieldRole::None);
}
