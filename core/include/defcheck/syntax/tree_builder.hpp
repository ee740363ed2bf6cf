// defcheck/syntax/tree_builder.hpp - Convert a tree-sitter CST into a SyntaxTree
#pragma once

#include "defcheck/syntax/syntax_tree.hpp"
#include "defcheck/syntax/ts_ll.hpp"

namespace defcheck
{

/**
 * Copies the named nodes of a tree-sitter CST into a SyntaxTree arena.
 *
 * Field names become FieldRole values on the children, and anonymous operator
 * tokens are recorded as the operator range of their parent.
 */
class TreeBuilder
{
public:
  explicit TreeBuilder(SyntaxTree & tree) : tree_(tree) {}

  /// Build the whole tree from the CST root; returns the root id
  NodeId build(ts_ll::Node root);

private:
  NodeId build_node(ts_ll::Node node, FieldRole role);

  SyntaxTree & tree_;
};

}  // namespace defcheck
