// defcheck/syntax/tree_builder.cpp - CST -> SyntaxTree conversion
#include "defcheck/syntax/tree_builder.hpp"

namespace defcheck
{

NodeId TreeBuilder::build(ts_ll::Node root)
{
  if (root.is_null()) {
    return k_invalid_node;
  }
  return build_node(root, FieldRole::None);
}

NodeId TreeBuilder::build_node(ts_ll::Node node, FieldRole role)
{
  SyntaxNode out;
  out.grammar_name = node.kind();
  out.kind = node.is_error() ? NodeKind::Error : node_kind_from_grammar(out.grammar_name);
  out.role = role;
  out.range = node.range();
  out.start_line = node.start_row() + 1;
  out.start_column = node.start_column() + 1;
  out.end_line = node.end_row() + 1;

  // Preorder: the parent is appended before any of its children.
  const NodeId id = tree_.append(std::move(out));

  ts_ll::Cursor cursor(node);
  if (!cursor.goto_first_child()) {
    return id;
  }

  do {
    const ts_ll::Node child = cursor.current_node();
    const FieldRole child_role = field_role_from_grammar(cursor.current_field_name());

    if (!child.is_named()) {
      if (child_role == FieldRole::Operator) {
        tree_.node_mut(id).operator_range = child.range();
      }
      continue;
    }

    const NodeId child_id = build_node(child, child_role);
    tree_.add_child(id, child_id);
  } while (cursor.goto_next_sibling());

  return id;
}

}  // namespace defcheck
