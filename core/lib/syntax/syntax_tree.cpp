// defcheck/syntax/syntax_tree.cpp - SyntaxTree and ParentIndex implementation
#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

// ============================================================================
// SyntaxTree
// ============================================================================

std::string_view SyntaxTree::text(NodeId id) const
{
  if (!is_valid(id)) {
    return {};
  }
  return source_.get_slice(nodes_[id].range);
}

NodeId SyntaxTree::child_by_role(NodeId id, FieldRole role) const
{
  if (!is_valid(id)) {
    return k_invalid_node;
  }
  for (const NodeId c : nodes_[id].children) {
    if (nodes_[c].role == role) {
      return c;
    }
  }
  return k_invalid_node;
}

std::vector<NodeId> SyntaxTree::children_by_role(NodeId id, FieldRole role) const
{
  std::vector<NodeId> out;
  if (!is_valid(id)) {
    return out;
  }
  for (const NodeId c : nodes_[id].children) {
    if (nodes_[c].role == role) {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<NodeId> SyntaxTree::nodes_of_kind(NodeKind kind) const
{
  std::vector<NodeId> out;
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    if (nodes_[id].kind == kind) {
      out.push_back(id);
    }
  }
  return out;
}

NodeId SyntaxTree::append(SyntaxNode node)
{
  const auto id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(std::move(node));
  return id;
}

// ============================================================================
// ParentIndex
// ============================================================================

ParentIndex::ParentIndex(const SyntaxTree & tree)
: tree_(&tree), parents_(tree.size(), k_invalid_node)
{
  for (NodeId id = 0; id < tree.size(); ++id) {
    for (const NodeId c : tree.node(id).children) {
      parents_[c] = id;
    }
  }
}

NodeId ParentIndex::enclosing(NodeId id, NodeKind kind) const
{
  NodeId cur = parent(id);
  while (cur != k_invalid_node) {
    if (tree_->kind(cur) == kind) {
      return cur;
    }
    cur = parent(cur);
  }
  return k_invalid_node;
}

}  // namespace defcheck
