// defcheck/syntax/syntax_tree.hpp - Immutable arena syntax tree for one Python file
//
// Nodes live in a flat vector owned by the tree and are addressed by NodeId.
// Ids are assigned in preorder, so iterating ids in ascending order visits the
// tree in source order. Only named grammar nodes are kept; anonymous tokens are
// reduced to the operator range of their parent.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "defcheck/basic/source_file.hpp"
#include "defcheck/syntax/node_kind.hpp"

namespace defcheck
{

using NodeId = uint32_t;

inline constexpr NodeId k_invalid_node = UINT32_MAX;

struct SyntaxNode
{
  NodeKind kind = NodeKind::Other;
  FieldRole role = FieldRole::None;  ///< Role within the parent node
  std::string_view grammar_name;     ///< tree-sitter node type (static storage)

  SourceRange range;
  SourceRange operator_range;  ///< Operator token for binary/augmented operators

  uint32_t start_line = 0;    ///< 1-indexed
  uint32_t start_column = 0;  ///< 1-indexed
  uint32_t end_line = 0;      ///< 1-indexed

  std::vector<NodeId> children;  ///< Named children in source order
};

/**
 * Syntax tree for one source file.
 *
 * The tree owns its SourceFile so that every range can be resolved to text
 * for as long as the tree lives. A tree is filled once by TreeBuilder and is
 * read-only afterwards.
 */
class SyntaxTree
{
public:
  explicit SyntaxTree(SourceFile source) : source_(std::move(source)) {}

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;
  SyntaxTree(SyntaxTree &&) = default;
  SyntaxTree & operator=(SyntaxTree &&) = default;

  [[nodiscard]] const SourceFile & source() const noexcept { return source_; }

  [[nodiscard]] NodeId root() const noexcept { return nodes_.empty() ? k_invalid_node : 0; }
  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

  [[nodiscard]] bool is_valid(NodeId id) const noexcept { return id < nodes_.size(); }

  [[nodiscard]] const SyntaxNode & node(NodeId id) const { return nodes_.at(id); }
  [[nodiscard]] NodeKind kind(NodeId id) const { return nodes_.at(id).kind; }

  [[nodiscard]] bool is(NodeId id, NodeKind kind) const noexcept
  {
    return id < nodes_.size() && nodes_[id].kind == kind;
  }

  /// Source text covered by a node
  [[nodiscard]] std::string_view text(NodeId id) const;

  /// First named child with the given field role (k_invalid_node if none)
  [[nodiscard]] NodeId child_by_role(NodeId id, FieldRole role) const;

  [[nodiscard]] std::vector<NodeId> children_by_role(NodeId id, FieldRole role) const;

  /// All node ids of the given kind, in source order
  [[nodiscard]] std::vector<NodeId> nodes_of_kind(NodeKind kind) const;

  // Builder access
  NodeId append(SyntaxNode node);
  SyntaxNode & node_mut(NodeId id) { return nodes_.at(id); }
  void add_child(NodeId parent, NodeId child) { nodes_.at(parent).children.push_back(child); }

private:
  SourceFile source_;
  std::vector<SyntaxNode> nodes_;
};

// ============================================================================
// ParentIndex
// ============================================================================

/**
 * Maps every node to its parent, built by one traversal of a tree.
 * Must not outlive the tree it was built from.
 */
class ParentIndex
{
public:
  explicit ParentIndex(const SyntaxTree & tree);

  [[nodiscard]] NodeId parent(NodeId id) const noexcept
  {
    return id < parents_.size() ? parents_[id] : k_invalid_node;
  }

  /// Nearest ancestor of the given kind (k_invalid_node if none)
  [[nodiscard]] NodeId enclosing(NodeId id, NodeKind kind) const;

  [[nodiscard]] const SyntaxTree & tree() const noexcept { return *tree_; }

private:
  const SyntaxTree * tree_;
  std::vector<NodeId> parents_;
};

}  // namespace defcheck
