// defcheck/syntax/node_kind.hpp - Node kind and field role enumerations
//
// Both enumerations are generated from node_kinds.def. Grammar node types
// that have no dedicated enumerator map to NodeKind::Other; the syntax node
// keeps the grammar name for those.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace defcheck
{

// ============================================================================
// NodeKind
// ============================================================================

enum class NodeKind : uint8_t {
#define SYNTAX_NODE(Kind, GrammarName) Kind,
#include "defcheck/syntax/node_kinds.def"
  Other,
};

// ============================================================================
// FieldRole - role of a node inside its parent
// ============================================================================

enum class FieldRole : uint8_t {
  None,
#define FIELD_ROLE(Role, FieldName) Role,
#include "defcheck/syntax/node_kinds.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define SYNTAX_NODE(Kind, GrammarName) \
  case NodeKind::Kind:                 \
    return GrammarName;
#include "defcheck/syntax/node_kinds.def"
    case NodeKind::Other:
      return "other";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FieldRole role) noexcept
{
  switch (role) {
    case FieldRole::None:
      return "";
#define FIELD_ROLE(Role, FieldName) \
  case FieldRole::Role:             \
    return FieldName;
#include "defcheck/syntax/node_kinds.def"
  }
  return "";
}

/// Map a tree-sitter node type to a NodeKind (NodeKind::Other if unknown)
[[nodiscard]] NodeKind node_kind_from_grammar(std::string_view grammar_name) noexcept;

/// Map a tree-sitter field name to a FieldRole (FieldRole::None if unknown)
[[nodiscard]] FieldRole field_role_from_grammar(std::string_view field_name) noexcept;

}  // namespace defcheck
