// defcheck/syntax/node_kind.cpp - Grammar name lookup tables
#include "defcheck/syntax/node_kind.hpp"

#include <string>
#include <unordered_map>

namespace defcheck
{

namespace
{

const std::unordered_map<std::string_view, NodeKind> & kind_table()
{
  static const std::unordered_map<std::string_view, NodeKind> table = {
#define SYNTAX_NODE(Kind, GrammarName) {GrammarName, NodeKind::Kind},
#include "defcheck/syntax/node_kinds.def"
  };
  return table;
}

const std::unordered_map<std::string_view, FieldRole> & role_table()
{
  static const std::unordered_map<std::string_view, FieldRole> table = {
#define FIELD_ROLE(Role, FieldName) {FieldName, FieldRole::Role},
#include "defcheck/syntax/node_kinds.def"
  };
  return table;
}

}  // namespace

NodeKind node_kind_from_grammar(std::string_view grammar_name) noexcept
{
  const auto & table = kind_table();
  const auto it = table.find(grammar_name);
  return it == table.end() ? NodeKind::Other : it->second;
}

FieldRole field_role_from_grammar(std::string_view field_name) noexcept
{
  if (field_name.empty()) {
    return FieldRole::None;
  }
  const auto & table = role_table();
  const auto it = table.find(field_name);
  return it == table.end() ? FieldRole::None : it->second;
}

}  // namespace defcheck
