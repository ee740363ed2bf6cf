// defcheck/syntax/tree_dumper.cpp - JSON serialization implementation
//
#include "defcheck/syntax/tree_dumper.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace defcheck
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.begin()}, {"end", r.end()}};
}

}  // namespace

json to_json(const SyntaxTree & tree, NodeId id)
{
  if (!tree.is_valid(id)) {
    return json{{"kind", "Missing"}};
  }

  const SyntaxNode & n = tree.node(id);
  json j{
    {"kind", std::string(n.grammar_name)},
    {"line", n.start_line},
    {"column", n.start_column},
    {"end_line", n.end_line},
    {"range", j_range(n.range)}};

  if (n.role != FieldRole::None) {
    j["field"] = std::string(to_string(n.role));
  }
  if (n.operator_range.is_valid()) {
    j["operator"] = std::string(tree.source().get_slice(n.operator_range));
  }

  if (n.children.empty()) {
    j["text"] = std::string(tree.text(id));
  } else {
    json children = json::array();
    for (const NodeId c : n.children) {
      children.push_back(to_json(tree, c));
    }
    j["children"] = std::move(children);
  }
  return j;
}

json to_json(const SyntaxTree & tree)
{
  return json{{"file", tree.source().display_name()}, {"root", to_json(tree, tree.root())}};
}

std::string dump_tree_json(const SyntaxTree & tree, int indent)
{
  return to_json(tree).dump(indent);
}

}  // namespace defcheck
