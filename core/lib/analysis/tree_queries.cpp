// defcheck/analysis/tree_queries.cpp
#include "defcheck/analysis/tree_queries.hpp"

#include <cctype>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

NodeId call_arguments(const SyntaxTree & tree, NodeId call)
{
  if (!tree.is(call, NodeKind::Call)) return k_invalid_node;
  const NodeId args = tree.child_by_role(call, FieldRole::Arguments);
  return tree.is(args, NodeKind::ArgumentList) ? args : k_invalid_node;
}

/// First identifier inside a parameter node
std::string parameter_identifier(const SyntaxTree & tree, NodeId param)
{
  if (tree.is(param, NodeKind::Identifier)) {
    return std::string(tree.text(param));
  }
  for (const NodeId c : tree.node(param).children) {
    if (tree.node(c).role == FieldRole::Type || tree.node(c).role == FieldRole::Value) {
      continue;
    }
    if (tree.is(c, NodeKind::Identifier)) {
      return std::string(tree.text(c));
    }
    if (tree.is(c, NodeKind::ListSplatPattern) || tree.is(c, NodeKind::DictionarySplatPattern)) {
      return parameter_identifier(tree, c);
    }
  }
  return {};
}

std::string first_dotted_component(std::string_view dotted)
{
  const size_t dot = dotted.find('.');
  return std::string(trim(dot == std::string_view::npos ? dotted : dotted.substr(0, dot)));
}

}  // namespace

// ============================================================================
// Expressions
// ============================================================================

std::optional<std::string> qualified_name(const SyntaxTree & tree, NodeId expr)
{
  if (tree.is(expr, NodeKind::Identifier)) {
    return std::string(tree.text(expr));
  }
  if (tree.is(expr, NodeKind::Attribute)) {
    const NodeId object = tree.child_by_role(expr, FieldRole::Object);
    const NodeId attr = tree.child_by_role(expr, FieldRole::Attribute);
    auto base = qualified_name(tree, object);
    if (!base || attr == k_invalid_node) {
      return std::nullopt;
    }
    *base += '.';
    *base += tree.text(attr);
    return base;
  }
  return std::nullopt;
}

std::string_view callee_short_name(const SyntaxTree & tree, NodeId call)
{
  if (!tree.is(call, NodeKind::Call)) return {};
  const NodeId fn = tree.child_by_role(call, FieldRole::Function);
  if (tree.is(fn, NodeKind::Identifier)) {
    return tree.text(fn);
  }
  if (tree.is(fn, NodeKind::Attribute)) {
    return tree.text(tree.child_by_role(fn, FieldRole::Attribute));
  }
  return {};
}

bool is_method_call(const SyntaxTree & tree, NodeId call)
{
  if (!tree.is(call, NodeKind::Call)) return false;
  return tree.is(tree.child_by_role(call, FieldRole::Function), NodeKind::Attribute);
}

std::string_view receiver_name(const SyntaxTree & tree, NodeId call)
{
  NodeId attr = call;
  if (tree.is(call, NodeKind::Call)) {
    attr = tree.child_by_role(call, FieldRole::Function);
  }
  if (!tree.is(attr, NodeKind::Attribute)) return {};
  const NodeId object = tree.child_by_role(attr, FieldRole::Object);
  if (tree.is(object, NodeKind::Identifier)) {
    return tree.text(object);
  }
  if (tree.is(object, NodeKind::Attribute)) {
    // `self.logger.info` -> `logger`
    return tree.text(tree.child_by_role(object, FieldRole::Attribute));
  }
  return {};
}

bool has_keyword_argument(const SyntaxTree & tree, NodeId call, std::string_view name)
{
  const NodeId args = call_arguments(tree, call);
  if (args == k_invalid_node) return false;
  for (const NodeId a : tree.node(args).children) {
    if (!tree.is(a, NodeKind::KeywordArgument)) continue;
    if (tree.text(tree.child_by_role(a, FieldRole::Name)) == name) {
      return true;
    }
  }
  return false;
}

size_t positional_argument_count(const SyntaxTree & tree, NodeId call)
{
  const NodeId args = call_arguments(tree, call);
  if (args == k_invalid_node) return 0;
  size_t count = 0;
  for (const NodeId a : tree.node(args).children) {
    switch (tree.kind(a)) {
      case NodeKind::KeywordArgument:
      case NodeKind::ListSplat:
      case NodeKind::DictionarySplat:
      case NodeKind::Comment:
        break;
      default:
        ++count;
        break;
    }
  }
  return count;
}

bool has_kwargs_splat(const SyntaxTree & tree, NodeId call)
{
  const NodeId args = call_arguments(tree, call);
  if (args == k_invalid_node) return false;
  for (const NodeId a : tree.node(args).children) {
    if (tree.is(a, NodeKind::DictionarySplat)) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// String literals
// ============================================================================

std::string string_prefix(const SyntaxTree & tree, NodeId str)
{
  if (!tree.is(str, NodeKind::String)) return {};
  std::string prefix;
  for (const char c : tree.text(str)) {
    if (c == '"' || c == '\'') break;
    prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return prefix;
}

bool is_interpolated_string(const SyntaxTree & tree, NodeId str)
{
  if (!contains(string_prefix(tree, str), "f")) {
    return false;
  }
  for (const NodeId c : tree.node(str).children) {
    if (tree.is(c, NodeKind::Interpolation)) {
      return true;
    }
  }
  return false;
}

bool is_string_literal(const SyntaxTree & tree, NodeId expr)
{
  return tree.is(expr, NodeKind::String) || tree.is(expr, NodeKind::ConcatenatedString);
}

// ============================================================================
// Definitions
// ============================================================================

std::string_view function_name(const SyntaxTree & tree, NodeId def)
{
  if (!tree.is(def, NodeKind::FunctionDefinition)) return {};
  return tree.text(tree.child_by_role(def, FieldRole::Name));
}

std::optional<std::string> docstring(const SyntaxTree & tree, NodeId def)
{
  const NodeId body = tree.child_by_role(def, FieldRole::Body);
  if (body == k_invalid_node) return std::nullopt;

  for (const NodeId stmt : tree.node(body).children) {
    if (tree.is(stmt, NodeKind::Comment)) continue;
    if (!tree.is(stmt, NodeKind::ExpressionStatement)) return std::nullopt;
    const auto & children = tree.node(stmt).children;
    if (children.size() != 1 || !tree.is(children.front(), NodeKind::String)) {
      return std::nullopt;
    }

    std::string_view text = tree.text(children.front());
    text.remove_prefix(string_prefix(tree, children.front()).size());
    const std::string_view quote = (starts_with(text, "\"\"\"") || starts_with(text, "'''"))
                                     ? text.substr(0, 3)
                                     : text.substr(0, 1);
    if (text.size() >= quote.size() * 2) {
      text = text.substr(quote.size(), text.size() - quote.size() * 2);
    }
    return std::string(text);
  }
  return std::nullopt;
}

std::vector<std::string> parameter_names(const SyntaxTree & tree, NodeId def)
{
  std::vector<std::string> names;
  const NodeId params = tree.child_by_role(def, FieldRole::Parameters);
  if (params == k_invalid_node) return names;

  for (const NodeId p : tree.node(params).children) {
    if (tree.is(p, NodeKind::Comment)) continue;
    std::string name = parameter_identifier(tree, p);
    if (!name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

std::vector<std::string> decorators(
  const SyntaxTree & tree, const ParentIndex & parents, NodeId def)
{
  std::vector<std::string> out;
  const NodeId wrapper = parents.parent(def);
  if (!tree.is(wrapper, NodeKind::DecoratedDefinition)) return out;

  for (const NodeId c : tree.node(wrapper).children) {
    if (!tree.is(c, NodeKind::Decorator)) continue;
    std::string_view text = trim(tree.text(c));
    if (!text.empty() && text.front() == '@') {
      text.remove_prefix(1);
    }
    out.emplace_back(trim(text));
  }
  return out;
}

NodeId enclosing_function(const ParentIndex & parents, NodeId id)
{
  return parents.enclosing(id, NodeKind::FunctionDefinition);
}

// ============================================================================
// Imports
// ============================================================================

std::unordered_set<std::string> imported_names(const SyntaxTree & tree)
{
  std::unordered_set<std::string> names;

  for (NodeId id = 0; id < tree.size(); ++id) {
    const NodeKind k = tree.kind(id);
    if (k != NodeKind::ImportStatement && k != NodeKind::ImportFromStatement) continue;

    for (const NodeId c : tree.node(id).children) {
      if (tree.node(c).role != FieldRole::Name) continue;

      if (tree.is(c, NodeKind::AliasedImport)) {
        names.emplace(tree.text(tree.child_by_role(c, FieldRole::Alias)));
      } else if (k == NodeKind::ImportStatement) {
        names.insert(first_dotted_component(tree.text(c)));
      } else {
        names.emplace(trim(tree.text(c)));
      }
    }
  }
  return names;
}

std::vector<std::string> imported_modules(const SyntaxTree & tree)
{
  std::vector<std::string> modules;

  for (NodeId id = 0; id < tree.size(); ++id) {
    if (tree.is(id, NodeKind::ImportFromStatement)) {
      const NodeId m = tree.child_by_role(id, FieldRole::ModuleName);
      if (m != k_invalid_node) {
        modules.emplace_back(trim(tree.text(m)));
      }
    } else if (tree.is(id, NodeKind::ImportStatement)) {
      for (const NodeId c : tree.node(id).children) {
        if (tree.node(c).role != FieldRole::Name) continue;
        const NodeId dotted =
          tree.is(c, NodeKind::AliasedImport) ? tree.child_by_role(c, FieldRole::Name) : c;
        modules.emplace_back(trim(tree.text(dotted)));
      }
    }
  }
  return modules;
}

}  // namespace defcheck
