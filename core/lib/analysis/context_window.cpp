// defcheck/analysis/context_window.cpp
#include "defcheck/analysis/context_window.hpp"

#include <algorithm>
#include <cctype>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

bool is_all_digits(std::string_view s) noexcept
{
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

std::string build_pattern(std::string_view variable, CheckKind kind, std::string_view operand)
{
  const std::string var = regex_escape(variable);

  switch (kind) {
    case CheckKind::NoneCheck:
      return "\\b" + var + "\\s+is\\s+not\\s+None\\b";

    case CheckKind::KeyCheck:
      return "['\"]" + regex_escape(operand) + "['\"]\\s+in\\s+" + var + "\\b";

    case CheckKind::BoundsCheck: {
      const std::string len = "len\\(\\s*" + var + "\\s*\\)";
      std::string p = len + "\\s*>\\s*" + regex_escape(operand) + "\\b";
      if (is_all_digits(operand) && operand.size() < 10) {
        const unsigned long next = std::stoul(std::string(operand)) + 1;
        p += "|" + len + "\\s*>=\\s*" + std::to_string(next) + "\\b";
      }
      return p;
    }

    case CheckKind::EmptyCheck:
      return "\\b(if|elif|while)\\s+(not\\s+)?" + var + "\\b|\\b(if|elif|while)\\s+(not\\s+)?len\\(\\s*" +
             var + "\\s*\\)";

    case CheckKind::ZeroCheck:
      return "\\b" + var + "\\s*!=\\s*0\\b|\\b" + var + "\\s*>\\s*0\\b|\\b(if|elif)\\s+" + var +
             "\\b";
  }
  return var;
}

}  // namespace

ContextWindow::ContextWindow(const SyntaxTree & tree, const ParentIndex & parents, uint32_t lookback)
: tree_(tree), parents_(parents), lookback_(lookback)
{
}

const std::regex & ContextWindow::pattern_for(
  std::string_view variable, CheckKind kind, std::string_view operand) const
{
  std::string key(to_string(kind));
  key += '\x1f';
  key += variable;
  key += '\x1f';
  key += operand;

  auto it = cache_.find(key);
  if (it == cache_.end()) {
    it = cache_.emplace(std::move(key), std::regex(build_pattern(variable, kind, operand))).first;
  }
  return it->second;
}

bool ContextWindow::has_prior_check(
  uint32_t line, std::string_view variable, CheckKind kind, std::string_view operand) const
{
  if (line <= 1 || variable.empty() || lookback_ == 0) {
    return false;
  }

  const std::regex & re = pattern_for(variable, kind, operand);
  const uint32_t first = line > lookback_ ? line - lookback_ : 1;
  const SourceFile & source = tree_.source();

  for (uint32_t l = first; l < line; ++l) {
    const std::string_view text = source.line_text(l);
    if (std::regex_search(text.begin(), text.end(), re)) {
      return true;
    }
  }
  return false;
}

bool ContextWindow::is_inside_guarded_block(NodeId node, GuardKind kind) const
{
  switch (kind) {
    case GuardKind::Try:
      return in_try_body(node);
    case GuardKind::With:
      return in_with(node, false);
    case GuardKind::Lock:
      return in_with(node, true);
  }
  return false;
}

bool ContextWindow::in_try_body(NodeId node) const
{
  NodeId child = node;
  NodeId parent = parents_.parent(child);
  while (parent != k_invalid_node) {
    if (tree_.is(parent, NodeKind::TryStatement) && tree_.node(child).role == FieldRole::Body) {
      return true;
    }
    // A try around a def does not cover the function body.
    if (tree_.is(parent, NodeKind::FunctionDefinition)) {
      return false;
    }
    child = parent;
    parent = parents_.parent(child);
  }
  return false;
}

bool ContextWindow::in_with(NodeId node, bool require_lock) const
{
  NodeId child = node;
  NodeId parent = parents_.parent(child);
  while (parent != k_invalid_node) {
    if (tree_.is(parent, NodeKind::WithStatement)) {
      if (!require_lock) {
        return true;
      }
      if (tree_.node(child).role == FieldRole::Body) {
        for (const NodeId c : tree_.node(parent).children) {
          if (!tree_.is(c, NodeKind::WithClause)) continue;
          const std::string items = to_lower(tree_.text(c));
          if (contains(items, "lock") || contains(items, "mutex")) {
            return true;
          }
        }
      }
    }
    if (tree_.is(parent, NodeKind::FunctionDefinition)) {
      return false;
    }
    child = parent;
    parent = parents_.parent(child);
  }
  return false;
}

}  // namespace defcheck
