// defcheck/analysis/detectors/null_safety.cpp - Possibly-None dereferences
#include <algorithm>

#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

bool listed(const std::vector<std::string> & list, std::string_view name)
{
  return std::find(list.begin(), list.end(), name) != list.end();
}

/// `d['key']` on the left of a plain assignment is a write, not a read
bool is_assignment_target(const DetectorContext & ctx, NodeId subscript)
{
  const NodeId parent = ctx.parents.parent(subscript);
  return ctx.tree.is(parent, NodeKind::Assignment) &&
         ctx.tree.node(subscript).role == FieldRole::Left;
}

/// Literal key of a plain string subscript (`'key'` -> key)
std::optional<std::string> literal_key(const SyntaxTree & tree, NodeId index)
{
  if (!tree.is(index, NodeKind::String) || !string_prefix(tree, index).empty()) {
    return std::nullopt;
  }
  std::string_view text = tree.text(index);
  if (text.size() < 2) return std::nullopt;
  return std::string(text.substr(1, text.size() - 2));
}

void check_attribute(const DetectorContext & ctx, NodeId attr, ViolationBag & bag)
{
  const SyntaxTree & tree = ctx.tree;
  const NodeId object = tree.child_by_role(attr, FieldRole::Object);
  const NodeId member = tree.child_by_role(attr, FieldRole::Attribute);
  if (!tree.is(object, NodeKind::Identifier) || member == k_invalid_node) {
    return;
  }

  const std::string_view var = tree.text(object);
  const std::string_view name = tree.text(member);

  if (listed(ctx.patterns.null_safety.safe_accessors, name)) return;
  if (listed(ctx.patterns.null_safety.safe_receivers, var)) return;
  if (ctx.is_module(var)) return;

  const uint32_t line = tree.node(attr).start_line;
  if (ctx.window.has_prior_check(line, var, CheckKind::NoneCheck)) {
    return;
  }

  bag
    .report(
      tree.node(attr).range, ViolationType::NullSafety, Severity::Critical,
      "Attribute access on '" + std::string(var) + "' without None check")
    .with_suggestion(
      "if " + std::string(var) + " is not None:\n    " +
      std::string(trim(tree.source().line_text(line))));
}

void check_key_access(const DetectorContext & ctx, NodeId subscript, ViolationBag & bag)
{
  const SyntaxTree & tree = ctx.tree;
  const NodeId value = tree.child_by_role(subscript, FieldRole::Value);
  const NodeId index = tree.child_by_role(subscript, FieldRole::Subscript);
  if (!tree.is(value, NodeKind::Identifier)) return;

  const auto key = literal_key(tree, index);
  if (!key) return;

  const std::string_view dict = tree.text(value);
  if (listed(ctx.patterns.null_safety.safe_receivers, dict)) return;
  if (ctx.is_module(dict)) return;
  if (is_assignment_target(ctx, subscript)) return;

  const uint32_t line = tree.node(subscript).start_line;
  if (contains(tree.source().line_text(line), ".get(")) return;
  if (ctx.window.has_prior_check(line, dict, CheckKind::KeyCheck, *key)) return;

  const std::string access = std::string(tree.text(subscript));
  bag
    .report(
      tree.node(subscript).range, ViolationType::NullSafety, Severity::Critical,
      "Dictionary access '" + access + "' without key check")
    .with_suggestion(std::string(dict) + ".get(" + std::string(tree.text(index)) + ", None)");
}

}  // namespace

std::vector<Violation> detect_null_safety(const DetectorContext & ctx)
{
  ViolationBag bag(ctx.tree.source());

  for (NodeId id = 0; id < ctx.tree.size(); ++id) {
    switch (ctx.tree.kind(id)) {
      case NodeKind::Attribute:
        check_attribute(ctx, id, bag);
        break;
      case NodeKind::Subscript:
        check_key_access(ctx, id, bag);
        break;
      default:
        break;
    }
  }
  return bag.take();
}

}  // namespace defcheck
