// defcheck/analysis/detectors/collection_safety.cpp - Unchecked index and pop() access
#include <cctype>

#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

/// Decimal literal without sign, underscores or base prefix
bool is_plain_index(std::string_view text) noexcept
{
  if (text.empty()) return false;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) return false;
  }
  return true;
}

void check_index(const DetectorContext & ctx, NodeId subscript, ViolationBag & bag)
{
  const SyntaxTree & tree = ctx.tree;
  const NodeId value = tree.child_by_role(subscript, FieldRole::Value);
  const NodeId index = tree.child_by_role(subscript, FieldRole::Subscript);
  if (!tree.is(value, NodeKind::Identifier) || !tree.is(index, NodeKind::Integer)) {
    return;
  }

  const std::string_view idx = tree.text(index);
  if (!is_plain_index(idx)) return;

  const std::string_view list = tree.text(value);
  if (ctx.is_module(list)) return;

  const uint32_t line = tree.node(subscript).start_line;
  if (ctx.window.has_prior_check(line, list, CheckKind::BoundsCheck, idx)) return;

  bag
    .report(
      tree.node(subscript).range, ViolationType::CollectionSafety, Severity::Warning,
      "List access '" + std::string(list) + "[" + std::string(idx) + "]' without bounds check")
    .with_suggestion(
      "if len(" + std::string(list) + ") > " + std::string(idx) + ":\n    " +
      std::string(trim(tree.source().line_text(line))));
}

void check_pop(const DetectorContext & ctx, NodeId call, ViolationBag & bag)
{
  const SyntaxTree & tree = ctx.tree;
  if (callee_short_name(tree, call) != "pop") return;
  // dict.pop(key, default) and list.pop(i) are not the empty-list case
  if (positional_argument_count(tree, call) != 0) return;

  const NodeId fn = tree.child_by_role(call, FieldRole::Function);
  const NodeId object = tree.child_by_role(fn, FieldRole::Object);
  if (!tree.is(object, NodeKind::Identifier)) return;

  const std::string_view list = tree.text(object);
  if (ctx.is_module(list)) return;

  const uint32_t line = tree.node(call).start_line;
  if (ctx.window.has_prior_check(line, list, CheckKind::EmptyCheck)) return;

  bag
    .report(
      tree.node(call).range, ViolationType::CollectionSafety, Severity::Warning,
      "Call to '" + std::string(list) + ".pop()' without empty check")
    .with_suggestion(
      "if " + std::string(list) + ":\n    " + std::string(trim(tree.source().line_text(line))));
}

}  // namespace

std::vector<Violation> detect_collection_safety(const DetectorContext & ctx)
{
  ViolationBag bag(ctx.tree.source());

  for (NodeId id = 0; id < ctx.tree.size(); ++id) {
    if (ctx.tree.is(id, NodeKind::Subscript)) {
      check_index(ctx, id, bag);
    } else if (ctx.tree.is(id, NodeKind::Call)) {
      check_pop(ctx, id, bag);
    }
  }
  return bag.take();
}

}  // namespace defcheck
