// defcheck/analysis/detectors/concurrency_safety.cpp - Unlocked writes to instance state
#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

/// Attribute name for a `self.<attr>` target, empty otherwise
std::string_view self_attribute(const SyntaxTree & tree, NodeId target)
{
  if (!tree.is(target, NodeKind::Attribute)) return {};
  const NodeId object = tree.child_by_role(target, FieldRole::Object);
  if (!tree.is(object, NodeKind::Identifier) || tree.text(object) != "self") return {};
  return tree.text(tree.child_by_role(target, FieldRole::Attribute));
}

}  // namespace

std::vector<Violation> detect_concurrency_safety(const DetectorContext & ctx)
{
  const SyntaxTree & tree = ctx.tree;
  ViolationBag bag(tree.source());

  for (NodeId id = 0; id < tree.size(); ++id) {
    if (!tree.is(id, NodeKind::Assignment) && !tree.is(id, NodeKind::AugmentedAssignment)) {
      continue;
    }

    const std::string_view attr = self_attribute(tree, tree.child_by_role(id, FieldRole::Left));
    if (attr.empty()) continue;

    // Construction happens before the object is shared.
    const NodeId fn = enclosing_function(ctx.parents, id);
    if (function_name(tree, fn) == "__init__") continue;

    if (ctx.window.is_inside_guarded_block(id, GuardKind::Lock)) continue;

    const uint32_t line = tree.node(id).start_line;
    bag
      .report(
        tree.node(id).range, ViolationType::ConcurrencySafety, Severity::Warning,
        "Potential shared state modification 'self." + std::string(attr) + "' without locking")
      .with_suggestion(
        "with self._lock:\n    " + std::string(trim(tree.source().line_text(line))));
  }
  return bag.take();
}

}  // namespace defcheck
