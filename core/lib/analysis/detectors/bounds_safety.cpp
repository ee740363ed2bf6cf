// defcheck/analysis/detectors/bounds_safety.cpp - Division by an unchecked divisor
#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

bool is_division(std::string_view op) noexcept
{
  return op == "/" || op == "//" || op == "%" || op == "/=" || op == "//=" || op == "%=";
}

}  // namespace

std::vector<Violation> detect_bounds_safety(const DetectorContext & ctx)
{
  const SyntaxTree & tree = ctx.tree;
  ViolationBag bag(tree.source());

  for (NodeId id = 0; id < tree.size(); ++id) {
    if (!tree.is(id, NodeKind::BinaryOperator) && !tree.is(id, NodeKind::AugmentedAssignment)) {
      continue;
    }

    const SyntaxNode & node = tree.node(id);
    const std::string_view op = tree.source().get_slice(node.operator_range);
    if (!is_division(op)) continue;

    const NodeId right = tree.child_by_role(id, FieldRole::Right);
    if (!tree.is(right, NodeKind::Identifier)) continue;

    // `"%s" % name` is string formatting
    if (op.front() == '%' && is_string_literal(tree, tree.child_by_role(id, FieldRole::Left))) {
      continue;
    }

    const std::string_view divisor = tree.text(right);
    if (ctx.window.has_prior_check(node.start_line, divisor, CheckKind::ZeroCheck)) continue;

    bag
      .report(
        node.range, ViolationType::BoundsSafety, Severity::Warning,
        "Division/modulo operation without zero check on '" + std::string(divisor) + "'")
      .with_suggestion(
        "if " + std::string(divisor) + " != 0:\n    " +
        std::string(trim(tree.source().line_text(node.start_line))));
  }
  return bag.take();
}

}  // namespace defcheck
