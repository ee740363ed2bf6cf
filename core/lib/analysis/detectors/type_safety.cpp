// defcheck/analysis/detectors/type_safety.cpp - Conversions that can raise outside a try body
#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

/// Literal arguments cannot fail to convert
bool converts_literal(const SyntaxTree & tree, NodeId call)
{
  const NodeId args = tree.child_by_role(call, FieldRole::Arguments);
  if (!tree.is(args, NodeKind::ArgumentList)) return false;
  const auto & children = tree.node(args).children;
  if (children.size() != 1) return false;
  return tree.is(children.front(), NodeKind::Integer) || tree.is(children.front(), NodeKind::Float);
}

}  // namespace

std::vector<Violation> detect_type_safety(const DetectorContext & ctx)
{
  const SyntaxTree & tree = ctx.tree;
  ViolationBag bag(tree.source());

  for (const NodeId call : tree.nodes_of_kind(NodeKind::Call)) {
    const auto callee = qualified_name(tree, tree.child_by_role(call, FieldRole::Function));
    if (!callee) continue;

    const bool conversion = *callee == "int" || *callee == "float";
    const bool json = *callee == "json.loads" || *callee == "json.load";
    if (!conversion && !json) continue;

    if (positional_argument_count(tree, call) == 0 && !has_kwargs_splat(tree, call)) continue;
    if (conversion && converts_literal(tree, call)) continue;
    if (ctx.window.is_inside_guarded_block(call, GuardKind::Try)) continue;

    const std::string line(trim(tree.source().line_text(tree.node(call).start_line)));

    if (conversion) {
      bag
        .report(
          tree.node(call).range, ViolationType::TypeSafety, Severity::Warning,
          *callee + "() conversion without exception handling")
        .with_suggestion("try:\n    " + line + "\nexcept ValueError:\n    # handle invalid input");
    } else {
      bag
        .report(
          tree.node(call).range, ViolationType::TypeSafety, Severity::Warning,
          *callee + "() without exception handling")
        .with_suggestion(
          "try:\n    " + line + "\nexcept json.JSONDecodeError:\n    # handle malformed JSON");
    }
  }
  return bag.take();
}

}  // namespace defcheck
