// defcheck/semantic/error_handling_verifier.cpp
#include "defcheck/semantic/error_handling_verifier.hpp"

#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

bool call_matches_pattern(const SyntaxTree & tree, NodeId call, std::string_view pattern)
{
  if (pattern.empty() || !tree.is(call, NodeKind::Call)) {
    return false;
  }

  // ".execute": any method with that name
  if (pattern.front() == '.') {
    return is_method_call(tree, call) && callee_short_name(tree, call) == pattern.substr(1);
  }

  const NodeId fn = tree.child_by_role(call, FieldRole::Function);

  // "requests.": dotted callee with that prefix
  if (pattern.back() == '.') {
    const auto name = qualified_name(tree, fn);
    return name && starts_with(*name, pattern);
  }

  // "open": bare function
  return tree.is(fn, NodeKind::Identifier) && tree.text(fn) == pattern;
}

std::vector<Violation> ErrorHandlingVerifier::verify_risky_calls(
  const SyntaxTree & tree, const ContextWindow & window) const
{
  ViolationBag bag(tree.source());

  for (const NodeId call : tree.nodes_of_kind(NodeKind::Call)) {
    for (const RiskyCallGroup & group : library_.error_handling) {
      bool hit = false;
      for (const auto & pattern : group.call_patterns) {
        if (call_matches_pattern(tree, call, pattern)) {
          hit = true;
          break;
        }
      }
      if (!hit) continue;

      if (window.is_inside_guarded_block(call, GuardKind::Try)) continue;
      if (group.with_statement_ok && window.is_inside_guarded_block(call, GuardKind::With)) {
        continue;
      }

      bag
        .report(
          tree.node(call).range, ViolationType::ErrorHandlingMissing, group.severity,
          group.description.empty() ? group.name + " without error handling" : group.description)
        .with_suggestion(group.fix_strategy);
    }
  }
  return bag.take();
}

std::vector<Violation> ErrorHandlingVerifier::verify_input_validation(const SyntaxTree & tree) const
{
  ViolationBag bag(tree.source());
  const InputValidationConfig & config = library_.input_validation;
  if (!config.enabled) {
    return bag.take();
  }

  for (const NodeId def : tree.nodes_of_kind(NodeKind::FunctionDefinition)) {
    const std::string_view name = function_name(tree, def);
    if (name.empty() || name.front() == '_') continue;
    if (parameter_names(tree, def).size() < config.min_parameters) continue;

    const std::string body = to_lower(tree.text(def));
    if (contains_any(body, config.keywords)) continue;

    bag
      .report_line(
        tree.node(def).start_line, ViolationType::ValidationMissing, Severity::Warning,
        "Function '" + std::string(name) + "' lacks input validation")
      .with_suggestion("Add input validation at the beginning of the function");
  }
  return bag.take();
}

std::vector<Violation> ErrorHandlingVerifier::verify(
  const SyntaxTree & tree, const ContextWindow & window) const
{
  ViolationBag bag(tree.source());
  bag.merge(verify_risky_calls(tree, window));
  bag.merge(verify_input_validation(tree));
  return bag.take();
}

}  // namespace defcheck
