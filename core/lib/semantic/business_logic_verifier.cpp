// defcheck/semantic/business_logic_verifier.cpp
#include "defcheck/semantic/business_logic_verifier.hpp"

#include <algorithm>

#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

std::string humanize(std::string_view element)
{
  std::string out(element);
  std::replace(out.begin(), out.end(), '_', ' ');
  return out;
}

}  // namespace

BusinessLogicVerifier::BusinessLogicVerifier(const PatternLibrary & library) : library_(library)
{
  rule_patterns_.reserve(library_.business_rules.size());
  for (const auto & rule : library_.business_rules) {
    std::vector<std::regex> compiled;
    for (const auto & p : rule.detection_patterns) {
      compiled.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
    }
    rule_patterns_.push_back(std::move(compiled));
  }
}

bool BusinessLogicVerifier::matches(
  size_t rule_index, std::string_view name, std::string_view docstring) const
{
  const PatternRule & rule = library_.business_rules.at(rule_index);
  const std::string lname = to_lower(name);
  const std::string ldoc = to_lower(docstring);

  for (const auto & kw : rule.detection_keywords) {
    const std::string lkw = to_lower(kw);
    if (contains(lname, lkw) || contains(ldoc, lkw)) {
      return true;
    }
  }
  for (const auto & re : rule_patterns_.at(rule_index)) {
    if (std::regex_search(lname, re) || std::regex_search(ldoc, re)) {
      return true;
    }
  }
  return false;
}

std::vector<Violation> BusinessLogicVerifier::verify(const SyntaxTree & tree) const
{
  ViolationBag bag(tree.source());

  for (const NodeId def : tree.nodes_of_kind(NodeKind::FunctionDefinition)) {
    const std::string_view name = function_name(tree, def);
    const std::string doc = docstring(tree, def).value_or(std::string());
    const std::string body = to_lower(tree.text(def));

    for (size_t i = 0; i < library_.business_rules.size(); ++i) {
      if (!matches(i, name, doc)) continue;

      const PatternRule & rule = library_.business_rules[i];
      for (const RequiredElement & element : rule.required_elements) {
        const bool present = std::any_of(
          element.keywords.begin(), element.keywords.end(),
          [&](const std::string & kw) { return contains(body, to_lower(kw)); });
        if (present) continue;

        const Severity severity = element.optional ? Severity::Warning : element.severity;
        bag
          .report_line(
            tree.node(def).start_line, ViolationType::BusinessLogicIncomplete, severity,
            rule.name + " missing: " + element.name)
          .with_suggestion(
            element.fix_strategy.empty() ? "Implement " + humanize(element.name)
                                         : element.fix_strategy);
      }
    }
  }
  return bag.take();
}

}  // namespace defcheck
