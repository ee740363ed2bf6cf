// defcheck/semantic/business_logic_verifier.hpp - Business-flow completeness checks
#pragma once

#include <regex>
#include <vector>

#include "defcheck/basic/violation.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

/**
 * Matches functions to the business rules of a PatternLibrary and reports
 * every required element the function body never mentions.
 *
 * A function matches a rule when its lower-cased name or docstring contains
 * one of the rule's detection keywords, or one of its detection patterns
 * matches either of them. Element presence is a keyword search over the
 * lower-cased source text of the whole function.
 */
class BusinessLogicVerifier
{
public:
  /// Compiles the rule patterns; invalid patterns were rejected at load time.
  explicit BusinessLogicVerifier(const PatternLibrary & library);

  [[nodiscard]] std::vector<Violation> verify(const SyntaxTree & tree) const;

  /// Whether a function with this name/docstring falls under the rule
  [[nodiscard]] bool matches(
    size_t rule_index, std::string_view name, std::string_view docstring) const;

private:
  const PatternLibrary & library_;
  std::vector<std::vector<std::regex>> rule_patterns_;  ///< Parallel to business_rules
};

}  // namespace defcheck
