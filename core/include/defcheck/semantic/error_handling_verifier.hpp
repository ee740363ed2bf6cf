// defcheck/semantic/error_handling_verifier.hpp - Risky calls and unvalidated inputs
#pragma once

#include <vector>

#include "defcheck/analysis/context_window.hpp"
#include "defcheck/basic/violation.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

/// Whether a call matches one RiskyCallGroup call pattern
[[nodiscard]] bool call_matches_pattern(
  const SyntaxTree & tree, NodeId call, std::string_view pattern);

class ErrorHandlingVerifier
{
public:
  explicit ErrorHandlingVerifier(const PatternLibrary & library) : library_(library) {}

  /// Risky calls outside a guarding try (or with, where the group allows it)
  [[nodiscard]] std::vector<Violation> verify_risky_calls(
    const SyntaxTree & tree, const ContextWindow & window) const;

  /// Public functions whose bodies never validate their parameters
  [[nodiscard]] std::vector<Violation> verify_input_validation(const SyntaxTree & tree) const;

  [[nodiscard]] std::vector<Violation> verify(
    const SyntaxTree & tree, const ContextWindow & window) const;

private:
  const PatternLibrary & library_;
};

}  // namespace defcheck
