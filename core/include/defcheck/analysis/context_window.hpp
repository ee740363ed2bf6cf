// defcheck/analysis/context_window.hpp - Textual and structural guard checks
//
// Two kinds of question are answered here:
//   - has_prior_check: does one of the N lines above a statement contain a
//     textual guard such as `x is not None` or `len(x) > 2`?
//   - is_inside_guarded_block: is a node nested in a try body, a with block
//     or a lock-holding with block?
//
// The textual check is a heuristic: it may accept checks on unrelated
// branches and miss checks further away than the look-back distance.
//
#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

inline constexpr uint32_t k_default_lookback_lines = 5;

enum class CheckKind : uint8_t {
  NoneCheck,    ///< `VAR is not None`
  KeyCheck,     ///< `'KEY' in VAR`
  BoundsCheck,  ///< `len(VAR) > IDX` / `len(VAR) >= IDX+1`
  EmptyCheck,   ///< `if VAR` / `if not VAR` / `if len(VAR)`
  ZeroCheck,    ///< `VAR != 0` / `VAR > 0` / `if VAR`
};

enum class GuardKind : uint8_t {
  Try,   ///< Inside the body of a try statement
  With,  ///< Inside any with statement
  Lock,  ///< Inside a with statement whose items mention a lock or mutex
};

[[nodiscard]] constexpr std::string_view to_string(CheckKind k) noexcept
{
  switch (k) {
    case CheckKind::NoneCheck:
      return "none_check";
    case CheckKind::KeyCheck:
      return "key_check";
    case CheckKind::BoundsCheck:
      return "bounds_check";
    case CheckKind::EmptyCheck:
      return "empty_check";
    case CheckKind::ZeroCheck:
      return "zero_check";
  }
  return "";
}

/**
 * Guard queries for one parsed file.
 *
 * Compiled patterns are cached per instance. An instance belongs to the
 * worker analyzing its file and is not shared between threads.
 */
class ContextWindow
{
public:
  ContextWindow(
    const SyntaxTree & tree, const ParentIndex & parents,
    uint32_t lookback = k_default_lookback_lines);

  /**
   * Whether any of the `lookback` lines strictly above `line` holds the check.
   *
   * @param line 1-indexed line of the statement being checked
   * @param variable Identifier the check is about
   * @param kind Which check to look for
   * @param operand Key (KeyCheck) or index (BoundsCheck); unused otherwise
   */
  [[nodiscard]] bool has_prior_check(
    uint32_t line, std::string_view variable, CheckKind kind,
    std::string_view operand = {}) const;

  [[nodiscard]] bool is_inside_guarded_block(NodeId node, GuardKind kind) const;

private:
  [[nodiscard]] const std::regex & pattern_for(
    std::string_view variable, CheckKind kind, std::string_view operand) const;

  [[nodiscard]] bool in_try_body(NodeId node) const;
  [[nodiscard]] bool in_with(NodeId node, bool require_lock) const;

  const SyntaxTree & tree_;
  const ParentIndex & parents_;
  uint32_t lookback_;

  mutable std::unordered_map<std::string, std::regex> cache_;
};

}  // namespace defcheck
