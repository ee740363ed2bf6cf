// defcheck/analysis/detectors.hpp - Defensive-pattern violation detectors
//
// Each detector is a pure function of a DetectorContext. Detectors share no
// mutable state, so distinct files can be checked concurrently.
//
#pragma once

#include <gsl/span>

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "defcheck/analysis/context_window.hpp"
#include "defcheck/basic/violation.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

/**
 * Everything a detector may look at for one file.
 */
struct DetectorContext
{
  const SyntaxTree & tree;
  const ParentIndex & parents;
  const ContextWindow & window;
  const PatternLibrary & patterns;

  /// Imported names, allow-listed modules and local classes; never null-checked
  std::unordered_set<std::string> module_names;

  DetectorContext(
    const SyntaxTree & t, const ParentIndex & p, const ContextWindow & w,
    const PatternLibrary & lib);

  [[nodiscard]] bool is_module(std::string_view name) const
  {
    return module_names.count(std::string(name)) != 0;
  }
};

using DetectorFn = std::vector<Violation> (*)(const DetectorContext &);

struct DetectorInfo
{
  std::string_view name;
  ViolationType type;
  DetectorFn run;
};

// ============================================================================
// Detectors
// ============================================================================

/// Attribute access / dict key access on a possibly-None value
[[nodiscard]] std::vector<Violation> detect_null_safety(const DetectorContext & ctx);

/// Constant index access and pop() without a bounds/emptiness check
[[nodiscard]] std::vector<Violation> detect_collection_safety(const DetectorContext & ctx);

/// HTTP and subprocess calls without a timeout
[[nodiscard]] std::vector<Violation> detect_external_call_safety(const DetectorContext & ctx);

/// int()/float()/json.loads() outside a try body
[[nodiscard]] std::vector<Violation> detect_type_safety(const DetectorContext & ctx);

/// Division/modulo by an unchecked variable
[[nodiscard]] std::vector<Violation> detect_bounds_safety(const DetectorContext & ctx);

/// Bare except clauses and swallowed exceptions
[[nodiscard]] std::vector<Violation> detect_exception_handling(const DetectorContext & ctx);

/// Shared instance state mutated without a lock
[[nodiscard]] std::vector<Violation> detect_concurrency_safety(const DetectorContext & ctx);

// ============================================================================
// Registry
// ============================================================================

[[nodiscard]] gsl::span<const DetectorInfo> all_detectors() noexcept;

/// Run every registered detector and concatenate the results
[[nodiscard]] std::vector<Violation> run_all_detectors(const DetectorContext & ctx);

}  // namespace defcheck
