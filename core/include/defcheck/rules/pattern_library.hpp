// defcheck/rules/pattern_library.hpp - Declarative rule sets for the analyzers
//
// The library is loaded once at startup (YAML or JSON, both read through
// yaml-cpp) and shared read-only by every analyzer invocation. Keys missing
// from a rule file keep their built-in values.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "defcheck/basic/violation.hpp"

namespace defcheck
{

// ============================================================================
// Business-logic rules
// ============================================================================

/**
 * One element a business flow must implement.
 * The element is present when any keyword occurs in the function source.
 */
struct RequiredElement
{
  std::string name;
  std::vector<std::string> keywords;  ///< Lower-case substrings
  Severity severity = Severity::Critical;
  bool optional = false;  ///< Optional elements are reported as warnings
  std::string fix_strategy;
};

struct PatternRule
{
  std::string id;
  std::string name;
  std::vector<std::string> detection_keywords;  ///< Matched against name and docstring
  std::vector<std::string> detection_patterns;  ///< ECMAScript regexes, case-insensitive
  std::vector<RequiredElement> required_elements;
  Severity severity = Severity::Critical;
  std::string fix_strategy;
};

// ============================================================================
// Error-handling requirements
// ============================================================================

/**
 * A group of risky calls that must run inside a `try` body.
 *
 * Call pattern forms:
 *   "open"      bare function name
 *   ".execute"  any method called `execute`
 *   "requests." any call whose dotted name starts with `requests.`
 */
struct RiskyCallGroup
{
  std::string name;
  std::vector<std::string> call_patterns;
  Severity severity = Severity::Critical;
  bool with_statement_ok = false;  ///< A `with` block also counts as handling
  std::string description;
  std::string fix_strategy;
};

struct InputValidationConfig
{
  bool enabled = true;
  size_t min_parameters = 2;  ///< Including self/cls
  std::vector<std::string> keywords;
};

// ============================================================================
// Security and null-safety tables
// ============================================================================

struct SecurityPatterns
{
  std::vector<std::string> pii_fields;
  std::vector<std::string> sql_keywords;
  std::vector<std::string> logging_methods;
  std::vector<std::string> logger_receivers;
  std::vector<std::string> route_decorators;
  std::vector<std::string> auth_markers;
  std::vector<std::string> public_endpoints;
};

struct NullSafetyConfig
{
  std::vector<std::string> safe_accessors;
  std::vector<std::string> safe_receivers;
};

// ============================================================================
// PatternLibrary
// ============================================================================

struct PatternLibrary
{
  std::vector<PatternRule> business_rules;
  std::vector<RiskyCallGroup> error_handling;
  InputValidationConfig input_validation;
  SecurityPatterns security;
  NullSafetyConfig null_safety;

  /// Modules whose attribute accesses are never null-checked
  std::vector<std::string> allowed_modules;

  [[nodiscard]] const PatternRule * find_rule(std::string_view id) const noexcept;

  /// The complete built-in rule set
  [[nodiscard]] static PatternLibrary builtin();
};

// ============================================================================
// Loading
// ============================================================================

struct PatternLoadResult
{
  std::shared_ptr<const PatternLibrary> library;
  bool success = false;
  std::string error;

  static PatternLoadResult ok(PatternLibrary lib)
  {
    PatternLoadResult r;
    r.library = std::make_shared<const PatternLibrary>(std::move(lib));
    r.success = true;
    return r;
  }

  static PatternLoadResult fail(std::string msg)
  {
    PatternLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load a rule file (YAML or JSON) layered on top of the built-in library.
 *
 * @return PatternLoadResult with the library or a configuration error
 */
[[nodiscard]] PatternLoadResult load_pattern_library(const std::filesystem::path & path);

/// Same as load_pattern_library, for in-memory text
[[nodiscard]] PatternLoadResult load_pattern_library_from_string(const std::string & text);

/**
 * Load a rule file, falling back to the built-in library on any error.
 *
 * @param error Receives the configuration error when the fallback is taken
 */
[[nodiscard]] std::shared_ptr<const PatternLibrary> load_pattern_library_or_builtin(
  const std::filesystem::path & path, std::string * error = nullptr);

}  // namespace defcheck
