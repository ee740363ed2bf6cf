// defcheck/security/security_scanner.hpp - SQL injection, PII logging and endpoint auth checks
//
// The SQL checks deliberately over-approximate: any SQL-looking string built
// by interpolation, concatenation or .format() is reported, whether or not
// the interpolated value can be attacker-controlled.
//
#pragma once

#include <optional>
#include <regex>
#include <string_view>
#include <vector>

#include "defcheck/basic/violation.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

class SecurityScanner
{
public:
  explicit SecurityScanner(const PatternLibrary & library);

  /// f-strings, concatenation and .format() building SQL text
  [[nodiscard]] std::vector<Violation> scan_sql_injection(const SyntaxTree & tree) const;

  /// Logging calls whose source line mentions a PII field
  [[nodiscard]] std::vector<Violation> scan_pii_logging(const SyntaxTree & tree) const;

  /// Route handlers without an authentication decorator
  [[nodiscard]] std::vector<Violation> scan_missing_authentication(
    const SyntaxTree & tree, const ParentIndex & parents) const;

  [[nodiscard]] std::vector<Violation> scan(
    const SyntaxTree & tree, const ParentIndex & parents) const;

  /// Whether a call is a logging call (method or receiver based)
  [[nodiscard]] bool is_logging_call(const SyntaxTree & tree, NodeId call) const;

private:
  struct SqlLiteralUse
  {
    bool concatenated = false;  ///< SQL literal followed by `+`
    bool formatted = false;     ///< SQL literal followed by `.format(`
  };

  /// How SQL-bearing string literals on one source line are combined
  [[nodiscard]] SqlLiteralUse sql_literal_use(std::string_view line) const;

  const SecurityPatterns & patterns_;

  // Empty when no SQL keywords are configured
  std::optional<std::regex> sql_keyword_re_;
};

}  // namespace defcheck
