// defcheck/analysis/tree_queries.hpp - Structural queries over Python syntax trees
//
// Shared helpers for the detectors, verifiers and scanners. All functions
// accept k_invalid_node and return an empty/false result for it.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

// ============================================================================
// Expressions
// ============================================================================

/**
 * Dotted name of an identifier/attribute chain, e.g. `requests.get`.
 * Returns std::nullopt for any other expression (calls, subscripts, ...).
 */
[[nodiscard]] std::optional<std::string> qualified_name(const SyntaxTree & tree, NodeId expr);

/// Last component of the callee: `get` for `requests.get(...)`, `open` for `open(...)`
[[nodiscard]] std::string_view callee_short_name(const SyntaxTree & tree, NodeId call);

/// Whether the call's callee is an attribute (method call)
[[nodiscard]] bool is_method_call(const SyntaxTree & tree, NodeId call);

/// Receiver identifier of an attribute or method call (`logger` for `logger.info(...)`)
[[nodiscard]] std::string_view receiver_name(const SyntaxTree & tree, NodeId call);

/// Whether a call passes the named keyword argument
[[nodiscard]] bool has_keyword_argument(
  const SyntaxTree & tree, NodeId call, std::string_view name);

/// Number of plain positional arguments
[[nodiscard]] size_t positional_argument_count(const SyntaxTree & tree, NodeId call);

/// Whether a call forwards `**kwargs`
[[nodiscard]] bool has_kwargs_splat(const SyntaxTree & tree, NodeId call);

// ============================================================================
// String literals
// ============================================================================

/// String prefix letters (lower-case), e.g. "f" or "rb"
[[nodiscard]] std::string string_prefix(const SyntaxTree & tree, NodeId str);

/// Interpolated (f-)string containing at least one `{...}` placeholder
[[nodiscard]] bool is_interpolated_string(const SyntaxTree & tree, NodeId str);

/// Whether an expression is a string literal (plain or concatenated)
[[nodiscard]] bool is_string_literal(const SyntaxTree & tree, NodeId expr);

// ============================================================================
// Definitions
// ============================================================================

[[nodiscard]] std::string_view function_name(const SyntaxTree & tree, NodeId def);

/// Docstring text without quotes, if the body starts with a string literal
[[nodiscard]] std::optional<std::string> docstring(const SyntaxTree & tree, NodeId def);

/// Declared parameter names, in order (including self/cls and splats)
[[nodiscard]] std::vector<std::string> parameter_names(const SyntaxTree & tree, NodeId def);

/// Decorator expressions without the leading `@`
[[nodiscard]] std::vector<std::string> decorators(
  const SyntaxTree & tree, const ParentIndex & parents, NodeId def);

/// Innermost function definition containing a node (k_invalid_node at module level)
[[nodiscard]] NodeId enclosing_function(const ParentIndex & parents, NodeId id);

// ============================================================================
// Imports
// ============================================================================

/**
 * Names bound by import statements at any level of the file.
 *
 * `import a.b` binds `a`, `import a as b` binds `b`,
 * `from m import x as y` binds `y`.
 */
[[nodiscard]] std::unordered_set<std::string> imported_names(const SyntaxTree & tree);

/// Modules referenced by import statements (`m` for `from m import x`, `a.b` for `import a.b`)
[[nodiscard]] std::vector<std::string> imported_modules(const SyntaxTree & tree);

}  // namespace defcheck
