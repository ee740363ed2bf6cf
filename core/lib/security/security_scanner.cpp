// defcheck/security/security_scanner.cpp
#include "defcheck/security/security_scanner.hpp"

#include <algorithm>

#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

constexpr auto k_icase = std::regex::ECMAScript | std::regex::icase;

constexpr std::string_view k_parameterize_hint =
  "Use parameterized queries with placeholders (?, %s) instead of ";

bool listed(const std::vector<std::string> & list, std::string_view name)
{
  return std::find(list.begin(), list.end(), name) != list.end();
}

/// Last name component of a decorator expression: `route` for `app.route('/x')`
std::string_view decorator_name(std::string_view expr)
{
  const size_t paren = expr.find('(');
  if (paren != std::string_view::npos) expr = expr.substr(0, paren);
  expr = trim(expr);
  const size_t dot = expr.rfind('.');
  return dot == std::string_view::npos ? expr : expr.substr(dot + 1);
}

}  // namespace

SecurityScanner::SecurityScanner(const PatternLibrary & library) : patterns_(library.security)
{
  if (patterns_.sql_keywords.empty()) {
    return;
  }

  std::vector<std::string> escaped;
  escaped.reserve(patterns_.sql_keywords.size());
  for (const auto & kw : patterns_.sql_keywords) {
    escaped.push_back(regex_escape(kw));
  }
  sql_keyword_re_.emplace("\\b(?:" + join(escaped, "|") + ")\\b", k_icase);
}

SecurityScanner::SqlLiteralUse SecurityScanner::sql_literal_use(std::string_view line) const
{
  SqlLiteralUse use;

  // Quoted spans are paired left to right; either quote character closes a span.
  size_t pos = 0;
  while (pos < line.size()) {
    const size_t open = line.find_first_of("\"'", pos);
    if (open == std::string_view::npos) break;
    const size_t close = line.find_first_of("\"'", open + 1);
    if (close == std::string_view::npos) break;
    pos = close + 1;

    const std::string_view body = line.substr(open + 1, close - open - 1);
    if (!std::regex_search(body.begin(), body.end(), *sql_keyword_re_)) continue;

    const std::string_view rest = trim(line.substr(pos));
    if (starts_with(rest, "+")) use.concatenated = true;
    if (starts_with(rest, ".format(")) use.formatted = true;
  }
  return use;
}

std::vector<Violation> SecurityScanner::scan_sql_injection(const SyntaxTree & tree) const
{
  ViolationBag bag(tree.source());
  if (!sql_keyword_re_) {
    return bag.take();
  }

  for (const NodeId str : tree.nodes_of_kind(NodeKind::String)) {
    if (!is_interpolated_string(tree, str)) continue;
    const std::string_view text = tree.text(str);
    if (!std::regex_search(text.begin(), text.end(), *sql_keyword_re_)) continue;

    bag
      .report(
        tree.node(str).range, ViolationType::SqlInjection, Severity::Critical,
        "Potential SQL injection vulnerability: f-string with SQL query")
      .with_suggestion(std::string(k_parameterize_hint) + "f-strings");
  }

  const SourceFile & source = tree.source();
  for (uint32_t line = 1; line <= source.line_count(); ++line) {
    const std::string_view text = source.line_text(line);
    if (is_comment_line(text)) continue;

    const SqlLiteralUse use = sql_literal_use(text);
    if (use.concatenated) {
      bag
        .report_line(
          line, ViolationType::SqlInjection, Severity::Critical,
          "Potential SQL injection vulnerability: string concatenation in SQL query")
        .with_suggestion(std::string(k_parameterize_hint) + "string concatenation");
    }
    if (use.formatted) {
      bag
        .report_line(
          line, ViolationType::SqlInjection, Severity::Critical,
          "Potential SQL injection vulnerability: .format() with SQL query")
        .with_suggestion(std::string(k_parameterize_hint) + ".format()");
    }
  }
  return bag.take();
}

bool SecurityScanner::is_logging_call(const SyntaxTree & tree, NodeId call) const
{
  if (!is_method_call(tree, call)) return false;

  const std::string_view method = callee_short_name(tree, call);
  if (method == "getLogger" || method == "basicConfig") return false;
  if (listed(patterns_.logging_methods, method)) return true;

  const NodeId fn = tree.child_by_role(call, FieldRole::Function);
  const NodeId object = tree.child_by_role(fn, FieldRole::Object);
  return tree.is(object, NodeKind::Identifier) &&
         listed(patterns_.logger_receivers, tree.text(object));
}

std::vector<Violation> SecurityScanner::scan_pii_logging(const SyntaxTree & tree) const
{
  ViolationBag bag(tree.source());

  for (const NodeId call : tree.nodes_of_kind(NodeKind::Call)) {
    if (!is_logging_call(tree, call)) continue;

    const std::string_view line = tree.source().line_text(tree.node(call).start_line);
    for (const auto & field : patterns_.pii_fields) {
      if (!contains_word(line, field)) continue;
      bag
        .report(
          tree.node(call).range, ViolationType::PiiLeak, Severity::Critical,
          "Potential PII leak: '" + field + "' in log statement")
        .with_suggestion("Remove or mask '" + field + "' from log output");
    }
  }
  return bag.take();
}

std::vector<Violation> SecurityScanner::scan_missing_authentication(
  const SyntaxTree & tree, const ParentIndex & parents) const
{
  ViolationBag bag(tree.source());

  for (const NodeId def : tree.nodes_of_kind(NodeKind::FunctionDefinition)) {
    const std::vector<std::string> decos = decorators(tree, parents, def);
    if (decos.empty()) continue;

    bool has_route = false;
    bool has_auth = false;
    for (const auto & d : decos) {
      if (listed(patterns_.route_decorators, decorator_name(d))) {
        has_route = true;
      }
      if (contains_any(to_lower(d), patterns_.auth_markers)) {
        has_auth = true;
      }
    }
    if (!has_route || has_auth) continue;

    const std::string_view name = function_name(tree, def);
    if (listed(patterns_.public_endpoints, name)) continue;

    bag
      .report_line(
        tree.node(def).start_line, ViolationType::MissingAuthentication, Severity::Warning,
        "Endpoint '" + std::string(name) + "' lacks authentication decorator")
      .with_suggestion("Add an authentication decorator such as @login_required or @require_auth");
  }
  return bag.take();
}

std::vector<Violation> SecurityScanner::scan(
  const SyntaxTree & tree, const ParentIndex & parents) const
{
  ViolationBag bag(tree.source());
  bag.merge(scan_sql_injection(tree));
  bag.merge(scan_pii_logging(tree));
  bag.merge(scan_missing_authentication(tree, parents));
  return bag.take();
}

}  // namespace defcheck
