// defcheck/analysis/detectors/external_call_safety.cpp - Network and subprocess calls without timeout
#include <array>
#include <utility>

#include "defcheck/analysis/detectors.hpp"
#include "defcheck/analysis/tree_queries.hpp"
#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

constexpr std::array<std::string_view, 2> k_http_clients = {"requests", "httpx"};

constexpr std::array<std::string_view, 7> k_http_methods = {
  "get", "post", "put", "delete", "patch", "request", "head"};

constexpr std::array<std::string_view, 4> k_subprocess_calls = {
  "run", "call", "check_call", "check_output"};

template <size_t N>
bool one_of(const std::array<std::string_view, N> & set, std::string_view s) noexcept
{
  for (const auto & item : set) {
    if (item == s) return true;
  }
  return false;
}

enum class CallFamily : uint8_t {
  None,
  Http,
  UrlOpen,
  Subprocess,
};

/// Split `a.b.c` into (`a.b`, `c`)
std::pair<std::string_view, std::string_view> split_last(std::string_view dotted) noexcept
{
  const size_t dot = dotted.rfind('.');
  if (dot == std::string_view::npos) return {{}, dotted};
  return {dotted.substr(0, dot), dotted.substr(dot + 1)};
}

CallFamily classify(std::string_view callee) noexcept
{
  const auto [receiver, method] = split_last(callee);
  if (one_of(k_http_clients, receiver) && one_of(k_http_methods, method)) {
    return CallFamily::Http;
  }
  if (method == "urlopen" && (receiver.empty() || ends_with(receiver, "request"))) {
    return CallFamily::UrlOpen;
  }
  if (receiver == "subprocess" && one_of(k_subprocess_calls, method)) {
    return CallFamily::Subprocess;
  }
  return CallFamily::None;
}

/// Suggestion that re-issues the call with a timeout keyword appended
std::string with_timeout(std::string_view call_text)
{
  std::string_view t = trim(call_text);
  if (!t.empty() && t.back() == ')') t.remove_suffix(1);
  return std::string(t) + ", timeout=30)";
}

}  // namespace

std::vector<Violation> detect_external_call_safety(const DetectorContext & ctx)
{
  const SyntaxTree & tree = ctx.tree;
  ViolationBag bag(tree.source());

  for (const NodeId call : tree.nodes_of_kind(NodeKind::Call)) {
    const auto callee = qualified_name(tree, tree.child_by_role(call, FieldRole::Function));
    if (!callee) continue;

    const CallFamily family = classify(*callee);
    if (family == CallFamily::None) continue;

    if (has_keyword_argument(tree, call, "timeout") || has_kwargs_splat(tree, call)) {
      continue;
    }

    const SourceRange where = tree.node(call).range;
    switch (family) {
      case CallFamily::Http:
        bag
          .report(
            where, ViolationType::ExternalCallSafety, Severity::Critical,
            "HTTP request without timeout parameter")
          .with_suggestion(with_timeout(tree.text(call)));
        break;

      case CallFamily::UrlOpen:
        // urlopen(url, data, timeout)
        if (positional_argument_count(tree, call) >= 3) break;
        bag
          .report(
            where, ViolationType::ExternalCallSafety, Severity::Critical,
            "urllib.request.urlopen without timeout")
          .with_suggestion(with_timeout(tree.text(call)));
        break;

      case CallFamily::Subprocess:
        bag
          .report(
            where, ViolationType::ExternalCallSafety, Severity::Critical,
            "Subprocess call without timeout parameter")
          .with_suggestion(with_timeout(tree.text(call)));
        break;

      case CallFamily::None:
        break;
    }
  }
  return bag.take();
}

}  // namespace defcheck
