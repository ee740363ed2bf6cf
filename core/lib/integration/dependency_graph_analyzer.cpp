// defcheck/integration/dependency_graph_analyzer.cpp
#include "defcheck/integration/dependency_graph_analyzer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <utility>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

enum class Color : uint8_t {
  White,
  Gray,
  Black,
};

struct CycleSearch
{
  const ComponentGraph & graph;
  std::map<std::string, Color> color;
  std::vector<std::string> path;
  std::set<std::vector<std::string>> seen;
  std::vector<std::vector<std::string>> cycles;

  void visit(const std::string & node)
  {
    color[node] = Color::Gray;
    path.push_back(node);

    for (const auto & next : graph.successors(node)) {
      const Color c = color[next];
      if (c == Color::Gray) {
        record(next);
      } else if (c == Color::White) {
        visit(next);
      }
    }

    path.pop_back();
    color[node] = Color::Black;
  }

  /// `start` is on the current path; the cycle is path[start..] -> start
  void record(const std::string & start)
  {
    const auto from = std::find(path.begin(), path.end(), start);
    std::vector<std::string> cycle(from, path.end());

    const auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), smallest, cycle.end());

    if (seen.insert(cycle).second) {
      cycles.push_back(std::move(cycle));
    }
  }
};

std::string format_values(const std::vector<std::string> & values)
{
  return "[" + join(values, ", ") + "]";
}

std::string last_segment(const std::string & path)
{
  const size_t dot = path.rfind('.');
  return dot == std::string::npos ? path : path.substr(dot + 1);
}

PredictedFailure failure(
  FailureType type, std::string a, std::string b, std::string description, Severity severity,
  std::string fix, std::string test)
{
  PredictedFailure f;
  f.failure_type = type;
  f.component_a = std::move(a);
  f.component_b = std::move(b);
  f.description = std::move(description);
  f.severity = severity;
  f.fix_strategy = std::move(fix);
  f.test_generation = std::move(test);
  return f;
}

void compare_contracts(
  const std::string & a, const ContractFacts & ca, const std::string & b,
  const ContractFacts & cb, std::vector<PredictedFailure> & out)
{
  constexpr const char * test = "Create data format compatibility tests between components";

  if (ca.datetime_format && cb.datetime_format && *ca.datetime_format != *cb.datetime_format) {
    out.push_back(failure(
      FailureType::DataFormatMismatch, a, b,
      fmt::format(
        "Date/time format mismatch: {} uses {}, {} uses {}", a, *ca.datetime_format, b,
        *cb.datetime_format),
      Severity::Critical, "Standardize on ISO8601 format across all components", test));
  }

  if (ca.id_format && cb.id_format && *ca.id_format != *cb.id_format) {
    out.push_back(failure(
      FailureType::DataFormatMismatch, a, b,
      fmt::format("ID format mismatch: {} uses {}, {} uses {}", a, *ca.id_format, b, *cb.id_format),
      Severity::Critical, "Standardize on UUID format for all IDs", test));
  }

  for (const auto & [path, values_a] : ca.enums) {
    const auto it = cb.enums.find(path);
    if (it == cb.enums.end() || it->second == values_a) continue;
    out.push_back(failure(
      FailureType::DataFormatMismatch, a, b,
      fmt::format(
        "Enum '{}' has different values: {}={}, {}={}", path, a, format_values(values_a), b,
        format_values(it->second)),
      Severity::Critical,
      fmt::format("Standardize enum '{}' values across all components", last_segment(path)), test));
  }

  for (const auto & [path, nullable_a] : ca.nullables) {
    const auto it = cb.nullables.find(path);
    if (it == cb.nullables.end() || it->second == nullable_a) continue;
    out.push_back(failure(
      FailureType::DataFormatMismatch, a, b,
      fmt::format(
        "Field '{}' nullable mismatch: {}={}, {}={}", path, a, nullable_a, b, it->second),
      Severity::Warning,
      fmt::format("Standardize null handling for field '{}'", last_segment(path)), test));
  }
}

}  // namespace

std::vector<std::vector<std::string>> DependencyGraphAnalyzer::find_cycles() const
{
  CycleSearch search{graph_, {}, {}, {}, {}};
  for (const auto & entry : graph_.components()) {
    if (search.color[entry.first] == Color::White) {
      search.visit(entry.first);
    }
  }
  return std::move(search.cycles);
}

std::vector<PredictedFailure> DependencyGraphAnalyzer::detect_cycles() const
{
  std::vector<PredictedFailure> out;
  for (const auto & cycle : find_cycles()) {
    std::vector<std::string> closed = cycle;
    closed.push_back(cycle.front());
    const std::string b = cycle.size() > 1 ? cycle[1] : cycle.front();

    out.push_back(failure(
      FailureType::CircularDependency, cycle.front(), b,
      "Circular dependency detected: " + join(closed, " -> "), Severity::Critical,
      "Introduce event bus or mediator pattern to break cycle",
      "Create integration tests that exercise the full dependency cycle"));
  }
  return out;
}

std::vector<PredictedFailure> DependencyGraphAnalyzer::detect_timeout_cascades() const
{
  std::vector<PredictedFailure> out;
  for (const auto & edge : graph_.edges()) {
    const ComponentNode * callee = graph_.find(edge.callee);
    if (!edge.timeout || callee == nullptr || !callee->timeout) continue;

    // Widened so that large configured values cannot overflow.
    const int64_t caller_timeout = *edge.timeout;
    const int64_t callee_timeout = *callee->timeout;
    const int64_t required = callee_timeout + timeout_overhead_;
    if (caller_timeout > required) continue;

    out.push_back(failure(
      FailureType::TimeoutCascade, edge.caller, edge.callee,
      fmt::format(
        "Timeout cascade risk: {} timeout ({}s) too close to {} timeout ({}s)", edge.caller,
        caller_timeout, edge.callee, callee_timeout),
      Severity::Warning,
      fmt::format(
        "Increase {} timeout to at least {}s", edge.caller,
        required + 10),
      "Create timeout cascade tests"));
  }
  return out;
}

std::vector<PredictedFailure> DependencyGraphAnalyzer::detect_error_propagation() const
{
  std::vector<PredictedFailure> out;
  for (const auto & edge : graph_.edges()) {
    if (!edge.has_error_handling) {
      out.push_back(failure(
        FailureType::MissingErrorHandling, edge.caller, edge.callee,
        fmt::format(
          "{} calls {} without error handling; failures will propagate", edge.caller, edge.callee),
        Severity::Critical, "Add try/except with fallback behavior or circuit breaker",
        "Create failure scenario tests for dependency errors"));
    }
    if (!edge.has_retry) {
      out.push_back(failure(
        FailureType::MissingRetryLogic, edge.caller, edge.callee,
        fmt::format("{} calls {} without retry logic", edge.caller, edge.callee),
        Severity::Warning, "Add exponential backoff retry mechanism",
        "Create retry behavior tests"));
    }
  }
  return out;
}

std::vector<PredictedFailure> DependencyGraphAnalyzer::detect_format_mismatches() const
{
  std::vector<PredictedFailure> out;
  std::set<std::pair<std::string, std::string>> compared;

  for (const auto & edge : graph_.edges()) {
    auto key = std::minmax(edge.caller, edge.callee);
    if (!compared.emplace(key.first, key.second).second) continue;

    const ComponentNode * a = graph_.find(key.first);
    const ComponentNode * b = graph_.find(key.second);
    if (a == nullptr || b == nullptr || !a->contract || !b->contract) continue;

    compare_contracts(a->name, *a->contract, b->name, *b->contract, out);
  }
  return out;
}

std::vector<PredictedFailure> DependencyGraphAnalyzer::analyze() const
{
  std::vector<PredictedFailure> out = detect_cycles();
  const auto append = [&out](std::vector<PredictedFailure> && part) {
    out.insert(out.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
  };
  append(detect_timeout_cascades());
  append(detect_error_propagation());
  append(detect_format_mismatches());
  return out;
}

}  // namespace defcheck
