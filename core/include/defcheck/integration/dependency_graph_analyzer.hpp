// defcheck/integration/dependency_graph_analyzer.hpp - Integration failure prediction
//
// Predicts failures that only appear when components are wired together:
// dependency cycles, timeout cascades, unhandled callee errors and
// incompatible data formats between contracts.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "defcheck/basic/violation.hpp"
#include "defcheck/integration/component_graph.hpp"

namespace defcheck
{

/// Default seconds a caller needs on top of its callee's timeout
inline constexpr int k_default_timeout_overhead = 5;

enum class FailureType : uint8_t {
  CircularDependency,
  TimeoutCascade,
  MissingErrorHandling,
  MissingRetryLogic,
  DataFormatMismatch,
};

[[nodiscard]] constexpr std::string_view to_string(FailureType t) noexcept
{
  switch (t) {
    case FailureType::CircularDependency:
      return "circular_dependency";
    case FailureType::TimeoutCascade:
      return "timeout_cascade";
    case FailureType::MissingErrorHandling:
      return "missing_error_handling";
    case FailureType::MissingRetryLogic:
      return "missing_retry_logic";
    case FailureType::DataFormatMismatch:
      return "data_format_mismatch";
  }
  return "";
}

struct PredictedFailure
{
  FailureType failure_type = FailureType::CircularDependency;
  std::string component_a;
  std::string component_b;
  std::string description;
  Severity severity = Severity::Warning;
  std::string fix_strategy;
  std::string test_generation;  ///< Kind of test that would expose the failure
};

class DependencyGraphAnalyzer
{
public:
  explicit DependencyGraphAnalyzer(
    const ComponentGraph & graph, int timeout_overhead = k_default_timeout_overhead)
  : graph_(graph), timeout_overhead_(timeout_overhead)
  {
  }

  /**
   * Every simple cycle reachable by DFS, once per cycle.
   * Each cycle is rotated to start at its smallest component name.
   */
  [[nodiscard]] std::vector<std::vector<std::string>> find_cycles() const;

  [[nodiscard]] std::vector<PredictedFailure> detect_cycles() const;
  [[nodiscard]] std::vector<PredictedFailure> detect_timeout_cascades() const;
  [[nodiscard]] std::vector<PredictedFailure> detect_error_propagation() const;
  [[nodiscard]] std::vector<PredictedFailure> detect_format_mismatches() const;

  /// All of the above, in that order
  [[nodiscard]] std::vector<PredictedFailure> analyze() const;

private:
  const ComponentGraph & graph_;
  int timeout_overhead_;
};

}  // namespace defcheck
