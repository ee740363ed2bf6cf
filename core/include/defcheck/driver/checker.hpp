// defcheck/driver/checker.hpp - Checker driver
//
// Single entry point for the analysis pipeline.
// Used by the CLI and can be embedded into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "defcheck/basic/analysis_note.hpp"
#include "defcheck/driver/engine.hpp"
#include "defcheck/integration/dependency_graph_analyzer.hpp"
#include "defcheck/project/project_config.hpp"
#include "defcheck/report/analysis_report.hpp"
#include "defcheck/rules/pattern_library.hpp"

namespace defcheck
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Paths to analyze (override analysis.paths)
  std::vector<std::filesystem::path> paths;

  /// Rule file (overrides the configured patterns entry)
  std::optional<std::filesystem::path> patterns_path;

  /// Worker count (overrides analysis.jobs)
  std::optional<unsigned> jobs;

  /// Merge integration predictions when a components directory exists
  bool predict = true;

  /// Enable verbose output
  bool verbose = false;

  /// Stop starting new files once cancelled
  const CancellationToken * cancel = nullptr;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  AnalysisReport report;

  [[nodiscard]] int exit_code() const noexcept { return report.exit_code(); }
};

// ============================================================================
// Checker
// ============================================================================

/**
 * Checker driver that orchestrates the full analysis.
 *
 * The pipeline consists of:
 * 1. Rule loading (built-in rules on any configuration error)
 * 2. Source discovery
 * 3. Per-file analysis on the worker pool
 * 4. Integration failure prediction over the components directory
 * 5. Aggregation into an ordered report
 */
class Checker
{
public:
  /**
   * Analyze the sources of a project.
   *
   * @param config Project configuration (from defcheck.yaml or defaults)
   * @param options Check options (may override config settings)
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

  /**
   * Predict integration failures only.
   */
  [[nodiscard]] static CheckResult predict_project(
    const ProjectConfig & config, const CheckOptions & options);

  /**
   * Load the rule library for a project.
   * On a configuration error the built-in library is returned and a
   * config_error note is appended.
   */
  [[nodiscard]] static std::shared_ptr<const PatternLibrary> load_patterns(
    const ProjectConfig & config, const CheckOptions & options, std::vector<AnalysisNote> & notes);

private:
  /**
   * Build the component graph and run every integration check.
   *
   * @return false if the project has no components directory
   */
  static bool run_prediction(
    const ProjectConfig & config, const CheckOptions & options, ReportAggregator & out);
};

}  // namespace defcheck
