// defcheck/report/analysis_report.hpp - Aggregated results of one analysis run
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "defcheck/basic/analysis_note.hpp"
#include "defcheck/basic/violation.hpp"
#include "defcheck/integration/dependency_graph_analyzer.hpp"

namespace defcheck
{

struct ReportSummary
{
  size_t total = 0;
  size_t critical = 0;
  size_t warning = 0;
  size_t info = 0;
};

/**
 * Immutable, fully ordered result of a run.
 * Two runs over the same inputs produce equal reports.
 */
struct AnalysisReport
{
  /// Violations and predicted failures together
  ReportSummary summary;

  /// Violation / failure type name -> count
  std::map<std::string, size_t> by_type;

  std::vector<Violation> violations;
  std::vector<PredictedFailure> predicted_failures;
  std::vector<AnalysisNote> notes;

  size_t files_analyzed = 0;
  size_t files_skipped = 0;

  /// 0 when nothing critical was found, 1 otherwise
  [[nodiscard]] int exit_code() const noexcept { return summary.critical == 0 ? 0 : 1; }
};

/**
 * Thread-safe collector for per-file results.
 *
 * Workers append concurrently; finalize() is called once after all workers
 * have finished.
 */
class ReportAggregator
{
public:
  void add_violations(std::vector<Violation> && violations);
  void add_predicted_failures(std::vector<PredictedFailure> && failures);
  void add_note(AnalysisNote note);
  void add_notes(const std::vector<AnalysisNote> & notes);

  void mark_analyzed();
  void mark_skipped();

  /// Sort everything into a deterministic order and compute the counts
  [[nodiscard]] AnalysisReport finalize() const;

private:
  mutable std::mutex mutex_;
  std::vector<Violation> violations_;
  std::vector<PredictedFailure> failures_;
  std::vector<AnalysisNote> notes_;
  size_t analyzed_ = 0;
  size_t skipped_ = 0;
};

}  // namespace defcheck
