// defcheck/report/analysis_report.cpp
#include "defcheck/report/analysis_report.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace defcheck
{

namespace
{

/// Critical sorts first; the enum is declared in descending severity
int severity_rank(Severity s) noexcept { return static_cast<int>(s); }

bool violation_less(const Violation & a, const Violation & b)
{
  using Key = std::tuple<
    int, const std::string &, uint32_t, uint32_t, std::string_view, const std::string &,
    const std::string &, const std::string &>;
  const auto key = [](const Violation & v) {
    return Key(
      severity_rank(v.severity), v.file, v.line, v.column, to_string(v.type), v.description,
      v.snippet, v.suggestion);
  };
  return key(a) < key(b);
}

bool failure_less(const PredictedFailure & a, const PredictedFailure & b)
{
  using Key = std::tuple<
    int, std::string_view, const std::string &, const std::string &, const std::string &>;
  const auto key = [](const PredictedFailure & f) {
    return Key(
      severity_rank(f.severity), to_string(f.failure_type), f.component_a, f.component_b,
      f.description);
  };
  return key(a) < key(b);
}

bool note_less(const AnalysisNote & a, const AnalysisNote & b)
{
  return std::tie(a.file, a.kind, a.message) < std::tie(b.file, b.kind, b.message);
}

void count(ReportSummary & summary, Severity s)
{
  ++summary.total;
  switch (s) {
    case Severity::Critical:
      ++summary.critical;
      break;
    case Severity::Warning:
      ++summary.warning;
      break;
    case Severity::Info:
      ++summary.info;
      break;
  }
}

}  // namespace

void ReportAggregator::add_violations(std::vector<Violation> && violations)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  violations_.insert(
    violations_.end(), std::make_move_iterator(violations.begin()),
    std::make_move_iterator(violations.end()));
}

void ReportAggregator::add_predicted_failures(std::vector<PredictedFailure> && failures)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  failures_.insert(
    failures_.end(), std::make_move_iterator(failures.begin()),
    std::make_move_iterator(failures.end()));
}

void ReportAggregator::add_note(AnalysisNote note)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  notes_.push_back(std::move(note));
}

void ReportAggregator::add_notes(const std::vector<AnalysisNote> & notes)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  notes_.insert(notes_.end(), notes.begin(), notes.end());
}

void ReportAggregator::mark_analyzed()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  ++analyzed_;
}

void ReportAggregator::mark_skipped()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  ++skipped_;
}

AnalysisReport ReportAggregator::finalize() const
{
  AnalysisReport report;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    report.violations = violations_;
    report.predicted_failures = failures_;
    report.notes = notes_;
    report.files_analyzed = analyzed_;
    report.files_skipped = skipped_;
  }

  std::sort(report.violations.begin(), report.violations.end(), violation_less);
  std::sort(report.predicted_failures.begin(), report.predicted_failures.end(), failure_less);
  std::sort(report.notes.begin(), report.notes.end(), note_less);

  for (const auto & v : report.violations) {
    count(report.summary, v.severity);
    ++report.by_type[std::string(to_string(v.type))];
  }
  for (const auto & f : report.predicted_failures) {
    count(report.summary, f.severity);
    ++report.by_type[std::string(to_string(f.failure_type))];
  }
  return report;
}

}  // namespace defcheck
