// defcheck/report/report_printer.cpp - Text report output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "defcheck/report/report_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>

namespace defcheck
{

ReportPrinter::ReportPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ReportPrinter::print(const AnalysisReport & report)
{
  for (const Severity s : {Severity::Critical, Severity::Warning, Severity::Info}) {
    print_violations(report, s);
  }
  print_failures(report);
  print_notes(report);
  print_summary(report);
}

// =============================================================================
// Sections
// =============================================================================

void ReportPrinter::print_violations(const AnalysisReport & report, Severity severity)
{
  const auto n = static_cast<size_t>(std::count_if(
    report.violations.begin(), report.violations.end(),
    [severity](const Violation & v) { return v.severity == severity; }));
  if (n == 0) {
    return;
  }

  print_heading(fmt::format("{} ({})", to_string(severity), n), severity);

  // Violations are already ordered by (severity, file, line, ...).
  const std::string * current_file = nullptr;
  for (const auto & v : report.violations) {
    if (v.severity != severity) continue;

    if (current_file == nullptr || *current_file != v.file) {
      current_file = &v.file;
      if (use_color_) {
        os_ << rang::style::bold;
        fmt::print(os_, "  {}\n", v.file);
        os_ << rang::style::reset;
      } else {
        fmt::print(os_, "  {}\n", v.file);
      }
    }

    if (use_color_) {
      os_ << rang::fg::cyan;
      fmt::print(os_, "    {}:{}", v.line, v.column);
      os_ << rang::fg::reset;
    } else {
      fmt::print(os_, "    {}:{}", v.line, v.column);
    }
    fmt::print(os_, " {}: {}\n", to_string(v.type), v.description);

    if (!v.snippet.empty()) {
      fmt::print(os_, "         | {}\n", v.snippet);
    }
    if (!v.suggestion.empty()) {
      print_fix(v.suggestion, 9);
    }
  }
  fmt::print(os_, "\n");
}

void ReportPrinter::print_failures(const AnalysisReport & report)
{
  if (report.predicted_failures.empty()) {
    return;
  }

  print_heading(
    fmt::format("predicted integration failures ({})", report.predicted_failures.size()),
    Severity::Critical);

  for (const auto & f : report.predicted_failures) {
    fmt::print(os_, "  [{}] {}: {}\n", to_string(f.severity), to_string(f.failure_type), f.description);
    if (!f.fix_strategy.empty()) {
      print_fix(f.fix_strategy, 5);
    }
    if (!f.test_generation.empty()) {
      fmt::print(os_, "     = test: {}\n", f.test_generation);
    }
  }
  fmt::print(os_, "\n");
}

void ReportPrinter::print_notes(const AnalysisReport & report)
{
  if (report.notes.empty()) {
    return;
  }

  print_heading(fmt::format("notes ({})", report.notes.size()), Severity::Info);
  for (const auto & n : report.notes) {
    fmt::print(os_, "  {}: {}: {}\n", n.file, to_string(n.kind), n.message);
  }
  fmt::print(os_, "\n");
}

void ReportPrinter::print_summary(const AnalysisReport & report)
{
  const ReportSummary & s = report.summary;
  const std::string counts =
    fmt::format("{} critical, {} warning, {} info", s.critical, s.warning, s.info);

  if (use_color_) {
    os_ << rang::style::bold << (s.critical == 0 ? rang::fg::green : rang::fg::red);
    fmt::print(os_, "{} finding(s)", s.total);
    os_ << rang::fg::reset << rang::style::reset;
  } else {
    fmt::print(os_, "{} finding(s)", s.total);
  }
  fmt::print(
    os_, " ({}) in {} file(s), {} skipped\n", counts, report.files_analyzed, report.files_skipped);
}

// =============================================================================
// Private helpers
// =============================================================================

void ReportPrinter::print_heading(std::string_view text, Severity severity)
{
  if (!use_color_) {
    fmt::print(os_, "{}\n", text);
    return;
  }

  os_ << rang::style::bold;
  switch (severity) {
    case Severity::Critical:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << text << rang::fg::reset << rang::style::reset << "\n";
}

void ReportPrinter::print_fix(std::string_view fix, size_t indent)
{
  const std::string pad(indent, ' ');
  const std::string cont(indent + 7, ' ');  // aligns under the text after "= fix: "

  bool first = true;
  size_t start = 0;
  while (start <= fix.size()) {
    const size_t nl = fix.find('\n', start);
    const std::string_view line =
      fix.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

    if (first) {
      if (use_color_) {
        os_ << pad << rang::fg::green << rang::style::bold << "= fix:" << rang::style::reset
            << rang::fg::reset;
        fmt::print(os_, " {}\n", line);
      } else {
        fmt::print(os_, "{}= fix: {}\n", pad, line);
      }
      first = false;
    } else {
      fmt::print(os_, "{}{}\n", cont, line);
    }

    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
}

}  // namespace defcheck
