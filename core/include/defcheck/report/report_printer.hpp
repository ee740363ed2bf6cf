// defcheck/report/report_printer.hpp
//
// Prints an AnalysisReport for humans, grouped by severity and then by file.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "defcheck/report/analysis_report.hpp"

namespace defcheck
{

/**
 * Produces output like:
 *   critical (1)
 *     src/app.py
 *       12:5 null_safety: Attribute access on 'user' without None check
 *            | print(user.name)
 *            = fix: if user is not None:
 *                       print(user.name)
 */
class ReportPrinter
{
public:
  /**
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to use terminal colors
   */
  explicit ReportPrinter(std::ostream & os, bool use_color = true);

  void print(const AnalysisReport & report);

private:
  void print_violations(const AnalysisReport & report, Severity severity);
  void print_failures(const AnalysisReport & report);
  void print_notes(const AnalysisReport & report);
  void print_summary(const AnalysisReport & report);

  void print_heading(std::string_view text, Severity severity);
  void print_fix(std::string_view fix, size_t indent);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace defcheck
