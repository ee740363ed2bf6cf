// defcheck/driver/engine.hpp - Per-file analysis pipeline and worker pool
//
// Every file is parsed, checked by all detectors, verifiers and scanners,
// and its results are appended to a ReportAggregator. Files are independent:
// a failure in one file becomes a note and never stops the others.
//
#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "defcheck/analysis/context_window.hpp"
#include "defcheck/basic/analysis_note.hpp"
#include "defcheck/basic/violation.hpp"
#include "defcheck/report/analysis_report.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/security/security_scanner.hpp"
#include "defcheck/semantic/business_logic_verifier.hpp"
#include "defcheck/semantic/error_handling_verifier.hpp"
#include "defcheck/syntax/frontend.hpp"

namespace defcheck
{

// ============================================================================
// Options
// ============================================================================

struct EngineOptions
{
  /// Worker count (0 = hardware concurrency)
  unsigned jobs = 0;

  uint32_t lookback_lines = k_default_lookback_lines;

  uint64_t max_file_bytes = k_default_max_file_bytes;

  /// Report paths relative to this directory
  std::optional<std::filesystem::path> display_root;

  /// Progress lines on stderr
  bool verbose = false;
};

/**
 * Cooperative cancellation flag checked before each file.
 */
class CancellationToken
{
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool cancelled() const noexcept
  {
    return cancelled_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled_{false};
};

/// Outcome of analyzing one file: violations, or a note saying why not
struct FileAnalysis
{
  std::vector<Violation> violations;
  std::optional<AnalysisNote> note;

  [[nodiscard]] bool analyzed() const noexcept { return !note.has_value(); }
};

// ============================================================================
// AnalysisEngine
// ============================================================================

class AnalysisEngine
{
public:
  AnalysisEngine(std::shared_ptr<const PatternLibrary> patterns, EngineOptions options);

  /// Every analyzer over one parsed tree
  [[nodiscard]] std::vector<Violation> analyze_tree(const SyntaxTree & tree) const;

  /// Parse and analyze one file with a worker-owned parser
  [[nodiscard]] FileAnalysis analyze_file(
    const SourceParser & parser, const std::filesystem::path & path) const;

  /**
   * Analyze files on a pool of workers and append the results.
   *
   * @param cancel Optional token; once cancelled no further file is started
   */
  void run(
    const std::vector<std::filesystem::path> & files, ReportAggregator & out,
    const CancellationToken * cancel = nullptr) const;

  /// Number of workers run() would use for `file_count` files
  [[nodiscard]] unsigned worker_count(size_t file_count) const noexcept;

  [[nodiscard]] const PatternLibrary & patterns() const noexcept { return *patterns_; }

private:
  [[nodiscard]] std::string display_path(const std::filesystem::path & path) const;

  void worker(
    const std::vector<std::filesystem::path> & files, std::atomic<size_t> & next,
    ReportAggregator & out, const CancellationToken * cancel) const;

  void record(FileAnalysis && result, ReportAggregator & out) const;

  void log_line(const std::string & message) const;

  std::shared_ptr<const PatternLibrary> patterns_;
  EngineOptions options_;

  BusinessLogicVerifier business_;
  ErrorHandlingVerifier error_handling_;
  SecurityScanner security_;

  mutable std::mutex log_mutex_;
};

}  // namespace defcheck
