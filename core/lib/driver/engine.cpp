// defcheck/driver/engine.cpp - Per-file analysis pipeline and worker pool
#include "defcheck/driver/engine.hpp"

#include <fmt/core.h>
#include <gsl/util>

#include <algorithm>
#include <system_error>
#include <thread>

#include "defcheck/analysis/detectors.hpp"

namespace defcheck
{

namespace fs = std::filesystem;

namespace
{

NoteKind note_kind_for(ParseErrorKind kind) noexcept
{
  switch (kind) {
    case ParseErrorKind::Syntax:
      return NoteKind::ParseError;
    case ParseErrorKind::Io:
      return NoteKind::IoError;
    case ParseErrorKind::TooLarge:
      return NoteKind::Skipped;
  }
  return NoteKind::InternalError;
}

FileAnalysis note_only(std::string file, NoteKind kind, std::string message)
{
  FileAnalysis r;
  r.note = AnalysisNote{std::move(file), kind, std::move(message)};
  return r;
}

}  // namespace

AnalysisEngine::AnalysisEngine(std::shared_ptr<const PatternLibrary> patterns, EngineOptions options)
: patterns_(std::move(patterns)),
  options_(std::move(options)),
  business_(*patterns_),
  error_handling_(*patterns_),
  security_(*patterns_)
{
}

std::vector<Violation> AnalysisEngine::analyze_tree(const SyntaxTree & tree) const
{
  const ParentIndex parents(tree);
  const ContextWindow window(tree, parents, options_.lookback_lines);
  const DetectorContext ctx(tree, parents, window, *patterns_);

  ViolationBag bag(tree.source());
  bag.merge(run_all_detectors(ctx));
  bag.merge(business_.verify(tree));
  bag.merge(error_handling_.verify(tree, window));
  bag.merge(security_.scan(tree, parents));
  return bag.take();
}

FileAnalysis AnalysisEngine::analyze_file(const SourceParser & parser, const fs::path & path) const
{
  const std::string shown = display_path(path);

  try {
    ParseResult parsed = parser.parse_file(path, options_.max_file_bytes);
    if (!parsed.success()) {
      const ParseError err = parsed.error.value_or(ParseError{});
      return note_only(shown, note_kind_for(err.kind), err.message);
    }

    FileAnalysis result;
    result.violations = analyze_tree(*parsed.tree);
    for (auto & v : result.violations) {
      v.file = shown;
    }
    return result;
  } catch (const std::exception & e) {
    return note_only(shown, NoteKind::InternalError, e.what());
  }
}

void AnalysisEngine::run(
  const std::vector<fs::path> & files, ReportAggregator & out,
  const CancellationToken * cancel) const
{
  std::atomic<size_t> next{0};
  const unsigned workers = worker_count(files.size());
  if (workers == 0) {
    return;
  }

  if (workers == 1) {
    worker(files, next, out, cancel);
    return;
  }

  // The calling thread is one of the workers; helpers drain the same queue.
  std::vector<std::thread> pool;
  pool.reserve(workers - 1);
  const auto join_all = gsl::finally([&pool] {
    for (auto & t : pool) {
      t.join();
    }
  });
  try {
    for (unsigned i = 1; i < workers; ++i) {
      pool.emplace_back([&] { worker(files, next, out, cancel); });
    }
  } catch (const std::system_error & e) {
    log_line(fmt::format(
      "warning: started {} of {} worker threads: {}", pool.size() + 1, workers, e.what()));
  }
  worker(files, next, out, cancel);
}

unsigned AnalysisEngine::worker_count(size_t file_count) const noexcept
{
  if (file_count == 0) {
    return 0;
  }
  unsigned n = options_.jobs != 0 ? options_.jobs : std::thread::hardware_concurrency();
  n = std::max(n, 1U);
  return static_cast<unsigned>(std::min<size_t>(n, file_count));
}

// ============================================================================
// Private helpers
// ============================================================================

void AnalysisEngine::worker(
  const std::vector<fs::path> & files, std::atomic<size_t> & next, ReportAggregator & out,
  const CancellationToken * cancel) const
{
  // Each worker owns its tree-sitter parser.
  std::unique_ptr<SourceParser> parser;
  std::string parser_error;
  try {
    parser = std::make_unique<SourceParser>();
  } catch (const std::exception & e) {
    parser_error = e.what();
    log_line("error: " + parser_error);
  }

  while (cancel == nullptr || !cancel->cancelled()) {
    const size_t i = next.fetch_add(1);
    if (i >= files.size()) {
      break;
    }

    const fs::path & path = files[i];
    if (!parser) {
      record(note_only(display_path(path), NoteKind::InternalError, parser_error), out);
      continue;
    }

    if (options_.verbose) {
      log_line("Analyzing: " + display_path(path));
    }
    record(analyze_file(*parser, path), out);
  }
}

void AnalysisEngine::record(FileAnalysis && result, ReportAggregator & out) const
{
  if (result.note) {
    if (options_.verbose) {
      log_line(fmt::format(
        "Skipped: {} ({}: {})", result.note->file, to_string(result.note->kind),
        result.note->message));
    }
    out.add_note(std::move(*result.note));
    out.mark_skipped();
    return;
  }
  out.add_violations(std::move(result.violations));
  out.mark_analyzed();
}

std::string AnalysisEngine::display_path(const fs::path & path) const
{
  if (options_.display_root) {
    std::error_code ec;
    const fs::path rel = fs::relative(path, *options_.display_root, ec);
    if (!ec && !rel.empty() && *rel.begin() != "..") {
      return rel.generic_string();
    }
  }
  return path.generic_string();
}

void AnalysisEngine::log_line(const std::string & message) const
{
  const std::lock_guard<std::mutex> lock(log_mutex_);
  fmt::print(stderr, "{}\n", message);
}

}  // namespace defcheck
