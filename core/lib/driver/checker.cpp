// defcheck/driver/checker.cpp - Checker driver implementation
//
#include "defcheck/driver/checker.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "defcheck/driver/file_collector.hpp"
#include "defcheck/integration/component_graph.hpp"

namespace defcheck
{

namespace fs = std::filesystem;

std::shared_ptr<const PatternLibrary> Checker::load_patterns(
  const ProjectConfig & config, const CheckOptions & options, std::vector<AnalysisNote> & notes)
{
  std::optional<fs::path> path = options.patterns_path;
  if (!path && config.patterns) {
    path = config.resolve(*config.patterns);
  }
  if (!path) {
    return std::make_shared<const PatternLibrary>(PatternLibrary::builtin());
  }

  std::string error;
  auto library = load_pattern_library_or_builtin(*path, &error);
  if (!error.empty()) {
    // Always visible: the run continues with different rules than requested.
    fmt::print(stderr, "warning: {}; using built-in rules\n", error);
    notes.push_back({path->generic_string(), NoteKind::ConfigError, error});
  }
  return library;
}

CheckResult Checker::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  ReportAggregator aggregator;
  std::vector<AnalysisNote> notes;

  const auto patterns = load_patterns(config, options, notes);

  // Determine the roots to analyze
  std::vector<fs::path> roots;
  if (!options.paths.empty()) {
    roots = options.paths;
  } else if (!config.analysis.paths.empty()) {
    for (const auto & p : config.analysis.paths) {
      roots.push_back(config.resolve(p));
    }
  } else {
    roots.push_back(config.project_root);
  }

  FileCollectOptions collect;
  collect.exclude = config.analysis.exclude;
  collect.skip_tests = config.analysis.skip_tests;

  std::vector<fs::path> files;
  for (const auto & root : roots) {
    auto found = collect_source_files(root, collect, &notes);
    files.insert(files.end(), found.begin(), found.end());
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());

  if (options.verbose) {
    fmt::print(stderr, "Checking {} file(s) under {}\n", files.size(), config.project_root.string());
  }

  EngineOptions engine_options;
  engine_options.jobs = options.jobs.value_or(config.analysis.jobs);
  engine_options.lookback_lines = config.analysis.lookback_lines;
  engine_options.max_file_bytes = config.analysis.max_file_bytes;
  engine_options.display_root = config.project_root;
  engine_options.verbose = options.verbose;

  const AnalysisEngine engine(patterns, engine_options);
  engine.run(files, aggregator, options.cancel);

  if (options.predict) {
    (void)run_prediction(config, options, aggregator);
  }

  aggregator.add_notes(notes);

  CheckResult result;
  result.report = aggregator.finalize();
  return result;
}

CheckResult Checker::predict_project(const ProjectConfig & config, const CheckOptions & options)
{
  ReportAggregator aggregator;

  if (!run_prediction(config, options, aggregator)) {
    aggregator.add_note(
      {config.resolve(config.integration.components_dir).generic_string(), NoteKind::Skipped,
       "components directory not found"});
  }

  CheckResult result;
  result.report = aggregator.finalize();
  return result;
}

bool Checker::run_prediction(
  const ProjectConfig & config, const CheckOptions & options, ReportAggregator & out)
{
  const fs::path components = config.resolve(config.integration.components_dir);
  std::error_code ec;
  if (!fs::is_directory(components, ec)) {
    return false;
  }

  if (options.verbose) {
    fmt::print(stderr, "Predicting integration failures: {}\n", components.string());
  }

  try {
    ComponentGraphBuilder builder;
    builder.scan(components, config.resolve(config.integration.contracts_dir));
    const ComponentGraph graph = builder.build();
    out.add_notes(builder.notes());

    const DependencyGraphAnalyzer analyzer(graph, config.integration.timeout_overhead);
    out.add_predicted_failures(analyzer.analyze());
  } catch (const std::exception & e) {
    out.add_note({components.generic_string(), NoteKind::InternalError, e.what()});
  }
  return true;
}

}  // namespace defcheck
