// tests/driver/test_engine.cpp - Unit tests for the analysis engine and checker driver
//

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "defcheck/driver/checker.hpp"
#include "defcheck/driver/engine.hpp"
#include "defcheck/report/json_report.hpp"

using namespace defcheck;

namespace fs = std::filesystem;

static bool test_debug_enabled() { return std::getenv("DEFCHECK_TEST_DEBUG") != nullptr; }

// ============================================================================
// Helper Functions
// ============================================================================

static const char * k_null_source = R"(def show(user):
    print(user.name)
)";

static const char * k_sql_source = R"(def find(cursor, user_id):
    cursor.execute(f"SELECT * FROM users WHERE id = {user_id}")
)";

static bool has_type(const std::vector<Violation> & vs, ViolationType type)
{
  return std::any_of(vs.begin(), vs.end(), [&](const Violation & v) { return v.type == type; });
}

static std::shared_ptr<const PatternLibrary> builtin_library()
{
  return std::make_shared<const PatternLibrary>(PatternLibrary::builtin());
}

class EngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::absolute(fs::temp_directory_path() / "defcheck_engine_test");
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path write(const std::string & relative, const std::string & content)
  {
    const fs::path path = root_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  void dump(const AnalysisReport & report) const
  {
    if (test_debug_enabled()) {
      std::cerr << render_json(report) << "\n";
    }
  }

  fs::path root_;
};

// ============================================================================
// AnalysisEngine Tests
// ============================================================================

TEST_F(EngineTest, AnalyzeTreeRunsEveryAnalyzer)
{
  const AnalysisEngine engine(builtin_library(), EngineOptions{});
  ParseResult parsed = parse_source("app.py", std::string(k_null_source) + k_sql_source);
  ASSERT_TRUE(parsed.success());

  const auto vs = engine.analyze_tree(*parsed.tree);
  EXPECT_TRUE(has_type(vs, ViolationType::NullSafety));
  EXPECT_TRUE(has_type(vs, ViolationType::SqlInjection));
  for (const auto & v : vs) {
    EXPECT_GE(v.line, 1U);
    EXPECT_LE(v.line, 4U);
  }
}

TEST_F(EngineTest, AnalyzeFileUsesDisplayRoot)
{
  const fs::path file = write("pkg/app.py", k_null_source);

  EngineOptions options;
  options.display_root = root_;
  const AnalysisEngine engine(builtin_library(), options);
  const SourceParser parser;

  const FileAnalysis result = engine.analyze_file(parser, file);
  ASSERT_TRUE(result.analyzed());
  ASSERT_FALSE(result.violations.empty());
  for (const auto & v : result.violations) {
    EXPECT_EQ(v.file, "pkg/app.py");
  }
}

TEST_F(EngineTest, FailuresBecomeNotes)
{
  const fs::path broken = write("broken.py", "def broken(:\n    pass\n");
  const fs::path large = write("large.py", std::string(200, '#') + "\n");

  EngineOptions options;
  options.display_root = root_;
  options.max_file_bytes = 100;
  const AnalysisEngine engine(builtin_library(), options);
  const SourceParser parser;

  const FileAnalysis syntax = engine.analyze_file(parser, broken);
  ASSERT_FALSE(syntax.analyzed());
  EXPECT_EQ(syntax.note->kind, NoteKind::ParseError);
  EXPECT_EQ(syntax.note->file, "broken.py");
  EXPECT_TRUE(syntax.violations.empty());

  const FileAnalysis missing = engine.analyze_file(parser, root_ / "missing.py");
  ASSERT_FALSE(missing.analyzed());
  EXPECT_EQ(missing.note->kind, NoteKind::IoError);

  const FileAnalysis too_large = engine.analyze_file(parser, large);
  ASSERT_FALSE(too_large.analyzed());
  EXPECT_EQ(too_large.note->kind, NoteKind::Skipped);
}

TEST_F(EngineTest, RunIsIndependentOfWorkerCount)
{
  std::vector<fs::path> files;
  for (int i = 0; i < 8; ++i) {
    files.push_back(write("mod" + std::to_string(i) + ".py", i % 2 == 0 ? k_null_source : k_sql_source));
  }
  files.push_back(write("broken.py", "def broken(:\n"));

  const auto run_with = [&](unsigned jobs) {
    EngineOptions options;
    options.jobs = jobs;
    options.display_root = root_;
    const AnalysisEngine engine(builtin_library(), options);
    ReportAggregator agg;
    engine.run(files, agg);
    return agg.finalize();
  };

  const AnalysisReport serial = run_with(1);
  const AnalysisReport parallel = run_with(4);
  dump(serial);

  EXPECT_EQ(serial.files_analyzed, 8U);
  EXPECT_EQ(serial.files_skipped, 1U);
  ASSERT_EQ(serial.notes.size(), 1U);
  EXPECT_EQ(serial.notes[0].file, "broken.py");
  EXPECT_EQ(render_json(serial), render_json(parallel));
}

TEST_F(EngineTest, EachFileIsAnalyzedOnceAcrossWorkers)
{
  std::vector<fs::path> files;
  for (int i = 0; i < 5; ++i) {
    files.push_back(write("pkg/sql" + std::to_string(i) + ".py", k_sql_source));
  }

  EngineOptions options;
  options.jobs = 64;
  const AnalysisEngine engine(builtin_library(), options);
  ASSERT_EQ(engine.worker_count(files.size()), 5U);

  ReportAggregator agg;
  engine.run(files, agg);
  const AnalysisReport report = agg.finalize();

  EXPECT_EQ(report.files_analyzed, 5U);
  EXPECT_EQ(report.files_skipped, 0U);
  std::set<std::string> sql_files;
  for (const auto & v : report.violations) {
    if (v.type == ViolationType::SqlInjection) {
      sql_files.insert(v.file);
    }
  }
  EXPECT_EQ(sql_files.size(), 5U);
}

TEST_F(EngineTest, WorkerCount)
{
  EngineOptions options;
  options.jobs = 4;
  const AnalysisEngine engine(builtin_library(), options);
  EXPECT_EQ(engine.worker_count(0), 0U);
  EXPECT_EQ(engine.worker_count(2), 2U);
  EXPECT_EQ(engine.worker_count(100), 4U);

  const AnalysisEngine automatic(builtin_library(), EngineOptions{});
  EXPECT_GE(automatic.worker_count(100), 1U);
}

TEST_F(EngineTest, CancelledRunStartsNoFiles)
{
  const std::vector<fs::path> files = {write("a.py", k_null_source), write("b.py", k_null_source)};
  CancellationToken cancel;
  cancel.cancel();

  const AnalysisEngine engine(builtin_library(), EngineOptions{});
  ReportAggregator agg;
  engine.run(files, agg, &cancel);

  const AnalysisReport report = agg.finalize();
  EXPECT_EQ(report.files_analyzed, 0U);
  EXPECT_TRUE(report.violations.empty());
}

// ============================================================================
// Checker Tests
// ============================================================================

TEST_F(EngineTest, CheckProjectReportsViolationsAndPredictions)
{
  write("src/app.py", k_sql_source);
  write("tests/test_app.py", k_sql_source);
  write("components/orders/service.py", "import billing\n\ndef place():\n    return billing.charge()\n");
  write("components/billing/api.py", "def charge():\n    return True\n");

  const ProjectConfig config = default_project_config(root_);
  CheckOptions options;
  options.jobs = 2;
  const CheckResult result = Checker::check_project(config, options);
  dump(result.report);

  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_TRUE(has_type(result.report.violations, ViolationType::SqlInjection));
  for (const auto & v : result.report.violations) {
    EXPECT_EQ(v.file.rfind("tests/", 0), std::string::npos) << v.file;
  }
  EXPECT_FALSE(result.report.predicted_failures.empty());
  EXPECT_EQ(result.report.by_type.count("missing_error_handling"), 1U);
}

TEST_F(EngineTest, CheckProjectWithoutPrediction)
{
  write("app.py", k_null_source);
  write("components/orders/service.py", "import billing\n");
  write("components/billing/api.py", "x = 1\n");

  CheckOptions options;
  options.predict = false;
  options.paths = {root_ / "app.py"};
  const CheckResult result = Checker::check_project(default_project_config(root_), options);

  EXPECT_TRUE(result.report.predicted_failures.empty());
  EXPECT_EQ(result.report.files_analyzed, 1U);
  EXPECT_TRUE(has_type(result.report.violations, ViolationType::NullSafety));
}

TEST_F(EngineTest, BadRuleFileFallsBackToBuiltins)
{
  write("app.py", k_sql_source);
  const fs::path rules = write("rules.yaml", "business_logic_patterns: [not, a, map]\nsecurity_patterns: 3\n");

  ProjectConfig config = default_project_config(root_);
  config.patterns = rules;
  std::vector<AnalysisNote> notes;
  const auto library = Checker::load_patterns(config, CheckOptions{}, notes);

  ASSERT_NE(library, nullptr);
  EXPECT_NE(library->find_rule("password_reset"), nullptr);
  ASSERT_EQ(notes.size(), 1U);
  EXPECT_EQ(notes[0].kind, NoteKind::ConfigError);
}

TEST_F(EngineTest, PredictProjectWithoutComponents)
{
  const CheckResult result = Checker::predict_project(default_project_config(root_), CheckOptions{});
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_TRUE(result.report.predicted_failures.empty());
  ASSERT_EQ(result.report.notes.size(), 1U);
  EXPECT_EQ(result.report.notes[0].kind, NoteKind::Skipped);
}

TEST_F(EngineTest, PredictProjectFindsCycle)
{
  write("components/a/main.py", "import b\n");
  write("components/b/main.py", "import a\n");

  const CheckResult result = Checker::predict_project(default_project_config(root_), CheckOptions{});
  ASSERT_FALSE(result.report.predicted_failures.empty());
  EXPECT_EQ(result.report.predicted_failures[0].failure_type, FailureType::CircularDependency);
  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_EQ(result.report.files_analyzed, 0U);
}
