// defcheck - Defensive Python Analyzer Command Line Interface
//
// Usage:
//   defcheck check [path] [--config f] [--patterns f] [--json] [-o out] [-j N] [-v]
//   defcheck predict [project-root] [--json] [-o out] [-v]
//   defcheck dump-tree <file.py>
//
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "defcheck/driver/checker.hpp"
#include "defcheck/project/project_config.hpp"
#include "defcheck/report/json_report.hpp"
#include "defcheck/report/report_printer.hpp"
#include "defcheck/syntax/frontend.hpp"
#include "defcheck/syntax/tree_dumper.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_usage_error = 2;

defcheck::CancellationToken g_cancel;

void on_interrupt(int /*signal*/) { g_cancel.cancel(); }

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "defcheck v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [path]             Analyze Python sources (file or directory)\n"
            << "  predict [project-root]   Predict integration failures between components\n"
            << "  dump-tree <file.py>      Print the syntax tree of a file as JSON\n\n"
            << "Options:\n"
            << "  --config <path>          Project configuration (default: defcheck.yaml)\n"
            << "  --patterns <path>        Rule file (YAML or JSON)\n"
            << "  --json                   Emit the report as JSON\n"
            << "  -o, --output <path>      Write the report to a file\n"
            << "  -j, --jobs <n>           Number of worker threads\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

/// Write the report to stdout or to the output file; returns false on I/O failure
bool emit_report(const defcheck::AnalysisReport & report, bool json, const std::string & output_path)
{
  if (output_path.empty()) {
    if (json) {
      std::cout << defcheck::render_json(report) << "\n";
    } else {
      const bool use_color = isatty(fileno(stdout)) != 0;
      defcheck::ReportPrinter printer(std::cout, use_color);
      printer.print(report);
    }
    return true;
  }

  std::ofstream out(output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << output_path << "\n";
    return false;
  }
  if (json) {
    out << defcheck::render_json(report) << "\n";
  } else {
    defcheck::ReportPrinter printer(out, false);
    printer.print(report);
  }
  return out.good();
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_path;
  std::string config_path;
  std::string patterns_path;
  std::string output_path;
  std::optional<unsigned> jobs;
  bool json = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  // Options taking a value
  const auto value_of = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      args.output_path = value_of(i, arg);
    } else if (arg == "--config") {
      args.config_path = value_of(i, arg);
    } else if (arg == "--patterns") {
      args.patterns_path = value_of(i, arg);
    } else if (arg == "-j" || arg == "--jobs") {
      const std::string n = value_of(i, arg);
      if (n.empty()) continue;
      char * end = nullptr;
      const long value = std::strtol(n.c_str(), &end, 10);
      if (end == n.c_str() || *end != '\0' || value < 0) {
        args.error = "invalid job count: " + n;
      } else {
        args.jobs = static_cast<unsigned>(value);
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_path.empty()) {
      args.input_path = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/**
 * Configuration for a run: --config, else defcheck.yaml found upward from
 * `start`, else defaults rooted at `start`.
 */
std::optional<defcheck::ProjectConfig> resolve_config(const CommandArgs & args, const fs::path & start)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = defcheck::find_project_config(start);
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << defcheck::k_project_config_file_name << " found; using defaults\n";
    }
    return defcheck::default_project_config(start);
  }

  const auto config_result = defcheck::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return config_result.config;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  defcheck::CheckOptions options;
  options.verbose = args.verbose;
  options.jobs = args.jobs;
  options.cancel = &g_cancel;
  if (!args.patterns_path.empty()) {
    options.patterns_path = fs::absolute(args.patterns_path);
  }

  fs::path start = fs::current_path();
  if (!args.input_path.empty()) {
    const fs::path input = fs::absolute(args.input_path);
    std::error_code ec;
    if (!fs::exists(input, ec)) {
      std::cerr << "error: file not found: " << input.string() << "\n";
      return k_exit_usage_error;
    }
    options.paths.push_back(input);
    start = fs::is_directory(input, ec) ? input : input.parent_path();
  }

  const auto config = resolve_config(args, start);
  if (!config) {
    return k_exit_usage_error;
  }

  try {
    const defcheck::CheckResult result = defcheck::Checker::check_project(*config, options);
    if (!emit_report(result.report, args.json, args.output_path)) {
      return k_exit_usage_error;
    }
    return result.exit_code();
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage_error;
  }
}

int cmd_predict(const CommandArgs & args)
{
  const fs::path root =
    args.input_path.empty() ? fs::current_path() : fs::absolute(args.input_path);

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    std::cerr << "error: not a directory: " << root.string() << "\n";
    return k_exit_usage_error;
  }

  const auto config = resolve_config(args, root);
  if (!config) {
    return k_exit_usage_error;
  }

  defcheck::CheckOptions options;
  options.verbose = args.verbose;

  try {
    const defcheck::CheckResult result = defcheck::Checker::predict_project(*config, options);
    if (!emit_report(result.report, args.json, args.output_path)) {
      return k_exit_usage_error;
    }
    return result.exit_code();
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage_error;
  }
}

int cmd_dump_tree(const CommandArgs & args)
{
  if (args.input_path.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: defcheck dump-tree <file.py>\n";
    return k_exit_usage_error;
  }

  const fs::path input_path = fs::absolute(args.input_path);
  const defcheck::ParseResult parsed = defcheck::parse_file(input_path);
  if (!parsed.success()) {
    const std::string message = parsed.error ? parsed.error->message : "parse failed";
    std::cerr << "error: " << input_path.string() << ": " << message << "\n";
    return 1;
  }

  std::cout << defcheck::dump_tree_json(*parsed.tree) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage_error;
  }

  std::signal(SIGINT, on_interrupt);

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "predict") {
    return cmd_predict(args);
  }

  if (args.command == "dump-tree") {
    return cmd_dump_tree(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage_error;
}
