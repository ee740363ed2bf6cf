// defcheck/driver/file_collector.hpp - Python source discovery
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "defcheck/basic/analysis_note.hpp"

namespace defcheck
{

struct FileCollectOptions
{
  /// Directory/file names or root-relative paths to leave out
  std::vector<std::string> exclude;

  /// Leave out test_*.py files and tests/ directories
  bool skip_tests = true;
};

/// Whether a root-relative path is excluded by the options
[[nodiscard]] bool is_excluded_path(
  const std::filesystem::path & relative, const FileCollectOptions & options);

/**
 * Collect `*.py` files under a root, sorted by path.
 *
 * `__pycache__` and hidden directories are never entered. A root that is a
 * single file is returned as-is. Unreadable directories are recorded in
 * `notes` (when given) and skipped.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_source_files(
  const std::filesystem::path & root, const FileCollectOptions & options,
  std::vector<AnalysisNote> * notes = nullptr);

}  // namespace defcheck
