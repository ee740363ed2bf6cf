// defcheck/driver/file_collector.cpp
#include "defcheck/driver/file_collector.hpp"

#include <algorithm>
#include <system_error>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace fs = std::filesystem;

namespace
{

bool is_hidden_name(const std::string & name)
{
  return name.size() > 1 && name.front() == '.' && name != "..";
}

bool is_test_file(const fs::path & p)
{
  return starts_with(p.filename().string(), "test_") && p.extension() == ".py";
}

}  // namespace

bool is_excluded_path(const fs::path & relative, const FileCollectOptions & options)
{
  const std::string generic = relative.generic_string();

  for (const auto & component : relative) {
    const std::string name = component.string();
    if (name == "__pycache__" || is_hidden_name(name)) return true;
    if (options.skip_tests && name == "tests") return true;
    if (std::find(options.exclude.begin(), options.exclude.end(), name) != options.exclude.end()) {
      return true;
    }
  }

  for (const auto & ex : options.exclude) {
    if (ex.empty()) continue;
    const std::string prefix = fs::path(ex).generic_string();
    if (generic == prefix || starts_with(generic, prefix + "/")) return true;
  }

  return options.skip_tests && is_test_file(relative);
}

std::vector<fs::path> collect_source_files(
  const fs::path & root, const FileCollectOptions & options, std::vector<AnalysisNote> * notes)
{
  std::vector<fs::path> files;
  std::error_code ec;

  if (fs::is_regular_file(root, ec)) {
    files.push_back(root);
    return files;
  }
  if (!fs::is_directory(root, ec)) {
    if (notes != nullptr) {
      notes->push_back({root.string(), NoteKind::IoError, "no such file or directory"});
    }
    return files;
  }

  auto it = fs::recursive_directory_iterator(
    root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::path relative = it->path().lexically_relative(root);

    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      if (is_excluded_path(relative, options)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->path().extension() != ".py" || !it->is_regular_file(type_ec)) continue;
    if (is_excluded_path(relative, options)) continue;
    files.push_back(it->path());
  }

  if (ec && notes != nullptr) {
    notes->push_back({root.string(), NoteKind::IoError, ec.message()});
  }

  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace defcheck
