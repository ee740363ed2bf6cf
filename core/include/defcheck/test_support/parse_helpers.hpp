// defcheck/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline for tests: the tree, its parent index and
// a context window, kept together so their lifetimes line up.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "defcheck/analysis/context_window.hpp"
#include "defcheck/analysis/detectors.hpp"
#include "defcheck/rules/pattern_library.hpp"
#include "defcheck/syntax/frontend.hpp"

namespace defcheck::test_support
{

struct TestParseUnit
{
  std::unique_ptr<SyntaxTree> tree;
  std::optional<ParseError> error;
  std::unique_ptr<ParentIndex> parents;
  std::unique_ptr<ContextWindow> window;

  [[nodiscard]] bool ok() const noexcept { return tree != nullptr; }

  /// Detector context over this unit with the given rules
  [[nodiscard]] DetectorContext context(const PatternLibrary & lib) const
  {
    return DetectorContext(*tree, *parents, *window, lib);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.py")
{
  TestParseUnit out;
  ParseResult parsed = parse_source(virtual_path, std::move(src));
  out.error = std::move(parsed.error);
  out.tree = std::move(parsed.tree);
  if (out.tree) {
    out.parents = std::make_unique<ParentIndex>(*out.tree);
    out.window = std::make_unique<ContextWindow>(*out.tree, *out.parents);
  }
  return out;
}

/// Built-in rules shared by tests
[[nodiscard]] inline const PatternLibrary & builtin_patterns()
{
  static const PatternLibrary lib = PatternLibrary::builtin();
  return lib;
}

}  // namespace defcheck::test_support
