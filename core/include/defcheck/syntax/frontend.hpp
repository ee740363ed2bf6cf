// defcheck/syntax/frontend.hpp - High-level parse pipeline
//
// Reads a Python source file, parses it with tree-sitter and converts the
// result into an immutable SyntaxTree. A file whose parse needed error
// recovery is reported as a ParseError and never analyzed partially.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "defcheck/syntax/syntax_tree.hpp"
#include "defcheck/syntax/ts_ll.hpp"

namespace defcheck
{

/// Files above this size are skipped unless configured otherwise
inline constexpr uint64_t k_default_max_file_bytes = 2U * 1024U * 1024U;

enum class ParseErrorKind : uint8_t {
  Syntax,    ///< Grammar error (tree-sitter needed recovery)
  Io,        ///< File could not be read
  TooLarge,  ///< File exceeds the configured size bound
};

[[nodiscard]] constexpr std::string_view to_string(ParseErrorKind k) noexcept
{
  switch (k) {
    case ParseErrorKind::Syntax:
      return "syntax";
    case ParseErrorKind::Io:
      return "io";
    case ParseErrorKind::TooLarge:
      return "too_large";
  }
  return "";
}

struct ParseError
{
  ParseErrorKind kind = ParseErrorKind::Syntax;
  std::string message;
  uint32_t line = 0;  ///< First error line (Syntax only)
  uint32_t column = 0;
};

/**
 * Result of parsing one file: either a tree or a typed error.
 */
struct ParseResult
{
  std::unique_ptr<SyntaxTree> tree;
  std::optional<ParseError> error;

  [[nodiscard]] bool success() const noexcept { return tree != nullptr && !error; }

  static ParseResult ok(std::unique_ptr<SyntaxTree> t)
  {
    ParseResult r;
    r.tree = std::move(t);
    return r;
  }

  static ParseResult fail(ParseError e)
  {
    ParseResult r;
    r.error = std::move(e);
    return r;
  }
};

/**
 * Reusable parser front end; owns one tree-sitter parser.
 * Not thread-safe: use one instance per worker thread.
 */
class SourceParser
{
public:
  SourceParser() = default;

  [[nodiscard]] ParseResult parse_source(std::filesystem::path path, std::string text) const;

  [[nodiscard]] ParseResult parse_file(
    const std::filesystem::path & path, uint64_t max_bytes = k_default_max_file_bytes) const;

private:
  ts_ll::Parser parser_;
};

/// Convenience wrapper creating a temporary SourceParser
[[nodiscard]] ParseResult parse_source(std::filesystem::path path, std::string text);

/// Convenience wrapper creating a temporary SourceParser
[[nodiscard]] ParseResult parse_file(
  const std::filesystem::path & path, uint64_t max_bytes = k_default_max_file_bytes);

/**
 * Read a whole file into a string.
 * Returns std::nullopt if the file cannot be opened or read.
 */
[[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path & path);

}  // namespace defcheck
