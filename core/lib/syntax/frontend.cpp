// defcheck/syntax/frontend.cpp - High-level parse pipeline
#include "defcheck/syntax/frontend.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "defcheck/syntax/tree_builder.hpp"

namespace defcheck
{

namespace
{

/// First ERROR or MISSING node in source order
ts_ll::Node find_first_error(const ts_ll::Node n)
{
  if (n.is_null()) return {};
  if (n.is_error() || n.is_missing()) return n;
  if (!n.has_error()) return {};

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node found = find_first_error(n.child(i));
    if (!found.is_null()) {
      return found;
    }
  }
  return {};
}

}  // namespace

ParseResult SourceParser::parse_source(std::filesystem::path path, std::string text) const
{
  SourceFile source(std::move(path), std::move(text));

  const ts_ll::Tree cst(parser_.parse_string(source.content()));
  if (cst.is_null()) {
    return ParseResult::fail({ParseErrorKind::Syntax, "tree-sitter parse failed (null tree)"});
  }

  const ts_ll::Node root = cst.root_node();

  // Tree-sitter recovers from syntax errors and still returns a tree; any
  // recovery makes the whole file unparseable for analysis purposes.
  if (root.has_error()) {
    ParseError err;
    err.kind = ParseErrorKind::Syntax;
    const ts_ll::Node bad = find_first_error(root);
    if (!bad.is_null()) {
      err.line = bad.start_row() + 1;
      err.column = bad.start_column() + 1;
      err.message = bad.is_missing() ? "missing token" : "syntax error";
      err.message += " at line " + std::to_string(err.line);
    } else {
      err.message = "syntax error";
    }
    return ParseResult::fail(std::move(err));
  }

  auto tree = std::make_unique<SyntaxTree>(std::move(source));
  TreeBuilder builder(*tree);
  builder.build(root);
  return ParseResult::ok(std::move(tree));
}

ParseResult SourceParser::parse_file(const std::filesystem::path & path, uint64_t max_bytes) const
{
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return ParseResult::fail({ParseErrorKind::Io, "cannot stat file: " + ec.message()});
  }
  if (max_bytes > 0 && size > max_bytes) {
    return ParseResult::fail(
      {ParseErrorKind::TooLarge,
       "file size " + std::to_string(size) + " exceeds limit of " + std::to_string(max_bytes) +
         " bytes"});
  }

  auto text = read_file(path);
  if (!text) {
    return ParseResult::fail({ParseErrorKind::Io, "failed to read file"});
  }
  return parse_source(path, std::move(*text));
}

ParseResult parse_source(std::filesystem::path path, std::string text)
{
  const SourceParser parser;
  return parser.parse_source(std::move(path), std::move(text));
}

ParseResult parse_file(const std::filesystem::path & path, uint64_t max_bytes)
{
  const SourceParser parser;
  return parser.parse_file(path, max_bytes);
}

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

}  // namespace defcheck
