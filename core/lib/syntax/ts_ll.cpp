// defcheck/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "defcheck/syntax/ts_ll.hpp"

#include <stdexcept>

namespace defcheck::ts_ll
{

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  const TSLanguage * lang = tree_sitter_python();
  if (lang == nullptr || !ts_parser_set_language(parser_, lang)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("failed to load the tree-sitter Python grammar");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; the grammar expects UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace defcheck::ts_ll
