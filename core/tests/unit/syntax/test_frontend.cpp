// tests/syntax/test_frontend.cpp - Unit tests for the parse pipeline
//

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "defcheck/syntax/frontend.hpp"

using namespace defcheck;

namespace fs = std::filesystem;

static bool test_debug_enabled() { return std::getenv("DEFCHECK_TEST_DEBUG") != nullptr; }

// ============================================================================
// Helper Functions
// ============================================================================

static fs::path write_temp_file(const std::string & name, const std::string & content)
{
  const fs::path dir = fs::temp_directory_path() / "defcheck_frontend_tests";
  fs::create_directories(dir);
  const fs::path path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

// ============================================================================
// parse_source Tests
// ============================================================================

TEST(FrontendTest, ParsesValidModule)
{
  auto result = parse_source("ok.py", "import os\n\ndef f(x):\n    return x + 1\n");
  ASSERT_TRUE(result.success());
  ASSERT_NE(result.tree, nullptr);

  const SyntaxTree & tree = *result.tree;
  EXPECT_EQ(tree.kind(tree.root()), NodeKind::Module);
  EXPECT_EQ(tree.nodes_of_kind(NodeKind::FunctionDefinition).size(), 1U);
  EXPECT_EQ(tree.nodes_of_kind(NodeKind::ImportStatement).size(), 1U);
}

TEST(FrontendTest, EmptySourceParses)
{
  auto result = parse_source("empty.py", "");
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.tree->source().line_count(), 0U);
}

TEST(FrontendTest, SyntaxErrorIsReportedWithLine)
{
  auto result = parse_source("bad.py", "x = 1\ndef broken(:\n    pass\n");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.tree, nullptr);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ParseErrorKind::Syntax);
  EXPECT_GE(result.error->line, 1U);
  EXPECT_NE(result.error->message.find("line"), std::string::npos);

  if (test_debug_enabled()) {
    std::cerr << "[frontend] " << result.error->message << "\n";
  }
}

TEST(FrontendTest, UnclosedParenthesisIsSyntaxError)
{
  auto result = parse_source("bad.py", "print(\n");
  EXPECT_FALSE(result.success());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ParseErrorKind::Syntax);
}

// ============================================================================
// parse_file Tests
// ============================================================================

TEST(FrontendTest, ParseFileReadsFromDisk)
{
  const fs::path path = write_temp_file("disk.py", "value = 42\n");
  auto result = parse_file(path);
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.tree->source().line_text(1), "value = 42");
  EXPECT_EQ(result.tree->source().path(), path);
}

TEST(FrontendTest, MissingFileIsIoError)
{
  auto result = parse_file(fs::temp_directory_path() / "defcheck_no_such_file.py");
  EXPECT_FALSE(result.success());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ParseErrorKind::Io);
}

TEST(FrontendTest, OversizedFileIsSkipped)
{
  const fs::path path = write_temp_file("large.py", std::string(256, '#') + "\n");
  auto result = parse_file(path, 64);
  EXPECT_FALSE(result.success());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ParseErrorKind::TooLarge);
  EXPECT_EQ(to_string(result.error->kind), "too_large");
}

TEST(FrontendTest, ParserInstanceIsReusable)
{
  const SourceParser parser;
  auto first = parser.parse_source("a.py", "a = 1\n");
  auto second = parser.parse_source("b.py", "b = (\n");
  auto third = parser.parse_source("c.py", "c = 3\n");
  EXPECT_TRUE(first.success());
  EXPECT_FALSE(second.success());
  EXPECT_TRUE(third.success());
}
