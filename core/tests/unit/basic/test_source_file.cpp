// tests/unit/basic/test_source_file.cpp - Unit tests for SourceFile and SourceRange

#include <gtest/gtest.h>

#include <string>

#include "codemap/basic/source_file.hpp"

using codemap::SourceFile;
using codemap::SourceRange;

TEST(SourceFile, LineColumnIsOneBased)
{
  const SourceFile file("a.py", "def f():\n    pass\n");

  const auto first = file.get_line_column(0);
  EXPECT_EQ(first.line, 1U);
  EXPECT_EQ(first.column, 1U);

  // 'p' of "pass"
  const auto p = file.get_line_column(13);
  EXPECT_EQ(p.line, 2U);
  EXPECT_EQ(p.column, 5U);
}

TEST(SourceFile, GetLineStripsTerminators)
{
  const SourceFile file("a.js", "let a = 1;\r\nlet b = 2;\n");

  EXPECT_EQ(file.line_count(), 3U);
  EXPECT_EQ(file.get_line(0), "let a = 1;");
  EXPECT_EQ(file.get_line(1), "let b = 2;");
  EXPECT_EQ(file.get_line(2), "");
  EXPECT_EQ(file.get_line(7), "");
}

TEST(SourceFile, SliceClampsToContent)
{
  const SourceFile file("a.py", "import os\n");

  EXPECT_EQ(file.get_slice(SourceRange(7, 9)), "os");
  EXPECT_EQ(file.get_slice(SourceRange(7, 100)), "os\n");
  EXPECT_EQ(file.get_slice(SourceRange(50, 60)), "");
  EXPECT_EQ(file.get_slice(SourceRange()), "");
}

TEST(SourceFile, SpanCarriesLinesAndBytes)
{
  const SourceFile file("a.py", "x = 1\ny = 2\n");
  const auto span = file.get_span(SourceRange(6, 11));

  EXPECT_TRUE(span.is_valid());
  EXPECT_EQ(span.start_line, 2U);
  EXPECT_EQ(span.start_column, 1U);
  EXPECT_EQ(span.end_line, 2U);
  EXPECT_EQ(span.end_column, 6U);
  EXPECT_EQ(span.start_byte, 6U);
  EXPECT_EQ(span.end_byte, 11U);
  EXPECT_EQ(span.to_source_range(), SourceRange(6, 11));
}

TEST(SourceRange, Containment)
{
  const SourceRange outer(10, 50);

  EXPECT_TRUE(outer.contains(SourceRange(10, 50)));
  EXPECT_TRUE(outer.contains(SourceRange(20, 30)));
  EXPECT_FALSE(outer.contains(SourceRange(5, 30)));
  EXPECT_FALSE(outer.contains(SourceRange()));
  EXPECT_TRUE(outer.contains(49U));
  EXPECT_FALSE(outer.contains(50U));
}
