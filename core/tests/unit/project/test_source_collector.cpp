// tests/unit/project/test_source_collector.cpp - Unit tests for glob matching and source discovery

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codemap/project/source_collector.hpp"
#include "codemap/test_support/analyze_helpers.hpp"

using namespace codemap;
using codemap::test_support::TempDir;

// ============================================================================
// glob_match
// ============================================================================

TEST(GlobMatch, SingleStar)
{
  EXPECT_TRUE(glob_match("*.py", "main.py"));
  EXPECT_FALSE(glob_match("*.py", "pkg/main.py"));
  EXPECT_FALSE(glob_match("*.py", "main.pyc"));
}

TEST(GlobMatch, DoubleStar)
{
  EXPECT_TRUE(glob_match("**/*.py", "main.py"));
  EXPECT_TRUE(glob_match("**/*.py", "a/b/c.py"));
  EXPECT_TRUE(glob_match("build/**", "build/x/y.o"));
  EXPECT_TRUE(glob_match("**/vendor/**", "src/vendor/lib.js"));
  EXPECT_FALSE(glob_match("**/vendor/**", "src/vendors/lib.js"));
}

TEST(GlobMatch, QuestionMark)
{
  EXPECT_TRUE(glob_match("test_?.py", "test_a.py"));
  EXPECT_FALSE(glob_match("test_?.py", "test_ab.py"));
  EXPECT_FALSE(glob_match("a?b", "a/b"));
}

TEST(GlobMatch, Literal)
{
  EXPECT_TRUE(glob_match("setup.py", "setup.py"));
  EXPECT_FALSE(glob_match("setup.py", "setup.pyi"));
  EXPECT_TRUE(glob_match("", ""));
}

// ============================================================================
// collect_source_files
// ============================================================================

TEST(SourceCollector, WalksKnownLanguages)
{
  TempDir dir;
  dir.write("src/a.py", "");
  dir.write("src/b.js", "");
  dir.write("src/readme.md", "");
  dir.write("src/.cache/x.py", "");
  dir.write("src/node_modules/dep/index.js", "");
  dir.write("src/gen/out.py", "");
  dir.write("src/core/engine.cpp", "");

  const auto files =
    collect_source_files({dir.path() / "src"}, {"node_modules", "**/gen/**"}, dir.path());

  const std::vector<fs::path> expected = {
    (dir.path() / "src/a.py").lexically_normal(),
    (dir.path() / "src/b.js").lexically_normal(),
    (dir.path() / "src/core/engine.cpp").lexically_normal(),
  };
  EXPECT_EQ(files, expected);
}

TEST(SourceCollector, FileRootsAreDeduplicated)
{
  TempDir dir;
  const auto file = dir.write("tool.py", "");

  const auto files = collect_source_files({file, file}, {}, dir.path());
  ASSERT_EQ(files.size(), 1U);
  EXPECT_EQ(files[0], file.lexically_normal());
}

TEST(SourceCollector, MissingRootIsSkipped)
{
  TempDir dir;
  EXPECT_TRUE(collect_source_files({dir.path() / "nope"}, {}, dir.path()).empty());
}

TEST(SourceCollector, ProjectRootWhenNoSources)
{
  TempDir dir;
  dir.write("app/main.py", "");
  dir.write("tests/test_main.py", "");

  ProjectConfig config;
  config.project_root = dir.path();
  config.exclude = {"tests"};

  const auto files = collect_source_files(config);
  ASSERT_EQ(files.size(), 1U);
  EXPECT_EQ(files[0], (dir.path() / "app/main.py").lexically_normal());
}
