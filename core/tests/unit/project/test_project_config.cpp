// tests/unit/project/test_project_config.cpp - Unit tests for codemap.yaml loading

#include <gtest/gtest.h>

#include <string>

#include "codemap/project/project_config.hpp"
#include "codemap/test_support/analyze_helpers.hpp"

using namespace codemap;
using codemap::test_support::TempDir;

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, ParsesAllSections)
{
  const auto result = parse_project_config(
    R"(project:
  name: demo
sources:
  - src
  - /abs/lib
exclude: "**/vendor/**"
resolver:
  search_paths: [include]
  packages:
    acme: third_party/acme
analysis:
  jobs: 4
  fold_constant_imports: false
markers:
  python:
    class_method: [classproperty]
    static_method: "@pure"
logging:
  level: debug
)",
    "/proj");

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & config = result.config;

  EXPECT_EQ(config.project.name, "demo");
  EXPECT_EQ(config.project_root, fs::path("/proj"));
  ASSERT_EQ(config.sources.size(), 2U);
  EXPECT_EQ(config.sources[0], fs::path("/proj/src"));
  EXPECT_EQ(config.sources[1], fs::path("/abs/lib"));
  EXPECT_EQ(config.exclude, std::vector<std::string>{"**/vendor/**"});

  ASSERT_EQ(config.resolver.search_paths.size(), 1U);
  EXPECT_EQ(config.resolver.search_paths[0], fs::path("/proj/include"));
  ASSERT_EQ(config.resolver.packages.count("acme"), 1U);
  EXPECT_EQ(config.resolver.packages.at("acme"), fs::path("/proj/third_party/acme"));

  EXPECT_EQ(config.analysis.jobs, 4U);
  EXPECT_FALSE(config.analysis.fold_constant_imports);

  ASSERT_EQ(config.markers.size(), 1U);
  EXPECT_EQ(config.markers[0].language, LanguageId::Python);
  EXPECT_EQ(config.markers[0].class_method, std::vector<std::string>{"classproperty"});
  EXPECT_EQ(config.markers[0].static_method, std::vector<std::string>{"@pure"});

  EXPECT_EQ(config.logging.level, "debug");
}

TEST(ProjectConfig, EmptyDocumentUsesDefaults)
{
  const auto result = parse_project_config("", "/proj");

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.sources.empty());
  EXPECT_EQ(result.config.analysis.jobs, 0U);
  EXPECT_TRUE(result.config.analysis.fold_constant_imports);
  EXPECT_EQ(result.config.logging.level, "warn");
}

TEST(ProjectConfig, RejectsInvalidValues)
{
  struct Case
  {
    const char * yaml;
    const char * message;
  };
  const Case cases[] = {
    {"sources:\n  a: b\n", "sources must be a list"},
    {"analysis:\n  jobs: -1\n", "analysis.jobs must not be negative"},
    {"markers:\n  cobol:\n    class_method: [x]\n", "markers: unknown language 'cobol'"},
    {"logging:\n  level: loud\n", "invalid logging.level"},
    {"resolver:\n  packages: [a, b]\n", "resolver.packages must be a map"},
    {"- a\n- b\n", "configuration root must be a map"},
    {"sources: [unclosed\n", "failed to parse YAML"},
  };

  for (const auto & c : cases) {
    const auto result = parse_project_config(c.yaml, "/proj");
    EXPECT_FALSE(result.success) << c.yaml;
    EXPECT_NE(result.error.find(c.message), std::string::npos) << result.error;
  }
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, LoadsFromFile)
{
  TempDir dir;
  const auto path = dir.write("codemap.yaml", "sources: [src]\n");

  const auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path()));
  ASSERT_EQ(result.config.sources.size(), 1U);
  EXPECT_EQ(result.config.sources[0], (fs::absolute(dir.path()) / "src").lexically_normal());
}

TEST(ProjectConfig, MissingFile)
{
  TempDir dir;
  const auto result = load_project_config(dir.path() / "codemap.yaml");

  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  TempDir dir;
  const auto config = dir.write(k_project_config_file_name, "");
  const auto source = dir.write("src/pkg/mod.py", "");

  const auto from_dir = find_project_config(dir.path() / "src/pkg");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::weakly_canonical(*from_dir), fs::weakly_canonical(config));

  const auto from_file = find_project_config(source);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::weakly_canonical(*from_file), fs::weakly_canonical(config));
}

// ============================================================================
// Markers
// ============================================================================

TEST(ProjectConfig, AppliesMarkers)
{
  const auto result = parse_project_config(
    "markers:\n  python:\n    class_method: [\"@classproperty\"]\n", "/proj");
  ASSERT_TRUE(result.success) << result.error;

  auto registry = AdapterRegistry::with_builtin_languages();
  const auto applied = apply_marker_config(result.config, registry);
  ASSERT_TRUE(applied.success) << applied.error;

  const auto * python = registry.find(LanguageId::Python);
  ASSERT_NE(python, nullptr);
  EXPECT_EQ(python->capabilities().markers.lookup("classproperty"), MarkerRole::ClassMethod);
}

TEST(ProjectConfig, RejectsMarkerWithSecondRole)
{
  const auto result =
    parse_project_config("markers:\n  python:\n    static_method: [classmethod]\n", "/proj");
  ASSERT_TRUE(result.success) << result.error;

  auto registry = AdapterRegistry::with_builtin_languages();
  const auto applied = apply_marker_config(result.config, registry);
  EXPECT_FALSE(applied.success);
  EXPECT_NE(applied.error.find("classmethod"), std::string::npos);
}
