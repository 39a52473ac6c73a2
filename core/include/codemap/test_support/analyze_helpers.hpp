// codemap/test_support/analyze_helpers.hpp - helpers for unit/integration tests
//
// A one-call analysis pipeline over in-memory source text, plus record
// lookups used throughout the tests.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/analysis/file_analyzer.hpp"
#include "codemap/model/file_map.hpp"
#include "codemap/syntax/adapter_registry.hpp"

namespace codemap::test_support
{

/// Registry with every built-in language, shared by the tests of one binary.
[[nodiscard]] inline const AdapterRegistry & builtin_registry()
{
  static const AdapterRegistry registry = AdapterRegistry::with_builtin_languages();
  return registry;
}

[[nodiscard]] inline FileMap analyze(
  std::string src, const std::filesystem::path & virtual_path, AnalysisOptions options = {})
{
  const FileAnalyzer analyzer(builtin_registry(), options);
  return analyzer.analyze(virtual_path, std::move(src));
}

[[nodiscard]] inline FileMap analyze_python(std::string src)
{
  return analyze(std::move(src), "<test>.py");
}

[[nodiscard]] inline const SymbolRecord * find_symbol(const FileMap & map, std::string_view name)
{
  for (const auto & s : map.symbols) {
    if (s.name == name) {
      return &s;
    }
  }
  return nullptr;
}

[[nodiscard]] inline std::vector<SymbolKind> kinds_of(const FileMap & map)
{
  std::vector<SymbolKind> out;
  for (const auto & s : map.symbols) {
    out.push_back(s.kind);
  }
  return out;
}

[[nodiscard]] inline std::vector<ImportKind> import_kinds_of(const FileMap & map)
{
  std::vector<ImportKind> out;
  for (const auto & r : map.imports) {
    out.push_back(r.kind);
  }
  return out;
}

/**
 * Temporary directory removed on destruction.
 */
class TempDir
{
public:
  TempDir()
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("codemap_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `content` to `relative`, creating parent directories.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out << content;
    return full;
  }

private:
  std::filesystem::path path_;
};

}  // namespace codemap::test_support
