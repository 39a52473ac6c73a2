// codemap/driver/analyzer.hpp - Batch analysis driver
//
// Runs per-file analysis concurrently over a batch of inputs and hands the
// finished FileMaps to a GraphBuilder.
// Used by the CLI and usable by other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "codemap/analysis/file_analyzer.hpp"
#include "codemap/graph/module_locator.hpp"
#include "codemap/graph/project_graph.hpp"
#include "codemap/syntax/adapter_registry.hpp"

namespace codemap
{

// ============================================================================
// Inputs and options
// ============================================================================

struct SourceInput
{
  std::filesystem::path path;
  std::string text;
  /// Overrides detection from the file extension.
  std::optional<LanguageId> language;
};

struct AnalyzerOptions
{
  /// Worker tasks; 0 picks the hardware concurrency.
  size_t jobs = 0;

  AnalysisOptions analysis;
};

// ============================================================================
// Analyzer
// ============================================================================

class Analyzer
{
public:
  Analyzer(
    const AdapterRegistry & registry, const ModuleLocator & locator, AnalyzerOptions options = {})
  : registry_(registry), locator_(locator), options_(options)
  {
  }

  /**
   * Analyze every input; results are in input order.
   *
   * An input whose analysis throws yields a FileMap with a single
   * InternalError diagnostic instead of aborting the batch.
   */
  [[nodiscard]] std::vector<FileMap> analyze_all(std::vector<SourceInput> inputs) const;

  /**
   * Analyze the inputs and link them into a graph covering every input.
   */
  [[nodiscard]] ProjectGraph run(std::vector<SourceInput> inputs) const;

  /**
   * Read, analyze and link files from disk.
   *
   * A file that cannot be read is part of the graph with a single
   * FileReadError diagnostic.
   */
  [[nodiscard]] ProjectGraph run_files(const std::vector<std::filesystem::path> & paths) const;

  [[nodiscard]] size_t effective_jobs(size_t input_count) const noexcept;

private:
  const AdapterRegistry & registry_;
  const ModuleLocator & locator_;
  AnalyzerOptions options_;
};

/// Read a whole file; nullopt when it cannot be opened.
[[nodiscard]] std::optional<std::string> read_source_file(const std::filesystem::path & path);

}  // namespace codemap
