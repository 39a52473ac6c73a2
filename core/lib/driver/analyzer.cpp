// codemap/driver/analyzer.cpp - Batch analysis driver
#include "codemap/driver/analyzer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>

#include "codemap/basic/logging.hpp"
#include "codemap/graph/graph_builder.hpp"

namespace codemap
{

namespace
{

FileMap failed_file_map(
  const fs::path & path, LanguageId language, DiagnosticKind kind, std::string message)
{
  FileMap map;
  map.file_path = path;
  map.language = language;
  map.diagnostics.report_error(kind, Span{}, std::move(message));
  return map;
}

}  // namespace

std::optional<std::string> read_source_file(const fs::path & path)
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

size_t Analyzer::effective_jobs(size_t input_count) const noexcept
{
  size_t jobs = options_.jobs;
  if (jobs == 0) {
    jobs = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  return std::max<size_t>(1, std::min(jobs, input_count));
}

std::vector<FileMap> Analyzer::analyze_all(std::vector<SourceInput> inputs) const
{
  std::vector<FileMap> results(inputs.size());
  if (inputs.empty()) {
    return results;
  }

  const FileAnalyzer analyzer(registry_, options_.analysis);
  std::atomic<size_t> next{0};

  // Each worker claims the next unprocessed input and owns its result slot.
  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < inputs.size(); i = next.fetch_add(1)) {
      SourceInput & input = inputs[i];
      const LanguageId language = input.language.value_or(language_for_path(input.path));
      try {
        results[i] = analyzer.analyze(input.path, language, std::move(input.text));
      } catch (const std::exception & e) {
        logging::logger()->error("{}: analysis failed: {}", input.path.string(), e.what());
        results[i] = failed_file_map(
          input.path, language, DiagnosticKind::InternalError,
          std::string("analysis failed: ") + e.what());
      }
    }
  };

  const size_t jobs = effective_jobs(inputs.size());
  logging::logger()->debug("analyzing {} files with {} tasks", inputs.size(), jobs);

  std::vector<std::future<void>> tasks;
  tasks.reserve(jobs);
  for (size_t j = 0; j < jobs; ++j) {
    tasks.push_back(std::async(std::launch::async, worker));
  }
  for (auto & task : tasks) {
    task.get();
  }
  return results;
}

ProjectGraph Analyzer::run(std::vector<SourceInput> inputs) const
{
  GraphBuilder builder(locator_);
  for (auto & map : analyze_all(std::move(inputs))) {
    builder.add_file(std::move(map));
  }
  return builder.build();
}

ProjectGraph Analyzer::run_files(const std::vector<fs::path> & paths) const
{
  std::vector<SourceInput> inputs;
  std::vector<FileMap> unreadable;
  inputs.reserve(paths.size());

  for (const auto & path : paths) {
    if (auto text = read_source_file(path)) {
      inputs.push_back(SourceInput{path, std::move(*text), std::nullopt});
    } else {
      logging::logger()->warn("cannot read {}", path.string());
      unreadable.push_back(failed_file_map(
        path, language_for_path(path), DiagnosticKind::FileReadError,
        "cannot read file: " + path.string()));
    }
  }

  GraphBuilder builder(locator_);
  for (auto & map : analyze_all(std::move(inputs))) {
    builder.add_file(std::move(map));
  }
  for (auto & map : unreadable) {
    builder.add_file(std::move(map));
  }
  return builder.build();
}

}  // namespace codemap
