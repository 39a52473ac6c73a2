// codemap - Code map command line interface
//
// Usage:
//   codemap analyze [paths... | --project] [--json] [-o output]
//   codemap check [paths... | --project]
//   codemap init [directory]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "codemap/basic/diagnostic_printer.hpp"
#include "codemap/basic/logging.hpp"
#include "codemap/driver/analyzer.hpp"
#include "codemap/graph/module_locator.hpp"
#include "codemap/project/project_config.hpp"
#include "codemap/project/source_collector.hpp"
#include "codemap/report/json_export.hpp"
#include "codemap/syntax/adapter_registry.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "codemap v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  analyze [paths...]       Analyze files or directories and print the code map\n"
            << "  check [paths...]         Report diagnostics only\n"
            << "  init [directory]         Write a codemap.yaml template\n\n"
            << "Options:\n"
            << "  --json                   Print the code map as JSON (same as --format json)\n"
            << "  --format <text|json>     Output format of 'analyze'\n"
            << "  -o, --output <path>      Write output to a file\n"
            << "  --project                Use codemap.yaml from the current directory or parents\n"
            << "  --pkg <path>             Register package (folder name = pkg name, repeatable)\n"
            << "  -I <dir>                 Add a module search path (repeatable)\n"
            << "  -j, --jobs <n>           Parallel analysis tasks (0 = all cores)\n"
            << "  --no-fold                Do not fold string concatenations in imports\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const codemap::ProjectGraph & graph, bool & any_errors)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  codemap::DiagnosticPrinter printer(std::cerr, use_color);

  for (const auto & [path, map] : graph.files()) {
    if (map.diagnostics.empty()) {
      continue;
    }
    any_errors = any_errors || map.diagnostics.has_errors();

    // Re-read the file for source context; print without it when unreadable.
    if (auto text = codemap::read_source_file(path)) {
      const codemap::SourceFile source(path, std::move(*text));
      printer.print_all(map.diagnostics, path, &source);
    } else {
      printer.print_all(map.diagnostics, path, nullptr);
    }
  }
}

void print_summary(const codemap::ProjectGraph & graph, std::ostream & out)
{
  for (const auto & [path, map] : graph.files()) {
    out << path.string() << " (" << codemap::to_string(map.language) << "): "
        << map.symbols.size() << " symbols, " << map.imports.size() << " imports";
    if (!map.diagnostics.empty()) {
      out << ", " << map.diagnostics.size() << " diagnostics";
    }
    out << "\n";

    for (const auto & s : map.symbols) {
      out << "  " << codemap::to_string(s.kind) << " " << s.name << " [" << s.span.start_line
          << "]";
      if (const auto * scope = map.scope_of(s)) {
        out << " in " << scope->name;
      }
      out << "\n";
    }
    for (const auto & edge : graph.outgoing(path)) {
      out << "  -> " << edge->module_reference << ": ";
      if (edge->resolution == codemap::EdgeResolution::Resolved && edge->to_file) {
        out << edge->to_file->string();
      } else {
        out << codemap::k_unknown_node << " (" << codemap::to_string(edge->resolution) << ")";
      }
      out << "\n";
    }
  }
  out << graph.file_count() << " files, " << graph.edge_count() << " edges, "
      << graph.unknown_edges().size() << " unknown\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string output_path;
  std::string format = "text";
  std::vector<std::string> pkg_paths;
  std::vector<std::string> search_paths;
  int jobs = -1;
  bool use_project = false;
  bool no_fold = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--json") {
      args.format = "json";
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--pkg") {
      if (i + 1 < argc) {
        args.pkg_paths.emplace_back(argv[++i]);
      }
    } else if (arg == "-I") {
      if (i + 1 < argc) {
        args.search_paths.emplace_back(argv[++i]);
      }
    } else if (arg.size() > 2 && arg.compare(0, 2, "-I") == 0) {
      args.search_paths.push_back(arg.substr(2));
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 < argc) {
        try {
          args.jobs = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          args.error = "invalid value for " + arg + ": '" + argv[i] + "'";
        }
      }
    } else if (arg == "--no-fold") {
      args.no_fold = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-') {
      args.inputs.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  if (args.format != "text" && args.format != "json") {
    args.error = "invalid format '" + args.format + "' (must be 'text' or 'json')";
  }
  if (args.jobs < -1) {
    args.error = "--jobs must not be negative";
  }

  return args;
}

// ============================================================================
// Analysis
// ============================================================================

struct RunOutcome
{
  bool ok = false;
  codemap::ProjectGraph graph;
};

RunOutcome analyze_inputs(const CommandArgs & args)
{
  RunOutcome outcome;

  codemap::ProjectConfig config;
  config.project_root = fs::current_path();

  if (args.use_project || args.inputs.empty()) {
    // Project mode: find codemap.yaml
    auto config_path = codemap::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no codemap.yaml found in current directory or parents\n";
      return outcome;
    }

    auto config_result = codemap::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return outcome;
    }
    config = std::move(config_result.config);

    if (auto level = codemap::logging::parse_level(config.logging.level)) {
      codemap::logging::set_level(*level);
    }
    if (args.verbose) {
      std::cerr << "Analyzing project: "
                << (config.project.name.empty() ? config.project_root.string()
                                                : config.project.name)
                << "\n";
    }
  }

  if (!args.inputs.empty()) {
    config.sources.clear();
    for (const auto & input : args.inputs) {
      config.sources.push_back(fs::absolute(input));
    }
  }
  for (const auto & path : args.pkg_paths) {
    const fs::path pkg = fs::absolute(path);
    config.resolver.packages[pkg.filename().string()] = pkg;
  }
  for (const auto & dir : args.search_paths) {
    config.resolver.search_paths.push_back(fs::absolute(dir));
  }
  if (args.jobs >= 0) {
    config.analysis.jobs = static_cast<size_t>(args.jobs);
  }
  if (args.no_fold) {
    config.analysis.fold_constant_imports = false;
  }
  if (args.verbose) {
    codemap::logging::set_level(spdlog::level::debug);
  }

  codemap::AdapterRegistry registry = codemap::AdapterRegistry::with_builtin_languages();
  if (const auto markers = codemap::apply_marker_config(config, registry); !markers.success) {
    std::cerr << "error: " << markers.error << "\n";
    return outcome;
  }

  codemap::FilesystemModuleLocator locator(registry);
  for (const auto & [name, path] : config.resolver.packages) {
    locator.register_package(name, path);
  }
  for (const auto & dir : config.resolver.search_paths) {
    locator.add_search_path(dir);
  }

  const std::vector<fs::path> files = codemap::collect_source_files(config);
  if (files.empty()) {
    std::cerr << "error: no source files found\n";
    return outcome;
  }
  if (args.verbose) {
    std::cerr << "Analyzing " << files.size() << " files\n";
  }

  codemap::AnalyzerOptions options;
  options.jobs = config.analysis.jobs;
  options.analysis.fold_constant_imports = config.analysis.fold_constant_imports;

  const codemap::Analyzer analyzer(registry, locator, options);
  outcome.graph = analyzer.run_files(files);
  outcome.ok = true;
  return outcome;
}

RunOutcome run_analysis(const CommandArgs & args)
{
  try {
    return analyze_inputs(args);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return RunOutcome{};
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_analyze(const CommandArgs & args)
{
  RunOutcome outcome = run_analysis(args);
  if (!outcome.ok) {
    return 1;
  }

  bool any_errors = false;
  print_diagnostics(outcome.graph, any_errors);

  std::ostringstream rendered;
  if (args.format == "json") {
    rendered << codemap::dump_json(codemap::to_json(outcome.graph), 2) << "\n";
  } else {
    print_summary(outcome.graph, rendered);
  }

  if (args.output_path.empty()) {
    std::cout << rendered.str();
  } else {
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return 1;
    }
    out << rendered.str();
    std::cerr << "Wrote " << args.output_path << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  RunOutcome outcome = run_analysis(args);
  if (!outcome.ok) {
    return 1;
  }

  bool any_errors = false;
  print_diagnostics(outcome.graph, any_errors);
  if (any_errors) {
    return 1;
  }

  std::cout << outcome.graph.file_count() << " files: OK\n";
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  try {
    const fs::path project_dir =
      args.inputs.empty() ? fs::current_path() : fs::absolute(args.inputs.front());
    const fs::path config_path = project_dir / codemap::k_project_config_file_name;

    if (fs::exists(config_path)) {
      std::cerr << "error: file already exists: " << config_path.string() << "\n";
      return 1;
    }

    fs::create_directories(project_dir);

    std::ofstream config(config_path);
    config << "project:\n"
           << "  name: '" << project_dir.filename().string() << "'\n\n"
           << "sources:\n"
           << "  - '.'\n\n"
           << "exclude:\n"
           << "  - 'node_modules'\n"
           << "  - 'build'\n"
           << "  - '__pycache__'\n\n"
           << "resolver:\n"
           << "  search_paths: []\n"
           << "  packages: {}\n\n"
           << "analysis:\n"
           << "  jobs: 0\n"
           << "  fold_constant_imports: true\n\n"
           << "logging:\n"
           << "  level: 'warn'\n";
    config.close();
    if (!config) {
      std::cerr << "error: failed to write " << config_path.string() << "\n";
      return 1;
    }

    std::cout << "Initialized codemap project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  codemap analyze --project\n";
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "analyze") {
    return cmd_analyze(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
