// apigraph - Declaration graph analyzer command line interface
//
// Usage:
//   apigraph check [--project <dir> | --model <file> --entry <module>]
//   apigraph dump  [--project <dir> | --model <file> --entry <module>] [-o output.json]
//   apigraph clean [--project <dir>]
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "api_graph/basic/diagnostic_printer.hpp"
#include "api_graph/driver/extractor.hpp"
#include "api_graph/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "api_graph declaration graph analyzer v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check                    Resolve and analyze the entry point\n"
            << "  dump                     Analyze and write the graph as JSON\n"
            << "  clean                    Delete the configured dump output\n\n"
            << "Options:\n"
            << "  --project <dir>          Search for config/apigraph.yaml from <dir>\n"
            << "  --model <file>           Program model JSON (instead of a project)\n"
            << "  --entry <module>         Entry module file name (with --model)\n"
            << "  -o, --output <path>      Output file for dump\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const api_graph::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  api_graph::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string project_dir;
  std::string model_path;
  std::string entry_point;
  std::string output_path;
  std::string usage_error;
  bool verbose = false;
  bool show_help = false;
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

  // Options that take a value
  auto take_value = [&](int & i, const std::string & arg, std::string & out) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      args.usage_error = "missing value for " + arg;
    }
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      take_value(i, arg, args.output_path);
    } else if (arg == "--project") {
      take_value(i, arg, args.project_dir);
    } else if (arg == "--model") {
      take_value(i, arg, args.model_path);
    } else if (arg == "--entry") {
      take_value(i, arg, args.entry_point);
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
    }
  }

  if (args.usage_error.empty()) {
    if (!args.model_path.empty() && !args.project_dir.empty()) {
      args.usage_error = "--model and --project cannot be combined";
    } else if (args.model_path.empty() != args.entry_point.empty()) {
      args.usage_error = "--model and --entry must be given together";
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

std::optional<api_graph::ProjectConfig> load_project(const CommandArgs & args)
{
  const fs::path start = args.project_dir.empty() ? fs::current_path() : fs::path(args.project_dir);
  auto config_path = api_graph::find_project_config(start);
  if (!config_path) {
    std::cerr << "error: no " << api_graph::k_project_config_folder << "/"
              << api_graph::k_project_config_file_name << " found in " << start.string()
              << " or parents\n";
    return std::nullopt;
  }

  auto config_result = api_graph::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_path->string() << ": " << config_result.error << "\n";
    return std::nullopt;
  }

  spdlog::debug("using configuration '{}'", config_path->generic_string());
  return std::move(config_result.config);
}

int cmd_extract(const CommandArgs & args, api_graph::ExtractMode mode)
{
  api_graph::ExtractOptions options;
  options.mode = mode;
  if (!args.output_path.empty()) {
    options.output = fs::path(args.output_path);
  }

  api_graph::ExtractResult result;
  std::string subject;

  if (!args.model_path.empty()) {
    subject = args.entry_point;
    result = api_graph::Extractor::extract_model(args.model_path, args.entry_point, options);
  } else {
    auto config = load_project(args);
    if (!config) {
      return k_exit_failure;
    }
    subject = config->project.name.empty() ? "project" : config->project.name;
    result = api_graph::Extractor::extract_project(*config, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return k_exit_failure;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  std::cout << subject << ": OK\n";
  return k_exit_ok;
}

int cmd_clean(const CommandArgs & args)
{
  if (!args.model_path.empty()) {
    std::cerr << "error: clean requires a project\n";
    return k_exit_usage;
  }

  auto config = load_project(args);
  if (!config) {
    return k_exit_failure;
  }

  api_graph::DiagnosticBag diagnostics;
  const bool ok = api_graph::Extractor::clean_project(*config, diagnostics);
  if (!diagnostics.empty()) {
    print_diagnostics(diagnostics);
  }
  return ok ? k_exit_ok : k_exit_failure;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  // Logs go to stderr so that stdout only carries results
  auto logger = spdlog::stderr_color_mt("apigraph");
  logger->set_pattern("[%^%l%$] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

  if (args.command == "check") {
    return cmd_extract(args, api_graph::ExtractMode::Check);
  }

  if (args.command == "dump") {
    return cmd_extract(args, api_graph::ExtractMode::Dump);
  }

  if (args.command == "clean") {
    return cmd_clean(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
