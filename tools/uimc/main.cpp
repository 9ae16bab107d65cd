// uimc - UI markup expander Command Line Interface
//
// Usage:
//   uimc expand <file> [-o output]
//   uimc check <file>
//   uimc dump-ast <file>
//   uimc init
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>

#include "ui_markup/ast/json_visitor.hpp"
#include "ui_markup/basic/diagnostic_printer.hpp"
#include "ui_markup/basic/source_manager.hpp"
#include "ui_markup/driver/expander.hpp"
#include "ui_markup/project/markup_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "UI Markup Expander v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  expand <file>            Replace every ui! { ... } with builder calls\n"
            << "  check <file>             Report markup errors only (no output)\n"
            << "  dump-ast <file>          Print the parsed markup trees as JSON\n"
            << "  init                     Write a default uimc.yaml in the current directory\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  --config <path>          Use this uimc.yaml instead of searching for one\n"
            << "  --markup                 Treat the whole file as one markup block\n"
            << "  --pretty                 One chained call per line\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const ui_markup::DiagnosticBag & diagnostics, const ui_markup::SourceManager & source)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  ui_markup::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  bool markup_mode = false;
  bool pretty = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--markup") {
      args.markup_mode = true;
    } else if (arg == "--pretty") {
      args.pretty = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared Steps
// ============================================================================

std::optional<ui_markup::MarkupConfig> resolve_config(
  const CommandArgs & args, const fs::path & input_path)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = ui_markup::find_markup_config(input_path.parent_path());
  }

  ui_markup::MarkupConfig config;
  if (config_path) {
    const auto loaded = ui_markup::load_markup_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = loaded.config;
    if (args.verbose) {
      std::cerr << "Using config: " << config_path->string() << "\n";
    }
  } else if (args.verbose) {
    std::cerr << "Using built-in defaults (no " << ui_markup::k_markup_config_file_name
              << " found)\n";
  }

  if (args.pretty) {
    config.output.style = ui_markup::OutputStyle::Pretty;
  }
  return config;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << path.string() << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool write_output(const CommandArgs & args, const std::string & text)
{
  if (args.output_path.empty()) {
    std::cout << text;
    return true;
  }
  std::ofstream out(args.output_path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return false;
  }
  out << text;
  if (args.verbose) {
    std::cerr << "Wrote: " << args.output_path << "\n";
  }
  return true;
}

/// Input file, its contents and configuration, ready to process.
struct LoadedInput
{
  ui_markup::SourceManager source;
  ui_markup::MarkupConfig config;
};

std::optional<LoadedInput> load_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: uimc " << args.command << " <file>\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  auto config = resolve_config(args, input_path);
  if (!config) {
    return std::nullopt;
  }

  auto text = read_file(input_path);
  if (!text) {
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << (args.markup_mode ? "Reading markup: " : "Reading host file: ")
              << input_path.string() << "\n";
  }

  return LoadedInput{ui_markup::SourceManager(input_path, std::move(*text)), std::move(*config)};
}

// ============================================================================
// Commands
// ============================================================================

int cmd_expand(const CommandArgs & args)
{
  const auto input = load_input(args);
  if (!input) {
    return 1;
  }
  const auto & source = input->source;

  if (args.markup_mode) {
    const auto result = ui_markup::transform_markup(source.get_source(), input->config);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, source);
    }
    if (!result.success) {
      return 1;
    }
    return write_output(args, *result.code + "\n") ? 0 : 1;
  }

  const auto result =
    ui_markup::expand_source(source.get_file_path(), source.get_source(), input->config);
  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, source);
  }
  if (!result.success) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Expanded " << result.invocations.size() << " invocation(s)\n";
  }
  return write_output(args, result.output) ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  const auto input = load_input(args);
  if (!input) {
    return 1;
  }
  const auto & source = input->source;

  bool success = false;
  if (args.markup_mode) {
    const auto result = ui_markup::transform_markup(source.get_source(), input->config);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, source);
    }
    success = result.success;
  } else {
    const auto result =
      ui_markup::expand_source(source.get_file_path(), source.get_source(), input->config);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, source);
    }
    if (args.verbose) {
      std::cerr << "Checked " << result.invocations.size() << " invocation(s)\n";
    }
    success = result.success;
  }

  if (success) {
    std::cout << args.input_file << ": OK\n";
    return 0;
  }
  return 1;
}

int cmd_dump_ast(const CommandArgs & args)
{
  const auto input = load_input(args);
  if (!input) {
    return 1;
  }
  const auto & source = input->source;

  nlohmann::json out;
  bool success = false;

  if (args.markup_mode) {
    const auto result = ui_markup::transform_markup(source.get_source(), input->config);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, source);
    }
    success = result.success;
    out = result.markup ? ui_markup::to_json(*result.markup) : nlohmann::json(nullptr);
  } else {
    const auto result =
      ui_markup::expand_source(source.get_file_path(), source.get_source(), input->config);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, source);
    }
    success = result.success;

    out = nlohmann::json::array();
    for (const auto & inv : result.invocations) {
      const auto lc = source.get_line_column(inv.range.get_begin());
      out.push_back(
        {{"line", lc.line},
         {"column", lc.column},
         {"markup", inv.markup ? ui_markup::to_json(*inv.markup) : nlohmann::json(nullptr)}});
    }
  }

  if (!write_output(args, out.dump(2) + "\n")) {
    return 1;
  }
  return success ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path config_path = fs::current_path() / ui_markup::k_markup_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: file already exists: " << config_path.string() << "\n";
    return 1;
  }

  std::ofstream config(config_path);
  if (!config.is_open()) {
    std::cerr << "error: failed to create file: " << config_path.string() << "\n";
    return 1;
  }
  config << ui_markup::default_config_yaml();
  config.close();

  std::cout << "Wrote default configuration to " << config_path.string() << "\n";
  if (args.verbose) {
    std::cout << "\nNext steps:\n"
              << "  edit toolkit.native_tags to match your toolkit\n"
              << "  uimc expand src/view.rs\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "expand") {
      return cmd_expand(args);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "dump-ast") {
      return cmd_dump_ast(args);
    }

    if (args.command == "init") {
      return cmd_init(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
