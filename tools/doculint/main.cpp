// doculint - Go documentation convention linter, command line interface
//
// Usage:
//   doculint check [pkg.json ... | --project] [--format text|json]
//   doculint rules
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "doculint/basic/diagnostic_json.hpp"
#include "doculint/basic/diagnostic_printer.hpp"
#include "doculint/driver/linter.hpp"
#include "doculint/lint/rules.hpp"
#include "doculint/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << doculint::k_analyzer_name << ": " << doculint::k_analyzer_doc << "\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [pkg.json ...]     Lint package dumps (or the project)\n"
            << "  rules                    List rule codes\n\n"
            << "Options:\n"
            << "  --project                Lint the packages listed in doculint.yaml\n"
            << "  --format <text|json>     Output format (default: text)\n"
            << "  --color <auto|always|never>\n"
            << "                           Colorize text output (default: auto)\n"
            << "  --entry-package <name>   Package treated as the program entry\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool resolve_color(doculint::ColorMode mode)
{
  switch (mode) {
    case doculint::ColorMode::Always:
      return true;
    case doculint::ColorMode::Never:
      return false;
    case doculint::ColorMode::Auto:
      break;
  }
  // Detect if terminal supports colors (simple check for TTY)
  return isatty(fileno(stderr)) != 0;
}

void print_diagnostics(
  const doculint::LintResult & result, const doculint::OutputConfig & output)
{
  if (output.format == doculint::OutputFormat::Json) {
    std::cout << doculint::diagnostics_to_json(result.diagnostics, result.sources).dump(2)
              << "\n";
    return;
  }

  if (result.diagnostics.empty()) {
    return;
  }
  doculint::DiagnosticPrinter printer(std::cerr, resolve_color(output.color));
  printer.print_all(result.diagnostics, result.sources);
  printer.print_summary(result.diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> input_files;
  std::optional<std::string> format;
  std::optional<std::string> color;
  std::optional<std::string> entry_package;
  bool use_project = false;
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

  auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.error = "missing value for " + flag;
    return std::nullopt;
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--format") {
      args.format = take_value(i, arg);
    } else if (arg == "--color") {
      args.color = take_value(i, arg);
    } else if (arg == "--entry-package") {
      args.entry_package = take_value(i, arg);
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.input_files.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  doculint::LintOptions options;
  options.verbose = args.verbose;
  options.entry_package = args.entry_package;

  doculint::OutputConfig output;
  doculint::LintResult result;

  if (args.use_project || args.input_files.empty()) {
    // Project mode: find doculint.yaml
    auto config_path = doculint::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << doculint::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = doculint::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      fmt::print(stderr, "Checking project: {}\n", config_result.config.project_root.string());
    }

    output = config_result.config.output;
    result = doculint::Linter::lint_project(config_result.config, options);
  } else {
    std::vector<fs::path> files(args.input_files.begin(), args.input_files.end());
    result = doculint::Linter::lint_files(files, options);
  }

  // Command line flags override doculint.yaml
  if (args.format) {
    const auto format = doculint::parse_output_format(*args.format);
    if (!format) {
      std::cerr << "error: invalid --format '" << *args.format << "' (must be text or json)\n";
      return 1;
    }
    output.format = *format;
  }
  if (args.color) {
    const auto color = doculint::parse_color_mode(*args.color);
    if (!color) {
      std::cerr << "error: invalid --color '" << *args.color
                << "' (must be auto, always or never)\n";
      return 1;
    }
    output.color = *color;
  }

  print_diagnostics(result, output);

  if (args.verbose) {
    fmt::print(
      stderr, "{} package(s) linted, {} diagnostic(s)\n", result.packages_linted,
      result.diagnostics.size());
  }

  return result.success ? 0 : 1;
}

int cmd_rules()
{
  for (const auto & rule : doculint::all_rules()) {
    fmt::print("{}  {}\n", rule.code, rule.summary);
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

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "rules") {
      return cmd_rules();
    }
  } catch (const std::exception & e) {
    std::cerr << "internal error: " << e.what() << "\n";
    return 2;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
