// doculint/driver/linter.hpp - Lint driver
//
// Single entry point for the lint pipeline: load package dumps, run the
// analyzer over each, collect diagnostics. Used by the CLI and the tests.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/source_manager.hpp"
#include "doculint/project/project_config.hpp"

namespace doculint
{

// ============================================================================
// Lint Options
// ============================================================================

struct LintOptions
{
  /// When set, a package is the entry package iff its name equals this
  /// (overrides the "entry" flag of the package dump).
  std::optional<std::string> entry_package;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Lint Result
// ============================================================================

struct LintResult
{
  /// No diagnostics of any severity
  bool success = false;

  /// Loader errors and lint findings
  DiagnosticBag diagnostics;

  /// Go files of every loaded package (for printing locations)
  SourceRegistry sources;

  /// Packages that loaded and were analysed
  size_t packages_linted = 0;
};

// ============================================================================
// Linter
// ============================================================================

class Linter
{
public:
  /**
   * Lint package dumps given on the command line.
   *
   * @throws std::logic_error when a loaded tree violates the AST contract
   */
  [[nodiscard]] static LintResult lint_files(
    const std::vector<std::filesystem::path> & package_files, const LintOptions & options);

  /**
   * Lint every package listed in a project configuration.
   *
   * The configured entry_package applies unless options override it.
   */
  [[nodiscard]] static LintResult lint_project(
    const ProjectConfig & config, const LintOptions & options);

  /// Lint one package given as JSON text (nothing is read from disk but Go
  /// sources referenced without an inline "source").
  static void lint_json(
    const std::filesystem::path & json_path, std::string_view json_text,
    const LintOptions & options, LintResult & result);

private:
  static void lint_package_file(
    const std::filesystem::path & json_path, const LintOptions & options, LintResult & result);

  static void finish(LintResult & result);
};

}  // namespace doculint
