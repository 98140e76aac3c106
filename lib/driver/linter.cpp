// doculint/driver/linter.cpp - Lint driver implementation
//
#include "doculint/driver/linter.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <string>
#include <utility>

#include "doculint/ast/ast_context.hpp"
#include "doculint/lint/analyzer.hpp"
#include "doculint/syntax/package_loader.hpp"

namespace doculint
{

namespace fs = std::filesystem;

namespace
{

void lint_loaded(
  std::optional<Package> package, const AstContext & ast, const LintOptions & options,
  LintResult & result)
{
  if (!package) {
    return;
  }

  if (options.entry_package) {
    package->isEntry = package->name == *options.entry_package;
  }

  const size_t found = analyze_package(*package, result.diagnostics);
  ++result.packages_linted;

  if (options.verbose) {
    fmt::print(
      stderr, "Linted package {} ({} file(s), {} nodes{}): {} finding(s)\n", package->name,
      package->files.size(), ast.node_count(), package->isEntry ? ", entry" : "", found);
  }
}

}  // namespace

void Linter::lint_json(
  const fs::path & json_path, std::string_view json_text, const LintOptions & options,
  LintResult & result)
{
  // Nodes are only needed while the package is analysed.
  AstContext ast;
  lint_loaded(
    load_package_json(result.sources, json_path, json_text, ast, result.diagnostics), ast,
    options, result);
}

void Linter::lint_package_file(
  const fs::path & json_path, const LintOptions & options, LintResult & result)
{
  if (options.verbose) {
    fmt::print(stderr, "Loading {}\n", json_path.generic_string());
  }

  AstContext ast;
  lint_loaded(
    load_package_file(result.sources, json_path, ast, result.diagnostics), ast, options, result);
}

void Linter::finish(LintResult & result) { result.success = result.diagnostics.empty(); }

LintResult Linter::lint_files(
  const std::vector<fs::path> & package_files, const LintOptions & options)
{
  LintResult result;

  if (package_files.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no package files given");
  }

  for (const auto & path : package_files) {
    lint_package_file(path, options, result);
  }

  finish(result);
  return result;
}

LintResult Linter::lint_project(const ProjectConfig & config, const LintOptions & options)
{
  LintResult result;

  if (config.packages.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no packages defined in project configuration");
  }

  LintOptions effective = options;
  if (!effective.entry_package) {
    effective.entry_package = config.entry_package;
  }

  for (const auto & rel : config.packages) {
    const fs::path path = rel.is_absolute() ? rel : config.project_root / rel;
    lint_package_file(path, effective, result);
  }

  finish(result);
  return result;
}

}  // namespace doculint
