// doculint/test_support/load_helpers.hpp - helpers for unit/integration tests
//
// Load a package dump held in memory and optionally lint it, keeping the
// SourceRegistry and AstContext alive alongside the results.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "doculint/ast/ast_context.hpp"
#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/source_manager.hpp"
#include "doculint/lint/analyzer.hpp"
#include "doculint/syntax/package_loader.hpp"

namespace doculint::test_support
{

struct TestPackageUnit
{
  SourceRegistry sources;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  std::optional<Package> package;

  [[nodiscard]] const File * file(size_t index) const
  {
    return package && index < package->files.size() ? package->files[index] : nullptr;
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestPackageUnit load(
  std::string_view json_text, const std::filesystem::path & virtual_path = "<test>.json")
{
  TestPackageUnit out;
  out.ast = std::make_unique<AstContext>();
  out.package = load_package_json(out.sources, virtual_path, json_text, *out.ast, out.diags);
  return out;
}

/// Load and analyse; loader errors stay in `diags` and skip the analysis.
[[nodiscard]] inline TestPackageUnit lint(
  std::string_view json_text, const std::filesystem::path & virtual_path = "<test>.json")
{
  TestPackageUnit out = load(json_text, virtual_path);
  if (out.package) {
    analyze_package(*out.package, out.diags);
  }
  return out;
}

[[nodiscard]] inline std::vector<std::string> messages(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.message);
  }
  return out;
}

[[nodiscard]] inline bool has_message(const DiagnosticBag & diags, std::string_view message)
{
  return std::any_of(
    diags.begin(), diags.end(), [&](const Diagnostic & d) { return d.message == message; });
}

[[nodiscard]] inline const Diagnostic * find_code(
  const DiagnosticBag & diags, std::string_view code)
{
  const auto it =
    std::find_if(diags.begin(), diags.end(), [&](const Diagnostic & d) { return d.code == code; });
  return it == diags.end() ? nullptr : &*it;
}

}  // namespace doculint::test_support
