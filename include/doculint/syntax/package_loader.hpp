// doculint/syntax/package_loader.hpp - Builds a Go package AST from its JSON dump
//
// Go sources are not parsed here: a package is supplied as a JSON document
// describing its files, doc comments and declarations with byte offsets.
// Loader errors are reported with codes L001-L004:
//
//   L001  the JSON document cannot be read
//   L002  the document is not valid JSON
//   L003  a required field is missing or has the wrong type, or a node kind
//         is unknown
//   L004  a const/var/type specification declares no name
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "doculint/ast/ast.hpp"
#include "doculint/ast/ast_context.hpp"
#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/source_manager.hpp"

namespace doculint
{

namespace loader_code
{

inline constexpr std::string_view k_read_failed = "L001";
inline constexpr std::string_view k_invalid_json = "L002";
inline constexpr std::string_view k_malformed_tree = "L003";
inline constexpr std::string_view k_unnamed_spec = "L004";

}  // namespace loader_code

/**
 * Build a package from JSON text.
 *
 * @param sources Registry receiving one entry per Go file of the package
 * @param json_path Path of the document; relative file paths and missing
 *                  `source` texts are resolved against its directory
 * @param json_text Document contents
 * @param ast Arena owning the nodes; must outlive the returned package
 * @param diags Receives loader errors
 * @return The package, or std::nullopt when an error was reported
 */
[[nodiscard]] std::optional<Package> load_package_json(
  SourceRegistry & sources, const std::filesystem::path & json_path, std::string_view json_text,
  AstContext & ast, DiagnosticBag & diags);

/// Read `json_path` and build the package it describes (L001 when unreadable).
[[nodiscard]] std::optional<Package> load_package_file(
  SourceRegistry & sources, const std::filesystem::path & json_path, AstContext & ast,
  DiagnosticBag & diags);

/// Read a whole file; std::nullopt when it cannot be opened.
[[nodiscard]] std::optional<std::string> read_text_file(const std::filesystem::path & path);

}  // namespace doculint
