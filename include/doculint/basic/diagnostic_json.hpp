// doculint/basic/diagnostic_json.hpp - Machine-readable diagnostic output
//
#pragma once

#include <nlohmann/json.hpp>

#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/source_manager.hpp"

namespace doculint
{

/**
 * One object per diagnostic:
 *   {"severity", "code", "message", "file", "line", "column", "offset"}
 *
 * `file` is the Go file for positioned findings and the scope otherwise;
 * `line`/`column` are null when unknown, `offset` is null without position.
 */
[[nodiscard]] nlohmann::json diagnostic_to_json(
  const Diagnostic & diag, const SourceRegistry & sources);

/// Array of diagnostic_to_json() in report order.
[[nodiscard]] nlohmann::json diagnostics_to_json(
  const DiagnosticBag & diags, const SourceRegistry & sources);

}  // namespace doculint
