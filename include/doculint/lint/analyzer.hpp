// doculint/lint/analyzer.hpp - Runs every doculint check over one package
//
#pragma once

#include <cstddef>
#include <string>

#include "doculint/ast/ast.hpp"
#include "doculint/basic/diagnostic.hpp"

namespace doculint
{

/**
 * Lint one package.
 *
 * Checks the package identifier, audits every file and finalizes the
 * package-wide checks. Findings are appended to `diags` as warnings.
 *
 * @return Number of findings reported
 * @throws std::logic_error when the tree violates the AST contract
 *         (a constant or type specification without names)
 */
size_t analyze_package(const Package & package, DiagnosticBag & diags);

/// Printed location of package-scoped findings: the directory, else the name.
[[nodiscard]] std::string package_scope(const Package & package);

}  // namespace doculint
