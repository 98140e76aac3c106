// doculint/basic/diagnostic_printer.hpp - Human-readable lint output
//
// Prints findings with their location and, when the Go file text is known,
// the source line with a marker under the node.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/source_manager.hpp"

namespace doculint
{

/**
 * Prints diagnostics in Rust-style format:
 *
 *   warning[D006]: function "Run" has no comment associated with it
 *     --> worker/run.go:12:1
 *      |
 *   12 | func Run(ctx context.Context) error {
 *      | ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^
 *
 * Package- and file-scoped findings have no position and print their scope
 * (package directory or file path) in place of the location.
 */
class DiagnosticPrinter
{
public:
  /// Colors go through rang; `use_color` forces them on or off.
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics ordered by file and position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// "doculint: N warnings, M errors"; nothing when the bag is empty.
  void print_summary(const DiagnosticBag & diags);

  /// "file:line:col", "file@offset" without file text, or the scope.
  [[nodiscard]] static std::string location_text(
    const Diagnostic & diag, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const SourceFile & file, const FullSourceRange & range);

  std::ostream & os_;
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

}  // namespace doculint
