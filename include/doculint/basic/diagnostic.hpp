// doculint/basic/diagnostic.hpp - Lint findings and the diagnostic sink
//
// Rule findings are warnings; loader and driver problems are errors. A finding
// either points at a node (`range`) or, for package- and file-level rules,
// only names its `scope`.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "doculint/basic/source_manager.hpp"

namespace doculint
{

enum class Severity : uint8_t {
  Error,    ///< Input or configuration problem; the unit could not be linted
  Warning,  ///< Documentation-convention violation
};

struct Diagnostic
{
  Severity severity = Severity::Warning;
  std::string code;  // "D006", "L002", empty for driver errors
  std::string message;

  /// Node the finding is about; SourceRange{} for package/file findings.
  SourceRange range;

  /// File path or package directory of a finding without a range.
  std::string scope;

  [[nodiscard]] bool has_position() const noexcept { return range.is_valid(); }
};

class DiagnosticBag;

/**
 * Fluent builder returned by DiagnosticBag::report_*; the diagnostic is
 * added to the bag when the builder goes out of scope.
 *
 *   diags.report_warning(range, msg).with_code("D006").with_scope(file);
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);
  DiagnosticBuilder & with_scope(std::string scope);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

/// Append-only sink. Not thread-safe; one bag per lint run.
class DiagnosticBag
{
public:
  DiagnosticBuilder report(Severity severity, SourceRange range, std::string message);
  DiagnosticBuilder report_error(SourceRange range, std::string message)
  {
    return report(Severity::Error, range, std::move(message));
  }
  DiagnosticBuilder report_warning(SourceRange range, std::string message)
  {
    return report(Severity::Warning, range, std::move(message));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }

  /// Number of diagnostics carrying the given rule code.
  [[nodiscard]] size_t count_code(std::string_view code) const;

  /// Findings ordered by file then offset; position-less ones first, in
  /// report order.
  [[nodiscard]] std::vector<Diagnostic> sorted_by_position() const;

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace doculint
