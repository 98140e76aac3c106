// doculint/basic/diagnostic.cpp - DiagnosticBuilder and DiagnosticBag
#include "doculint/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace doculint
{

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  // A moved-from builder no longer owns the diagnostic
  if (bag_ != nullptr) {
    bag_->add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string_view code)
{
  diagnostic_.code = std::string(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_scope(std::string scope)
{
  diagnostic_.scope = std::move(scope);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(Severity severity, SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.range = range;
  return {*this, std::move(d)};
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

size_t DiagnosticBag::count_code(std::string_view code) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [code](const Diagnostic & d) { return d.code == code; }));
}

std::vector<Diagnostic> DiagnosticBag::sorted_by_position() const
{
  std::vector<Diagnostic> sorted = diagnostics_;
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.range.get_begin() < b.range.get_begin();
  });
  return sorted;
}

}  // namespace doculint
