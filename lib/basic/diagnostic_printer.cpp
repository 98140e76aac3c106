// doculint/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// fmt builds the text, rang adds the colors. With color off rang writes no
// escape codes, so the same code path serves both modes.
//
#include "doculint/basic/diagnostic_printer.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace doculint
{

namespace
{

constexpr uint32_t k_tab_width = 4;

/// Path as shown to the user: relative to the working directory when possible.
std::string display_path(const fs::path & path)
{
  if (path.is_absolute()) {
    std::error_code ec;
    const fs::path rel = fs::relative(path, fs::current_path(), ec);
    if (!ec && !rel.empty()) {
      return rel.generic_string();
    }
  }
  return path.generic_string();
}

/// Expand tabs so markers line up with the printed text.
std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/// Display width of the first `columns - 1` bytes of `line`.
size_t display_width(std::string_view line, uint32_t columns)
{
  const std::string_view prefix = line.substr(0, columns > 0 ? columns - 1 : 0);
  return expand_tabs(prefix).size();
}

}  // namespace

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color) : os_(os)
{
  rang::setControlMode(use_color ? rang::control::Force : rang::control::Off);
}

std::string DiagnosticPrinter::location_text(
  const Diagnostic & diag, const SourceRegistry & sources)
{
  if (!diag.has_position()) {
    return diag.scope.empty() ? std::string("<package>") : diag.scope;
  }

  const std::string file = display_path(sources.get_path(diag.range.file_id()));
  const LineColumn lc = sources.get_line_column(diag.range.get_begin());
  if (lc.is_valid()) {
    return fmt::format("{}:{}:{}", file, lc.line, lc.column);
  }
  return fmt::format("{}@{}", file, diag.range.get_begin().offset());
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag);

  os_ << rang::style::bold << rang::fg::cyan << "  -->" << rang::style::reset
      << rang::fg::reset;
  fmt::print(os_, " {}\n", location_text(diag, sources));

  if (diag.has_position()) {
    const SourceFile * file = sources.get_file(diag.range.file_id());
    const FullSourceRange range = sources.get_full_range(diag.range);
    if (file != nullptr && range.is_valid()) {
      print_snippet(*file, range);
    }
  }

  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  for (const auto & d : diags.sorted_by_position()) {
    print(d, sources);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t warnings = diags.count(Severity::Warning);
  const size_t errors = diags.count(Severity::Error);
  if (warnings == 0 && errors == 0) {
    return;
  }

  std::string text;
  if (warnings > 0) {
    text = fmt::format("{} warning{}", warnings, warnings == 1 ? "" : "s");
  }
  if (errors > 0) {
    text += fmt::format("{}{} error{}", text.empty() ? "" : ", ", errors, errors == 1 ? "" : "s");
  }

  os_ << rang::style::bold;
  fmt::print(os_, "doculint: {}", text);
  os_ << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  os_ << rang::style::bold
      << (diag.severity == Severity::Error ? rang::fg::red : rang::fg::yellow)
      << to_string(diag.severity);
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_snippet(const SourceFile & file, const FullSourceRange & range)
{
  const std::string_view line = file.get_line(range.start_line - 1);
  if (line.empty()) {
    return;
  }

  // Multi-line nodes are marked up to the end of their first line
  const uint32_t last_column = range.end_line == range.start_line
                                 ? range.end_column
                                 : static_cast<uint32_t>(line.size()) + 1;
  const size_t indent = display_width(line, range.start_column);
  const size_t end = std::max(display_width(line, last_column), indent + 1);
  const size_t width = end - indent;

  const std::string number = std::to_string(range.start_line);
  const std::string blank(number.size(), ' ');

  os_ << rang::fg::cyan << rang::style::bold;
  fmt::print(os_, " {} |\n {} | ", blank, number);
  os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, "{}\n", expand_tabs(line));

  os_ << rang::fg::cyan << rang::style::bold;
  fmt::print(os_, " {} | ", blank);
  os_ << rang::fg::yellow;
  fmt::print(os_, "{}{}", std::string(indent, ' '), std::string(width, '^'));
  os_ << rang::style::reset << rang::fg::reset << "\n";
}

}  // namespace doculint
