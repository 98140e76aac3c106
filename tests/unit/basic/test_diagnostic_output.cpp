// tests/unit/basic/test_diagnostic_output.cpp - text and JSON rendering of findings

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "doculint/basic/diagnostic.hpp"
#include "doculint/basic/diagnostic_json.hpp"
#include "doculint/basic/diagnostic_printer.hpp"
#include "doculint/basic/source_manager.hpp"

using namespace doculint;

namespace
{

constexpr const char * k_source = "package a\n\nfunc F() {}\n";

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(BasicDiagnosticOutput, PrintsPositionedFindingWithSnippet)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("a.go", k_source);
  DiagnosticBag diags;
  diags.report_warning(SourceRange(id, 16, 17), "exported function F should have comment")
    .with_code("D006");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_TRUE(contains(text, "warning[D006]: exported function F should have comment\n"));
  EXPECT_TRUE(contains(text, "  --> a.go:3:6\n"));
  EXPECT_TRUE(contains(text, " 3 | func F() {}\n"));
  EXPECT_TRUE(contains(text, "   |      ^\n"));
}

TEST(BasicDiagnosticOutput, PositionlessFindingShowsScope)
{
  SourceRegistry sources;
  DiagnosticBag diags;
  diags.report_warning(SourceRange{}, "package mypkg should have a file named mypkg.go")
    .with_code("D005")
    .with_scope("pkg/mypkg");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_TRUE(contains(text, "warning[D005]: package mypkg should have a file named mypkg.go\n"));
  EXPECT_TRUE(contains(text, "  --> pkg/mypkg\n"));
}

TEST(BasicDiagnosticOutput, OffsetOnlyWhenSourceTextMissing)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("b.go", "");
  DiagnosticBag diags;
  diags.report_warning(SourceRange(id, 42, 44), "literal in conditional").with_code("D008");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);
  EXPECT_TRUE(contains(out.str(), "  --> b.go@42\n"));
}

TEST(BasicDiagnosticOutput, SummaryCountsBySeverity)
{
  DiagnosticBag diags;
  diags.report_warning(SourceRange{}, "one");
  diags.report_warning(SourceRange{}, "two");
  diags.report_error(SourceRange{}, "three");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_summary(diags);
  EXPECT_EQ(out.str(), "doculint: 2 warnings, 1 error\n");

  std::ostringstream quiet;
  DiagnosticPrinter(quiet, false).print_summary(DiagnosticBag{});
  EXPECT_TRUE(quiet.str().empty());
}

TEST(BasicDiagnosticOutput, JsonCarriesPositionFields)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("a.go", k_source);
  DiagnosticBag diags;
  diags.report_warning(SourceRange(id, 16, 17), "exported function F should have comment")
    .with_code("D006");
  diags.report_warning(SourceRange{}, "package comment missing")
    .with_code("D003")
    .with_scope("pkg/a.go");

  const auto arr = diagnostics_to_json(diags, sources);
  ASSERT_TRUE(arr.is_array());
  ASSERT_EQ(arr.size(), 2U);

  const auto & positioned = arr[0];
  EXPECT_EQ(positioned["severity"], "warning");
  EXPECT_EQ(positioned["code"], "D006");
  EXPECT_EQ(positioned["file"], "a.go");
  EXPECT_EQ(positioned["line"], 3);
  EXPECT_EQ(positioned["column"], 6);
  EXPECT_EQ(positioned["offset"], 16);

  const auto & scoped = arr[1];
  EXPECT_EQ(scoped["code"], "D003");
  EXPECT_EQ(scoped["file"], "pkg/a.go");
  EXPECT_TRUE(scoped["line"].is_null());
  EXPECT_TRUE(scoped["offset"].is_null());
}
