// tests/unit/lint/test_doc_auditor.cpp - Documentation convention checks

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "doculint/ast/ast_context.hpp"
#include "doculint/lint/doc_auditor.hpp"
#include "doculint/lint/rules.hpp"
#include "doculint/test_support/go_json.hpp"
#include "doculint/test_support/load_helpers.hpp"

using namespace doculint;
using namespace doculint::test_support;

namespace
{

/// Package "mypkg" with a documented mypkg.go plus one extra file.
TestPackageUnit lint_in_file(std::vector<go::json> decls)
{
  const auto doc = go::comment({"// Package mypkg does things."});
  const auto j = go::package(
    "mypkg", {go::file("mypkg.go", {}, doc), go::file("extra.go", std::move(decls))});
  return lint(j.dump());
}

}  // namespace

// ============================================================================
// Functions
// ============================================================================

TEST(LintDocAuditor, DocumentedFunctionIsClean)
{
  const auto unit = lint_in_file({go::func("Run", go::comment({"// Run starts the worker."}))});
  ASSERT_TRUE(unit.package.has_value());
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(messages(unit.diags));
}

TEST(LintDocAuditor, UndocumentedFunction)
{
  const auto unit = lint_in_file({go::func("Run")});
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = *unit.diags.begin();
  EXPECT_EQ(d.message, "function \"Run\" has no comment associated with it");
  EXPECT_EQ(d.code, rule::k_function_comment_missing);
  EXPECT_EQ(d.severity, Severity::Warning);
}

TEST(LintDocAuditor, FunctionCommentWithWrongPrefix)
{
  const auto unit = lint_in_file({go::func("Run", go::comment({"// Starts the worker."}))});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(
    unit.diags.begin()->message, "comment for function \"Run\" should begin with \"Run\"");
  EXPECT_EQ(unit.diags.begin()->code, rule::k_function_comment_prefix);
}

TEST(LintDocAuditor, FunctionPrefixCheckIsCaseSensitive)
{
  const auto unit = lint_in_file({go::func("Run", go::comment({"// run starts."}))});
  EXPECT_EQ(unit.diags.count_code(rule::k_function_comment_prefix), 1U);
}

TEST(LintDocAuditor, MethodsAreCheckedLikeFunctions)
{
  const auto unit = lint_in_file({go::method("Worker", "Stop")});
  EXPECT_TRUE(has_message(unit.diags, "function \"Stop\" has no comment associated with it"));
}

TEST(LintDocAuditor, InitIsAlwaysExempt)
{
  const auto unit = lint_in_file({go::func("init")});
  EXPECT_TRUE(unit.diags.empty());
}

TEST(LintDocAuditor, MainIsExemptOnlyInEntryPackage)
{
  const auto lib = lint_in_file({go::func("main")});
  EXPECT_TRUE(has_message(lib.diags, "function \"main\" has no comment associated with it"));

  const auto j = go::package("main", {go::file("main.go", {go::func("main")})});
  const auto entry = lint(j.dump());
  ASSERT_TRUE(entry.package.has_value());
  EXPECT_TRUE(entry.package->isEntry);
  EXPECT_TRUE(entry.diags.empty()) << ::testing::PrintToString(messages(entry.diags));
}

TEST(LintDocAuditor, ExemptFunctionBodyIsStillWalked)
{
  const auto body = go::block({go::if_stmt(go::binary(go::ident("x"), "==", go::int_lit("5")))});
  const auto unit = lint_in_file({go::func("init", nullptr, body)});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.begin()->message, "literal found in conditional");
}

// ============================================================================
// Conditionals
// ============================================================================

TEST(LintDocAuditor, LiteralOperandInCondition)
{
  auto cond = go::binary(go::ident("x"), "==", go::at(go::int_lit("5"), 40, 41));
  const auto body = go::block({go::if_stmt(std::move(cond))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = *unit.diags.begin();
  EXPECT_EQ(d.message, "literal found in conditional");
  EXPECT_EQ(d.code, rule::k_literal_in_conditional);
  EXPECT_EQ(d.range.get_begin().offset(), 40U);
}

TEST(LintDocAuditor, IdentifierOperandsAreNotFlagged)
{
  const auto body = go::block({
    go::if_stmt(go::binary(go::ident("x"), "==", go::ident("y"))),
    go::if_stmt(go::binary(go::ident("err"), "!=", go::ident("nil"))),
    go::if_stmt(go::binary(go::ident("ok"), "==", go::ident("true"))),
  });
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_TRUE(unit.diags.empty());
}

TEST(LintDocAuditor, BothLiteralOperandsAreFlagged)
{
  const auto body =
    go::block({go::if_stmt(go::binary(go::lit("STRING", "\"a\""), "==", go::lit("CHAR", "'b'")))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_EQ(unit.diags.count_code(rule::k_literal_in_conditional), 2U);
}

TEST(LintDocAuditor, NestedLiteralsAreNotFlagged)
{
  // if x+1 > y && (z == 3) { }
  const auto sum = go::binary(go::ident("x"), "+", go::int_lit("1"));
  const auto lhs = go::binary(sum, ">", go::ident("y"));
  const auto rhs =
    go::json{{"kind", "ParenExpr"}, {"x", go::binary(go::ident("z"), "==", go::int_lit("3"))}};
  const auto body = go::block({go::if_stmt(go::binary(lhs, "&&", rhs))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(messages(unit.diags));
}

TEST(LintDocAuditor, NonBinaryConditionIsIgnored)
{
  const auto body = go::block({go::if_stmt(go::call(go::ident("ready")))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_TRUE(unit.diags.empty());
}

TEST(LintDocAuditor, ElseIfConditionIsChecked)
{
  const auto else_if = go::if_stmt(go::binary(go::ident("x"), "<", go::lit("FLOAT", "2.5")));
  const auto cond = go::binary(go::ident("x"), "==", go::ident("y"));
  const auto body = go::block({go::if_stmt(cond, go::block(), else_if)});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_EQ(unit.diags.count_code(rule::k_literal_in_conditional), 1U);
}

TEST(LintDocAuditor, ConditionInsideLabeledLoopIsChecked)
{
  // outer: for { if x == 5 { continue outer } }
  const auto cond = go::binary(go::ident("x"), "==", go::int_lit("5"));
  const auto check = go::if_stmt(cond, go::block({go::branch("continue", "outer")}));
  const auto body = go::block({go::labeled("outer", go::for_stmt(go::block({check})))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_EQ(unit.diags.count_code(rule::k_literal_in_conditional), 1U);
  EXPECT_EQ(unit.diags.count_code(loader_code::k_malformed_tree), 0U);
}

TEST(LintDocAuditor, ConditionInsideSelectCaseIsChecked)
{
  // select { case ch <- x: if x == 5 {}; default: if y > 1 {} }
  const auto sent = go::comm_clause(
    go::send_stmt(go::ident("ch"), go::ident("x")),
    {go::if_stmt(go::binary(go::ident("x"), "==", go::int_lit("5")))});
  const auto fallback =
    go::comm_clause(nullptr, {go::if_stmt(go::binary(go::ident("y"), ">", go::int_lit("1")))});
  const auto body = go::block({go::select_stmt({sent, fallback})});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  EXPECT_EQ(unit.diags.count_code(rule::k_literal_in_conditional), 2U);
  EXPECT_EQ(unit.diags.count_code(loader_code::k_malformed_tree), 0U);
}

TEST(LintDocAuditor, BreakInsideLoopDoesNotStopTheAudit)
{
  // for { if x == 5 { break } }
  const auto cond = go::binary(go::ident("x"), "==", go::int_lit("5"));
  const auto check = go::if_stmt(cond, go::block({go::branch("break")}));
  const auto body = go::block({go::for_stmt(go::block({check, go::empty_stmt()}))});
  const auto unit = lint_in_file({go::func("Check", go::comment({"// Check checks."}), body)});
  ASSERT_EQ(unit.diags.size(), 1U) << ::testing::PrintToString(messages(unit.diags));
  EXPECT_EQ(unit.diags.begin()->code, rule::k_literal_in_conditional);
}

// ============================================================================
// Constants
// ============================================================================

TEST(LintDocAuditor, SingleConstantTakesDocFromDeclaration)
{
  const auto ok = lint_in_file(
    {go::gen_decl("const", {go::value_spec({"Max"})}, false, go::comment({"// Max is big."}))});
  EXPECT_TRUE(ok.diags.empty());

  const auto missing = lint_in_file({go::gen_decl("const", {go::value_spec({"Max"})}, false)});
  ASSERT_EQ(missing.diags.size(), 1U);
  EXPECT_EQ(missing.diags.begin()->message, "constant \"Max\" has no comment associated with it");
}

TEST(LintDocAuditor, ConstantCommentWithWrongPrefix)
{
  const auto unit = lint_in_file(
    {go::gen_decl("const", {go::value_spec({"Max"})}, false, go::comment({"// The max."}))});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(
    unit.diags.begin()->message, "comment for constant \"Max\" should begin with \"Max\"");
}

TEST(LintDocAuditor, ConstantBlockNeedsItsOwnComment)
{
  const auto unit = lint_in_file({go::gen_decl(
    "const", {go::value_spec({"A"}, go::comment({"// A is a."})),
              go::value_spec({"B"}, go::comment({"// B is b."}))},
    true)});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.begin()->message, "constant block has no comment associated with it");
  EXPECT_EQ(unit.diags.begin()->code, rule::k_const_block_comment_missing);
}

TEST(LintDocAuditor, BlockCommentDoesNotDocumentItsConstants)
{
  const auto unit = lint_in_file({go::gen_decl(
    "const", {go::value_spec({"A"})}, true, go::comment({"// A is documented here."}))});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.begin()->message, "constant \"A\" has no comment associated with it");
}

TEST(LintDocAuditor, MultiNameConstantSpec)
{
  const auto unit = lint_in_file({go::gen_decl(
    "const", {go::value_spec({"A", "B"})}, true, go::comment({"// Limits."}))});
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(
    unit.diags.begin()->message,
    "constants \"A, B\" should be separated and each have a comment associated with them");
  EXPECT_EQ(unit.diags.count_code(rule::k_const_comment_missing), 0U);
}

TEST(LintDocAuditor, VariablesAreNotChecked)
{
  const auto unit = lint_in_file({go::gen_decl("var", {go::value_spec({"x", "y"})}, false)});
  EXPECT_TRUE(unit.diags.empty());
}

TEST(LintDocAuditor, ConstantsInsideFunctionBodiesAreChecked)
{
  const auto decl_stmt =
    go::json{{"kind", "DeclStmt"}, {"decl", go::gen_decl("const", {go::value_spec({"n"})}, false)}};
  const auto unit =
    lint_in_file({go::func("Check", go::comment({"// Check checks."}), go::block({decl_stmt}))});
  EXPECT_TRUE(has_message(unit.diags, "constant \"n\" has no comment associated with it"));
}

// ============================================================================
// Types
// ============================================================================

TEST(LintDocAuditor, TypeRules)
{
  const auto ok = lint_in_file(
    {go::gen_decl("type", {go::type_spec("Worker")}, false, go::comment({"// Worker works."}))});
  EXPECT_TRUE(ok.diags.empty());

  const auto missing = lint_in_file({go::gen_decl("type", {go::type_spec("Worker")}, false)});
  EXPECT_TRUE(has_message(missing.diags, "type \"Worker\" has no comment associated with it"));

  const auto prefix = lint_in_file(
    {go::gen_decl("type", {go::type_spec("Worker")}, false, go::comment({"// A worker."}))});
  EXPECT_TRUE(
    has_message(prefix.diags, "comment for type \"Worker\" should begin with \"Worker\""));
}

TEST(LintDocAuditor, TypeBlock)
{
  const auto unit = lint_in_file({go::gen_decl(
    "type", {go::type_spec("A", go::comment({"// A is a."})), go::type_spec("B")}, true)});
  EXPECT_EQ(unit.diags.size(), 2U);
  EXPECT_TRUE(has_message(unit.diags, "type block has no comment associated with it"));
  EXPECT_TRUE(has_message(unit.diags, "type \"B\" has no comment associated with it"));
}

// ============================================================================
// Package documentation
// ============================================================================

TEST(LintDocAuditor, PackageFileWithoutComment)
{
  const auto j = go::package("mypkg", {go::file("mypkg.go"), go::file("helpers.go")});
  const auto unit = lint(j.dump());

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = *unit.diags.begin();
  EXPECT_EQ(d.message, "package \"mypkg\" has no comment associated with it in \"mypkg.go\"");
  EXPECT_EQ(d.code, rule::k_package_comment_missing);
  EXPECT_FALSE(d.has_position());
  EXPECT_EQ(d.scope, "mypkg.go");
}

TEST(LintDocAuditor, PackageCommentWithWrongPrefix)
{
  const auto j = go::package(
    "mypkg", {go::file("mypkg.go", {}, go::comment({"// This package does things."}))});
  const auto unit = lint(j.dump());
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(
    unit.diags.begin()->message,
    "comment for package \"mypkg\" should begin with \"Package mypkg\"");
}

TEST(LintDocAuditor, PackageWithoutSameNameFileReportedOnce)
{
  const auto j = go::package("mypkg", {go::file("a.go"), go::file("b.go"), go::file("c.go")});
  const auto unit = lint(j.dump());
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = *unit.diags.begin();
  EXPECT_EQ(
    d.message, "package \"mypkg\" has no file with the same name containing package comment");
  EXPECT_EQ(d.code, rule::k_package_file_missing);
  EXPECT_FALSE(d.has_position());
}

TEST(LintDocAuditor, SameNameFileMatchesIgnoringDirectoryAndExtension)
{
  const auto j = go::package(
    "mypkg",
    {go::file("internal/mypkg/mypkg.go", {}, go::comment({"// Package mypkg is fine."}))});
  const auto unit = lint(j.dump());
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(messages(unit.diags));
}

TEST(LintDocAuditor, EntryPackageNeedsNoPackageComment)
{
  const auto j = go::package("main", {go::file("server.go")});
  const auto unit = lint(j.dump());
  EXPECT_TRUE(unit.diags.empty());
}

TEST(LintDocAuditor, PackageNamingViolationIsPackageScoped)
{
  const auto j = go::package(
    "my_pkg", {go::file("my_pkg.go", {}, go::comment({"// Package my_pkg does things."}))});
  const auto unit = lint(j.dump());
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.begin()->code, rule::k_package_separator);
  EXPECT_FALSE(unit.diags.begin()->has_position());
}

// ============================================================================
// Auditor state
// ============================================================================

TEST(LintDocAuditor, PackageStateTracksSameNameFile)
{
  AstContext ctx;
  auto * pkg_ident = ctx.create<Ident>("mypkg");
  auto * helpers = ctx.create<File>("helpers.go", pkg_ident);
  auto * named = ctx.create<File>("mypkg.go", pkg_ident);

  DocAuditor auditor(nullptr, "mypkg", false);
  auditor.audit_file(*helpers);
  ASSERT_EQ(auditor.package_doc_state().count("mypkg"), 1U);
  EXPECT_FALSE(auditor.package_doc_state().at("mypkg"));

  auditor.audit_file(*named);
  auditor.audit_file(*helpers);
  EXPECT_TRUE(auditor.package_doc_state().at("mypkg"));

  // Only the missing package comment of mypkg.go was counted.
  auditor.finalize();
  EXPECT_EQ(auditor.report_count(), 1U);
}

TEST(LintDocAuditor, EntryPackageKeepsNoState)
{
  AstContext ctx;
  auto * file = ctx.create<File>("main.go", ctx.create<Ident>("main"));

  DocAuditor auditor(nullptr, "main", true);
  auditor.audit_file(*file);
  auditor.finalize();
  EXPECT_TRUE(auditor.package_doc_state().empty());
  EXPECT_EQ(auditor.report_count(), 0U);
}

TEST(LintDocAuditor, UnnamedConstantSpecIsContractViolation)
{
  AstContext ctx;
  auto * spec = ctx.create<ValueSpec>();
  auto * decl = ctx.create<GenDecl>(DeclToken::Const);
  decl->specs = ctx.copy_to_arena(std::vector<Spec *>{spec});
  auto * file = ctx.create<File>("a.go", ctx.create<Ident>("main"));
  file->decls = ctx.copy_to_arena(std::vector<Decl *>{decl});

  DiagnosticBag diags;
  DocAuditor auditor(&diags, "main", true);
  EXPECT_THROW(auditor.audit_file(*file), std::logic_error);
}

TEST(LintDocAuditor, ResolveDocCommentFollowsDeclarationShape)
{
  AstContext ctx;
  auto * group_doc = ctx.create<CommentGroup>();
  auto * spec_doc = ctx.create<CommentGroup>();
  auto * spec = ctx.create<ValueSpec>();
  spec->doc = spec_doc;

  GenDecl * single = ctx.create<GenDecl>(DeclToken::Const);
  single->doc = group_doc;
  EXPECT_EQ(resolve_doc_comment(spec, *single), group_doc);

  GenDecl * block = ctx.create<GenDecl>(DeclToken::Const);
  block->doc = group_doc;
  block->lparen = SourceLocation(FileId{0}, 6);
  EXPECT_EQ(resolve_doc_comment(spec, *block), spec_doc);
}
