// doculint/lint/doc_auditor.cpp - Documentation convention checks over a Go AST
#include "doculint/lint/doc_auditor.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "doculint/basic/casting.hpp"
#include "doculint/lint/rules.hpp"

namespace doculint
{

namespace
{

using Base = ConstRecursiveAstVisitor<DocAuditor>;

std::string_view trim_space(std::string_view s)
{
  constexpr std::string_view k_space = " \t\n\v\f\r";
  const auto first = s.find_first_not_of(k_space);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(k_space);
  return s.substr(first, last - first + 1);
}

std::string join_names(gsl::span<Ident * const> names)
{
  std::vector<std::string_view> parts;
  parts.reserve(names.size());
  for (const auto * ident : names) {
    parts.push_back(ident->name);
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

}  // namespace

const CommentGroup * resolve_doc_comment(const Spec * spec, const GenDecl & group) noexcept
{
  if (!group.is_parenthesized()) {
    return group.doc;
  }
  if (const auto * vs = dyn_cast<ValueSpec>(spec)) {
    return vs->doc;
  }
  if (const auto * ts = dyn_cast<TypeSpec>(spec)) {
    return ts->doc;
  }
  if (const auto * is = dyn_cast<ImportSpec>(spec)) {
    return is->doc;
  }
  return nullptr;
}

bool doc_starts_with(const CommentGroup & doc, std::string_view prefix)
{
  const std::string text = doc.text();
  const std::string_view trimmed = trim_space(text);
  return trimmed.substr(0, prefix.size()) == prefix;
}

DocAuditor::DocAuditor(
  DiagnosticBag * diags, std::string packageName, bool isEntry, std::string packageScope)
: diags_(diags),
  packageName_(std::move(packageName)),
  isEntry_(isEntry),
  packageScope_(std::move(packageScope))
{
}

// ============================================================================
// Entry Points
// ============================================================================

void DocAuditor::audit_file(const File & file)
{
  currentFile_ = &file;
  if (!isEntry_) {
    check_package_doc(file);
  }
  visit(&file);
  currentFile_ = nullptr;
}

void DocAuditor::finalize()
{
  for (const auto & [name, hasNamedFile] : packageDocState_) {
    if (!hasNamedFile) {
      report_scoped(
        SourceRange{}, rule::k_package_file_missing,
        fmt::format(
          "package \"{}\" has no file with the same name containing package comment", name),
        packageScope_);
    }
  }
}

void DocAuditor::check_package_doc(const File & file)
{
  // try_emplace keeps an existing true entry
  auto & hasNamedFile = packageDocState_.try_emplace(packageName_, false).first->second;

  if (file.stem() != packageName_) {
    return;
  }
  hasNamedFile = true;

  const std::string scope(file.fileName);
  if (!file.doc) {
    report_scoped(
      SourceRange{}, rule::k_package_comment_missing,
      fmt::format(
        "package \"{}\" has no comment associated with it in \"{}.go\"", packageName_,
        packageName_),
      scope);
    return;
  }

  const std::string expected = fmt::format("Package {}", packageName_);
  if (!doc_starts_with(*file.doc, expected)) {
    report_scoped(
      SourceRange{}, rule::k_package_comment_prefix,
      fmt::format("comment for package \"{}\" should begin with \"{}\"", packageName_, expected),
      scope);
  }
}

// ============================================================================
// Visitor hooks
// ============================================================================

bool DocAuditor::visit_func_decl(const FuncDecl * decl)
{
  const std::string_view name = decl->name->name;
  const bool exempt = (isEntry_ && name == "main") || name == "init";

  if (!exempt) {
    if (!decl->doc) {
      report(
        decl->get_range(), rule::k_function_comment_missing,
        fmt::format("function \"{}\" has no comment associated with it", name));
    } else if (!doc_starts_with(*decl->doc, name)) {
      report(
        decl->get_range(), rule::k_function_comment_prefix,
        fmt::format("comment for function \"{}\" should begin with \"{}\"", name, name));
    }
  }

  return Base::visit_func_decl(decl);
}

bool DocAuditor::visit_if_stmt(const IfStmt * stmt)
{
  if (const auto * cond = dyn_cast<BinaryExpr>(stmt->cond)) {
    for (const Expr * operand : {cond->x, cond->y}) {
      if (const auto * lit = dyn_cast<BasicLit>(operand)) {
        report(lit->get_range(), rule::k_literal_in_conditional, "literal found in conditional");
      }
    }
  }

  return Base::visit_if_stmt(stmt);
}

bool DocAuditor::visit_gen_decl(const GenDecl * decl)
{
  if (decl->tok == DeclToken::Const) {
    check_const_decl(*decl);
  } else if (decl->tok == DeclToken::Type) {
    check_type_decl(*decl);
  }

  return Base::visit_gen_decl(decl);
}

void DocAuditor::check_const_decl(const GenDecl & decl)
{
  if (decl.is_parenthesized() && !decl.doc) {
    report(
      decl.get_range(), rule::k_const_block_comment_missing,
      "constant block has no comment associated with it");
  }

  for (const Spec * spec : decl.specs) {
    const auto * vs = dyn_cast<ValueSpec>(spec);
    if (!vs) {
      continue;
    }

    if (vs->names.empty()) {
      throw std::logic_error("constant specification without names");
    }

    if (vs->names.size() > 1) {
      report(
        vs->get_range(), rule::k_const_multiple_names,
        fmt::format(
          "constants \"{}\" should be separated and each have a comment associated with them",
          join_names(vs->names)));
      continue;
    }

    const std::string_view name = vs->names[0]->name;
    const CommentGroup * doc = resolve_doc_comment(vs, decl);
    if (!doc) {
      report(
        vs->get_range(), rule::k_const_comment_missing,
        fmt::format("constant \"{}\" has no comment associated with it", name));
      continue;
    }

    if (!doc_starts_with(*doc, name)) {
      report(
        vs->get_range(), rule::k_const_comment_prefix,
        fmt::format("comment for constant \"{}\" should begin with \"{}\"", name, name));
    }
  }
}

void DocAuditor::check_type_decl(const GenDecl & decl)
{
  if (decl.is_parenthesized() && !decl.doc) {
    report(
      decl.get_range(), rule::k_type_block_comment_missing,
      "type block has no comment associated with it");
  }

  for (const Spec * spec : decl.specs) {
    const auto * ts = dyn_cast<TypeSpec>(spec);
    if (!ts) {
      continue;
    }

    if (!ts->name) {
      throw std::logic_error("type specification without a name");
    }

    const std::string_view name = ts->name->name;
    const CommentGroup * doc = resolve_doc_comment(ts, decl);
    if (!doc) {
      report(
        ts->get_range(), rule::k_type_comment_missing,
        fmt::format("type \"{}\" has no comment associated with it", name));
      continue;
    }

    if (!doc_starts_with(*doc, name)) {
      report(
        ts->get_range(), rule::k_type_comment_prefix,
        fmt::format("comment for type \"{}\" should begin with \"{}\"", name, name));
    }
  }
}

// ============================================================================
// Reporting
// ============================================================================

void DocAuditor::report(SourceRange range, std::string_view code, std::string message)
{
  report_scoped(
    range, code, std::move(message),
    currentFile_ ? std::string(currentFile_->fileName) : packageScope_);
}

void DocAuditor::report_scoped(
  SourceRange range, std::string_view code, std::string message, std::string scope)
{
  ++reportCount_;
  if (!diags_) return;

  diags_->report_warning(range, std::move(message))
    .with_code(code)
    .with_scope(std::move(scope));
}

}  // namespace doculint
