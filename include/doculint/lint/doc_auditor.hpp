// doculint/lint/doc_auditor.hpp - Documentation convention checks over a Go AST
//
// One DocAuditor audits one package: audit_file() for every file, then
// finalize() once. Findings are reported as warnings into a DiagnosticBag.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include "doculint/ast/ast.hpp"
#include "doculint/ast/visitor.hpp"
#include "doculint/basic/diagnostic.hpp"

namespace doculint
{

/**
 * Doc comment governing a const/type specification.
 *
 * Inside a parenthesized block each spec carries its own doc comment; a
 * single non-parenthesized declaration keeps it on the GenDecl.
 */
[[nodiscard]] const CommentGroup * resolve_doc_comment(
  const Spec * spec, const GenDecl & group) noexcept;

/// True when the trimmed text of `doc` starts with `prefix`.
[[nodiscard]] bool doc_starts_with(const CommentGroup & doc, std::string_view prefix);

/**
 * Package, function, constant, type and conditional-literal checks.
 *
 * Per-file checks run from audit_file(); the "no file named after the
 * package" check needs every file of the package and runs from finalize().
 */
class DocAuditor : public ConstRecursiveAstVisitor<DocAuditor>
{
public:
  /**
   * @param diags Sink for findings (may be null to only count them)
   * @param packageName Package identifier shared by all audited files
   * @param isEntry Entry packages need no package comment and may have an
   *                undocumented `main`
   * @param packageScope Printed location of package-scoped findings
   */
  DocAuditor(
    DiagnosticBag * diags, std::string packageName, bool isEntry, std::string packageScope = "");

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  void audit_file(const File & file);

  /// Report packages that never saw a file named after them.
  void finalize();

  // ===========================================================================
  // Visitor hooks
  // ===========================================================================

  bool visit_func_decl(const FuncDecl * decl);
  bool visit_if_stmt(const IfStmt * stmt);
  bool visit_gen_decl(const GenDecl * decl);

  [[nodiscard]] size_t report_count() const noexcept { return reportCount_; }

  /// package identifier -> a file named after the package was seen
  [[nodiscard]] const std::unordered_map<std::string, bool> & package_doc_state() const noexcept
  {
    return packageDocState_;
  }

private:
  void check_package_doc(const File & file);
  void check_const_decl(const GenDecl & decl);
  void check_type_decl(const GenDecl & decl);

  void report(SourceRange range, std::string_view code, std::string message);
  void report_scoped(
    SourceRange range, std::string_view code, std::string message, std::string scope);

  DiagnosticBag * diags_ = nullptr;
  std::string packageName_;
  bool isEntry_ = false;
  std::string packageScope_;
  const File * currentFile_ = nullptr;
  std::unordered_map<std::string, bool> packageDocState_;
  size_t reportCount_ = 0;
};

}  // namespace doculint
