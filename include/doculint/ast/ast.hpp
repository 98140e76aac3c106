// doculint/ast/ast.hpp - Go AST node class definitions
//
// A position-annotated subset of go/ast, following the LLVM/Clang style with
// classof() for RTTI support. Nodes live in an AstContext arena and refer to
// their children through raw pointers and gsl::span.
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "doculint/ast/ast_enums.hpp"
#include "doculint/basic/casting.hpp"
#include "doculint/basic/source_manager.hpp"

namespace doculint
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind (for classof-based RTTI) and the byte range it
 * covers. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base that implements classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// ValueSpec, TypeSpec or ImportSpec.
class Spec : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_spec_kind(node->kind); }

protected:
  explicit Spec(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Comments
// ============================================================================

/**
 * A sequence of comments with no other tokens and no empty lines between.
 *
 * `comments` holds the raw comment tokens, markers included
 * ("// Foo does x", "/* ... *\/").
 */
class CommentGroup : public NodeBase<CommentGroup, AstNode, NodeKind::CommentGroup>
{
public:
  gsl::span<std::string_view> comments;

  explicit CommentGroup(SourceRange r = {}) : NodeBase(r) {}

  CommentGroup(gsl::span<std::string_view> c, SourceRange r = {}) : NodeBase(r), comments(c) {}

  /**
   * The text of the comment group, as go/ast's CommentGroup.Text():
   * markers, the first space of line comments, directive lines and
   * leading/trailing blank lines are removed; runs of blank lines collapse
   * to one; every line ends with '\n'.
   */
  [[nodiscard]] std::string text() const;
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Identifier; also `true`, `false`, `nil` and `iota`.
class Ident : public NodeBase<Ident, Expr, NodeKind::Ident>
{
public:
  std::string_view name;

  explicit Ident(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Literal of basic type; `value` is the source text ("42", "\"x\"", "'a'").
class BasicLit : public NodeBase<BasicLit, Expr, NodeKind::BasicLit>
{
public:
  LiteralKind litKind;
  std::string_view value;

  BasicLit(LiteralKind k, std::string_view v, SourceRange r = {})
  : NodeBase(r), litKind(k), value(v)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * x;
  BinaryOp op;
  Expr * y;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), x(l), op(o), y(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * x;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), x(e) {}
};

class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::ParenExpr>
{
public:
  Expr * x;

  explicit ParenExpr(Expr * e, SourceRange r = {}) : NodeBase(r), x(e) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * fun;
  gsl::span<Expr *> args;

  explicit CallExpr(Expr * f, SourceRange r = {}) : NodeBase(r), fun(f) {}
};

/// x.sel
class SelectorExpr : public NodeBase<SelectorExpr, Expr, NodeKind::SelectorExpr>
{
public:
  Expr * x;
  Ident * sel;

  SelectorExpr(Expr * e, Ident * s, SourceRange r = {}) : NodeBase(r), x(e), sel(s) {}
};

/// x[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * x;
  Expr * index;

  IndexExpr(Expr * e, Expr * i, SourceRange r = {}) : NodeBase(r), x(e), index(i) {}
};

/// T{elts...}; `type` may be null for elided inner literals.
class CompositeLit : public NodeBase<CompositeLit, Expr, NodeKind::CompositeLit>
{
public:
  Expr * type = nullptr;
  gsl::span<Expr *> elts;

  explicit CompositeLit(SourceRange r = {}) : NodeBase(r) {}
};

class BlockStmt;

/// func(...) { body }
class FuncLit : public NodeBase<FuncLit, Expr, NodeKind::FuncLit>
{
public:
  BlockStmt * body;

  explicit FuncLit(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

/**
 * Any expression or type expression the supplier does not model in detail
 * (struct/interface/func/map types, slices, type assertions, ...).
 * Sub-expressions it contains are kept in `operands` so traversal still
 * reaches nested function literals.
 */
class OpaqueExpr : public NodeBase<OpaqueExpr, Expr, NodeKind::OpaqueExpr>
{
public:
  std::string_view label;  ///< go/ast type name, e.g. "StructType"
  gsl::span<Expr *> operands;

  explicit OpaqueExpr(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> list;

  explicit BlockStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * x;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), x(e) {}
};

class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  gsl::span<Expr *> lhs;
  AssignOp op;
  gsl::span<Expr *> rhs;

  explicit AssignStmt(AssignOp o, SourceRange r = {}) : NodeBase(r), op(o) {}
};

class IncDecStmt : public NodeBase<IncDecStmt, Stmt, NodeKind::IncDecStmt>
{
public:
  Expr * x;
  bool increment;

  IncDecStmt(Expr * e, bool inc, SourceRange r = {}) : NodeBase(r), x(e), increment(inc) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  gsl::span<Expr *> results;

  explicit ReturnStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// if init; cond { body } else elseStmt
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Stmt * init = nullptr;
  Expr * cond;
  BlockStmt * body;
  Stmt * elseStmt = nullptr;  ///< BlockStmt, IfStmt or null

  IfStmt(Expr * c, BlockStmt * b, SourceRange r = {}) : NodeBase(r), cond(c), body(b) {}
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Stmt * init = nullptr;
  Expr * cond = nullptr;
  Stmt * post = nullptr;
  BlockStmt * body;

  explicit ForStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class RangeStmt : public NodeBase<RangeStmt, Stmt, NodeKind::RangeStmt>
{
public:
  Expr * key = nullptr;
  Expr * value = nullptr;
  Expr * x;
  BlockStmt * body;

  RangeStmt(Expr * e, BlockStmt * b, SourceRange r = {}) : NodeBase(r), x(e), body(b) {}
};

/// Expression switch; type switches are supplied the same way with `tag` null.
class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Stmt * init = nullptr;
  Expr * tag = nullptr;
  BlockStmt * body;  ///< list of CaseClause

  explicit SwitchStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

/// case list...: body; an empty list is the default clause.
class CaseClause : public NodeBase<CaseClause, Stmt, NodeKind::CaseClause>
{
public:
  gsl::span<Expr *> list;
  gsl::span<Stmt *> body;

  explicit CaseClause(SourceRange r = {}) : NodeBase(r) {}
};

class GenDecl;

/// A const/type/var declaration inside a function body.
class DeclStmt : public NodeBase<DeclStmt, Stmt, NodeKind::DeclStmt>
{
public:
  GenDecl * decl;

  explicit DeclStmt(GenDecl * d, SourceRange r = {}) : NodeBase(r), decl(d) {}
};

/// label: stmt
class LabeledStmt : public NodeBase<LabeledStmt, Stmt, NodeKind::LabeledStmt>
{
public:
  Ident * label;
  Stmt * stmt;

  LabeledStmt(Ident * l, Stmt * s, SourceRange r = {}) : NodeBase(r), label(l), stmt(s) {}
};

/// break, continue, goto or fallthrough, with an optional label.
class BranchStmt : public NodeBase<BranchStmt, Stmt, NodeKind::BranchStmt>
{
public:
  BranchToken tok;
  Ident * label = nullptr;

  explicit BranchStmt(BranchToken t, SourceRange r = {}) : NodeBase(r), tok(t) {}
};

/// chan <- value
class SendStmt : public NodeBase<SendStmt, Stmt, NodeKind::SendStmt>
{
public:
  Expr * chan;
  Expr * value;

  SendStmt(Expr * c, Expr * v, SourceRange r = {}) : NodeBase(r), chan(c), value(v) {}
};

class SelectStmt : public NodeBase<SelectStmt, Stmt, NodeKind::SelectStmt>
{
public:
  BlockStmt * body;  ///< list of CommClause

  explicit SelectStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

/// case comm: body; a null comm is the default clause.
class CommClause : public NodeBase<CommClause, Stmt, NodeKind::CommClause>
{
public:
  Stmt * comm = nullptr;
  gsl::span<Stmt *> body;

  explicit CommClause(SourceRange r = {}) : NodeBase(r) {}
};

class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::EmptyStmt>
{
public:
  explicit EmptyStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// Placeholder the Go parser leaves for a statement with syntax errors.
class BadStmt : public NodeBase<BadStmt, Stmt, NodeKind::BadStmt>
{
public:
  explicit BadStmt(SourceRange r = {}) : NodeBase(r) {}
};

class GoStmt : public NodeBase<GoStmt, Stmt, NodeKind::GoStmt>
{
public:
  CallExpr * call;

  explicit GoStmt(CallExpr * c, SourceRange r = {}) : NodeBase(r), call(c) {}
};

class DeferStmt : public NodeBase<DeferStmt, Stmt, NodeKind::DeferStmt>
{
public:
  CallExpr * call;

  explicit DeferStmt(CallExpr * c, SourceRange r = {}) : NodeBase(r), call(c) {}
};

// ============================================================================
// Specification Nodes
// ============================================================================

/// const/var specification: names [type] [= values]
class ValueSpec : public NodeBase<ValueSpec, Spec, NodeKind::ValueSpec>
{
public:
  CommentGroup * doc = nullptr;
  gsl::span<Ident *> names;
  Expr * type = nullptr;
  gsl::span<Expr *> values;

  explicit ValueSpec(SourceRange r = {}) : NodeBase(r) {}
};

class TypeSpec : public NodeBase<TypeSpec, Spec, NodeKind::TypeSpec>
{
public:
  CommentGroup * doc = nullptr;
  Ident * name;
  Expr * type = nullptr;

  explicit TypeSpec(Ident * n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ImportSpec : public NodeBase<ImportSpec, Spec, NodeKind::ImportSpec>
{
public:
  CommentGroup * doc = nullptr;
  Ident * name = nullptr;  ///< local alias, may be null
  BasicLit * path;

  explicit ImportSpec(BasicLit * p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// Function or method declaration. `body` is null for external functions.
class FuncDecl : public NodeBase<FuncDecl, Decl, NodeKind::FuncDecl>
{
public:
  CommentGroup * doc = nullptr;
  Expr * recvType = nullptr;  ///< receiver type for methods, null for functions
  Ident * name;
  BlockStmt * body = nullptr;

  explicit FuncDecl(Ident * n, SourceRange r = {}) : NodeBase(r), name(n) {}

  [[nodiscard]] bool is_method() const noexcept { return recvType != nullptr; }
};

/**
 * import/const/type/var declaration.
 *
 * `lparen` is valid only for the parenthesized form `const ( ... )`; the doc
 * comment of a non-parenthesized declaration lives here rather than on its
 * single spec.
 */
class GenDecl : public NodeBase<GenDecl, Decl, NodeKind::GenDecl>
{
public:
  CommentGroup * doc = nullptr;
  DeclToken tok;
  SourceLocation lparen;
  gsl::span<Spec *> specs;

  explicit GenDecl(DeclToken t, SourceRange r = {}) : NodeBase(r), tok(t) {}

  [[nodiscard]] bool is_parenthesized() const noexcept { return lparen.is_valid(); }
};

// ============================================================================
// File (Root Node)
// ============================================================================

/**
 * One Go source file.
 *
 * `fileName` is the path as supplied ("pkg/mypkg.go"); `packageName` is the identifier
 * of the package clause; `doc` is the package doc comment, if any.
 */
class File : public NodeBase<File, AstNode, NodeKind::File>
{
public:
  std::string_view fileName;
  Ident * packageName;
  CommentGroup * doc = nullptr;
  gsl::span<Decl *> decls;

  File(std::string_view name, Ident * pkg, SourceRange r = {})
  : NodeBase(r), fileName(name), packageName(pkg)
  {
  }

  /// File name without directory and extension ("mypkg.go" -> "mypkg").
  [[nodiscard]] std::string_view stem() const noexcept
  {
    std::string_view s = fileName;
    if (const auto slash = s.find_last_of("/\\"); slash != std::string_view::npos) {
      s.remove_prefix(slash + 1);
    }
    if (const auto dot = s.rfind('.'); dot != std::string_view::npos && dot != 0) {
      s = s.substr(0, dot);
    }
    return s;
  }
};

// ============================================================================
// Package (compilation unit)
// ============================================================================

/**
 * All files of one Go package, analysed together.
 *
 * Not an AST node: it only groups arena-owned Files and is owned by whoever
 * loaded them.
 */
struct Package
{
  std::string name;
  bool isEntry = false;
  fs::path directory;
  std::vector<File *> files;
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace doculint
