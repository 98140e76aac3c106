// doculint/ast/ast_enums.hpp - Go AST enumeration definitions
//
// Node kinds, operators, literal kinds and declaration tokens.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace doculint
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; kinds of one category are contiguous.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"

// === Specifications ===
#define AST_NODE_SPEC(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "doculint/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/// Go binary operators (go/token precedence levels 1-5).
enum class BinaryOp : uint8_t {
  // Logical
  LogicalOr,   ///< ||
  LogicalAnd,  ///< &&
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Additive
  Add,  ///< +
  Sub,  ///< -
  Or,   ///< |
  Xor,  ///< ^
  // Multiplicative
  Mul,     ///< *
  Quo,     ///< /
  Rem,     ///< %
  Shl,     ///< <<
  Shr,     ///< >>
  And,     ///< &
  AndNot,  ///< &^
};

/// Go unary operators.
enum class UnaryOp : uint8_t {
  Plus,   ///< +
  Neg,    ///< -
  Not,    ///< !
  Xor,    ///< ^
  Deref,  ///< *
  Addr,   ///< &
  Arrow,  ///< <-
};

/// Go assignment operators.
enum class AssignOp : uint8_t {
  Assign,        ///< =
  Define,        ///< :=
  AddAssign,     ///< +=
  SubAssign,     ///< -=
  MulAssign,     ///< *=
  QuoAssign,     ///< /=
  RemAssign,     ///< %=
  AndAssign,     ///< &=
  OrAssign,      ///< |=
  XorAssign,     ///< ^=
  ShlAssign,     ///< <<=
  ShrAssign,     ///< >>=
  AndNotAssign,  ///< &^=
};

/// Kind of a BasicLit (go/token INT, FLOAT, IMAG, CHAR, STRING).
enum class LiteralKind : uint8_t { Int, Float, Imag, Char, String };

/// Keyword introducing a GenDecl.
enum class DeclToken : uint8_t { Import, Const, Type, Var };

/// Keyword of a BranchStmt.
enum class BranchToken : uint8_t { Break, Continue, Goto, Fallthrough };

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::LogicalOr:
      return "||";
    case BinaryOp::LogicalAnd:
      return "&&";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Or:
      return "|";
    case BinaryOp::Xor:
      return "^";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Quo:
      return "/";
    case BinaryOp::Rem:
      return "%";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::And:
      return "&";
    case BinaryOp::AndNot:
      return "&^";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Xor:
      return "^";
    case UnaryOp::Deref:
      return "*";
    case UnaryOp::Addr:
      return "&";
    case UnaryOp::Arrow:
      return "<-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::Define:
      return ":=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::QuoAssign:
      return "/=";
    case AssignOp::RemAssign:
      return "%=";
    case AssignOp::AndAssign:
      return "&=";
    case AssignOp::OrAssign:
      return "|=";
    case AssignOp::XorAssign:
      return "^=";
    case AssignOp::ShlAssign:
      return "<<=";
    case AssignOp::ShrAssign:
      return ">>=";
    case AssignOp::AndNotAssign:
      return "&^=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(LiteralKind kind) noexcept
{
  switch (kind) {
    case LiteralKind::Int:
      return "INT";
    case LiteralKind::Float:
      return "FLOAT";
    case LiteralKind::Imag:
      return "IMAG";
    case LiteralKind::Char:
      return "CHAR";
    case LiteralKind::String:
      return "STRING";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DeclToken tok) noexcept
{
  switch (tok) {
    case DeclToken::Import:
      return "import";
    case DeclToken::Const:
      return "const";
    case DeclToken::Type:
      return "type";
    case DeclToken::Var:
      return "var";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BranchToken tok) noexcept
{
  switch (tok) {
    case BranchToken::Break:
      return "break";
    case BranchToken::Continue:
      return "continue";
    case BranchToken::Goto:
      return "goto";
    case BranchToken::Fallthrough:
      return "fallthrough";
  }
  return "";
}

/// True for ==, !=, <, <=, >, >=.
[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Eq && op <= BinaryOp::Ge;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Ident;
inline constexpr NodeKind k_last_expr_kind = NodeKind::OpaqueExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::BlockStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::DeferStmt;

inline constexpr NodeKind k_first_spec_kind = NodeKind::ValueSpec;
inline constexpr NodeKind k_last_spec_kind = NodeKind::ImportSpec;

inline constexpr NodeKind k_first_decl_kind = NodeKind::FuncDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::GenDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_spec_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_spec_kind && kind <= detail::k_last_spec_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace doculint
