// doculint/ast/visitor.hpp - CRTP Visitor pattern for Go AST traversal
//
// AstVisitor dispatches on NodeKind to visit_<snake>() methods of the derived
// class; RecursiveAstVisitor additionally walks into every child.
//
#pragma once

#include <type_traits>

#include "doculint/ast/ast.hpp"
#include "doculint/ast/ast_enums.hpp"
#include "doculint/basic/casting.hpp"

namespace doculint
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor without virtual dispatch.
 *
 * @code
 *   class LiteralCounter : public ConstAstVisitor<LiteralCounter, void> {
 *   public:
 *     void visit_basic_lit(const BasicLit * lit) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * Unhandled kinds fall back to visit_expr / visit_stmt / visit_spec /
 * visit_decl and finally visit_node.
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /// Dispatch on the node kind. Null nodes return ReturnType().
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define DOCULINT_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                          \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_STMT(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_SPEC(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_DECL(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_SUPPORT(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_TOP(Class, Kind, Snake) DOCULINT_VISIT_CASE(Class, Kind, Snake)
#include "doculint/ast/ast_nodes.def"
#undef DOCULINT_VISIT_CASE
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from the X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SPEC(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_spec(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "doculint/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_spec(detail::propagate_const_t<NodePtrT, Spec> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that walks into every child node, in source order.
 *
 * Override a visit method to act on a node kind and call the base
 * implementation to keep descending; return false to stop the whole walk.
 * Comment groups are not descended into.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and unhandled kinds continue the walk.
  bool visit_node(NodePtrT /*node*/) { return true; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->x)) return false;
    return get_derived().visit(node->y);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->x); }

  bool visit_paren_expr(NodePtr<ParenExpr> node) { return get_derived().visit(node->x); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!get_derived().visit(node->fun)) return false;
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_selector_expr(NodePtr<SelectorExpr> node)
  {
    if (!get_derived().visit(node->x)) return false;
    return get_derived().visit(node->sel);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    if (!get_derived().visit(node->x)) return false;
    return get_derived().visit(node->index);
  }

  bool visit_composite_lit(NodePtr<CompositeLit> node)
  {
    if (node->type && !get_derived().visit(node->type)) return false;
    for (auto * elt : node->elts) {
      if (!get_derived().visit(elt)) return false;
    }
    return true;
  }

  bool visit_func_lit(NodePtr<FuncLit> node) { return get_derived().visit(node->body); }

  bool visit_opaque_expr(NodePtr<OpaqueExpr> node)
  {
    for (auto * operand : node->operands) {
      if (!get_derived().visit(operand)) return false;
    }
    return true;
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_block_stmt(NodePtr<BlockStmt> node)
  {
    for (auto * stmt : node->list) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->x); }

  bool visit_assign_stmt(NodePtr<AssignStmt> node)
  {
    for (auto * e : node->lhs) {
      if (!get_derived().visit(e)) return false;
    }
    for (auto * e : node->rhs) {
      if (!get_derived().visit(e)) return false;
    }
    return true;
  }

  bool visit_inc_dec_stmt(NodePtr<IncDecStmt> node) { return get_derived().visit(node->x); }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    for (auto * e : node->results) {
      if (!get_derived().visit(e)) return false;
    }
    return true;
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (node->init && !get_derived().visit(node->init)) return false;
    if (!get_derived().visit(node->cond)) return false;
    if (!get_derived().visit(node->body)) return false;
    return !node->elseStmt || get_derived().visit(node->elseStmt);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    if (node->init && !get_derived().visit(node->init)) return false;
    if (node->cond && !get_derived().visit(node->cond)) return false;
    if (node->post && !get_derived().visit(node->post)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_range_stmt(NodePtr<RangeStmt> node)
  {
    if (node->key && !get_derived().visit(node->key)) return false;
    if (node->value && !get_derived().visit(node->value)) return false;
    if (!get_derived().visit(node->x)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    if (node->init && !get_derived().visit(node->init)) return false;
    if (node->tag && !get_derived().visit(node->tag)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_case_clause(NodePtr<CaseClause> node)
  {
    for (auto * e : node->list) {
      if (!get_derived().visit(e)) return false;
    }
    for (auto * stmt : node->body) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_decl_stmt(NodePtr<DeclStmt> node) { return get_derived().visit(node->decl); }

  bool visit_labeled_stmt(NodePtr<LabeledStmt> node)
  {
    if (!get_derived().visit(node->label)) return false;
    return get_derived().visit(node->stmt);
  }

  bool visit_send_stmt(NodePtr<SendStmt> node)
  {
    if (!get_derived().visit(node->chan)) return false;
    return get_derived().visit(node->value);
  }

  bool visit_select_stmt(NodePtr<SelectStmt> node) { return get_derived().visit(node->body); }

  bool visit_comm_clause(NodePtr<CommClause> node)
  {
    if (node->comm && !get_derived().visit(node->comm)) return false;
    for (auto * stmt : node->body) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }

  bool visit_go_stmt(NodePtr<GoStmt> node) { return get_derived().visit(node->call); }

  bool visit_defer_stmt(NodePtr<DeferStmt> node) { return get_derived().visit(node->call); }

  // ===========================================================================
  // Specifications and declarations
  // ===========================================================================

  bool visit_value_spec(NodePtr<ValueSpec> node)
  {
    for (auto * name : node->names) {
      if (!get_derived().visit(name)) return false;
    }
    if (node->type && !get_derived().visit(node->type)) return false;
    for (auto * value : node->values) {
      if (!get_derived().visit(value)) return false;
    }
    return true;
  }

  bool visit_type_spec(NodePtr<TypeSpec> node)
  {
    if (!get_derived().visit(node->name)) return false;
    return !node->type || get_derived().visit(node->type);
  }

  bool visit_import_spec(NodePtr<ImportSpec> node)
  {
    if (node->name && !get_derived().visit(node->name)) return false;
    return get_derived().visit(node->path);
  }

  bool visit_func_decl(NodePtr<FuncDecl> node)
  {
    if (node->recvType && !get_derived().visit(node->recvType)) return false;
    if (!get_derived().visit(node->name)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_gen_decl(NodePtr<GenDecl> node)
  {
    for (auto * spec : node->specs) {
      if (!get_derived().visit(spec)) return false;
    }
    return true;
  }

  bool visit_file(NodePtr<File> node)
  {
    if (!get_derived().visit(node->packageName)) return false;
    for (auto * decl : node->decls) {
      if (!get_derived().visit(decl)) return false;
    }
    return true;
  }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace doculint
