// tests/unit/ast/test_visitor.cpp - CRTP visitor dispatch and traversal

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "doculint/ast/ast.hpp"
#include "doculint/ast/ast_context.hpp"
#include "doculint/ast/visitor.hpp"

using namespace doculint;

namespace
{

class LiteralCollector : public ConstRecursiveAstVisitor<LiteralCollector>
{
public:
  bool visit_basic_lit(const BasicLit * lit)
  {
    values.emplace_back(lit->value);
    return true;
  }

  std::vector<std::string> values;
};

class KindNamer : public ConstAstVisitor<KindNamer, std::string>
{
public:
  std::string visit_ident(const Ident * id) { return "ident:" + std::string(id->name); }
  std::string visit_expr(const Expr * /*e*/) { return "expr"; }
  std::string visit_node(const AstNode * /*n*/) { return "node"; }
};

class StopAtFirstIf : public ConstRecursiveAstVisitor<StopAtFirstIf>
{
public:
  bool visit_if_stmt(const IfStmt * /*stmt*/)
  {
    ++ifs;
    return false;
  }

  int ifs = 0;
};

}  // namespace

TEST(AstVisitor, DispatchFallsBackToCategory)
{
  AstContext ctx;
  auto * id = ctx.create<Ident>("x");
  auto * lit = ctx.create<BasicLit>(LiteralKind::Int, "1");
  auto * block = ctx.create<BlockStmt>();

  KindNamer namer;
  EXPECT_EQ(namer.visit(id), "ident:x");
  EXPECT_EQ(namer.visit(lit), "expr");
  EXPECT_EQ(namer.visit(block), "node");
  EXPECT_EQ(namer.visit(nullptr), "");
}

TEST(AstVisitor, RecursiveWalkReachesFunctionLiteralBodies)
{
  AstContext ctx;

  // func F() { go func() { if n > 7 {} }() }
  auto * inner_if = ctx.create<IfStmt>(
    ctx.create<BinaryExpr>(
      ctx.create<Ident>("n"), BinaryOp::Gt, ctx.create<BasicLit>(LiteralKind::Int, "7")),
    ctx.create<BlockStmt>());
  auto * inner_body = ctx.create<BlockStmt>();
  inner_body->list = ctx.copy_to_arena(std::vector<Stmt *>{inner_if});
  auto * call = ctx.create<CallExpr>(ctx.create<FuncLit>(inner_body));
  auto * outer_body = ctx.create<BlockStmt>();
  outer_body->list = ctx.copy_to_arena(std::vector<Stmt *>{ctx.create<GoStmt>(call)});

  auto * fn = ctx.create<FuncDecl>(ctx.create<Ident>("F"));
  fn->body = outer_body;

  LiteralCollector collector;
  EXPECT_TRUE(collector.visit(fn));
  ASSERT_EQ(collector.values.size(), 1U);
  EXPECT_EQ(collector.values[0], "7");
}

TEST(AstVisitor, ReturningFalseStopsTheWalk)
{
  AstContext ctx;
  auto * first = ctx.create<IfStmt>(ctx.create<Ident>("a"), ctx.create<BlockStmt>());
  auto * second = ctx.create<IfStmt>(ctx.create<Ident>("b"), ctx.create<BlockStmt>());
  auto * body = ctx.create<BlockStmt>();
  body->list = ctx.copy_to_arena(std::vector<Stmt *>{first, second});

  StopAtFirstIf visitor;
  EXPECT_FALSE(visitor.visit(body));
  EXPECT_EQ(visitor.ifs, 1);
}

TEST(AstVisitor, CastingFollowsNodeKind)
{
  AstContext ctx;
  Expr * e = ctx.create<BasicLit>(LiteralKind::String, "\"s\"");

  EXPECT_TRUE(isa<BasicLit>(e));
  EXPECT_FALSE(isa<Ident>(e));
  EXPECT_TRUE((isa<Ident, BasicLit>(e)));
  EXPECT_FALSE(isa<BasicLit>(static_cast<Expr *>(nullptr)));
  EXPECT_NE(dyn_cast<BasicLit>(e), nullptr);
  EXPECT_EQ(dyn_cast<BinaryExpr>(e), nullptr);

  const Expr * ce = e;
  const BasicLit * lit = cast<BasicLit>(ce);
  EXPECT_EQ(lit->value, "\"s\"");
  EXPECT_TRUE(is_expr_kind(e->get_kind()));
  EXPECT_FALSE(is_stmt_kind(e->get_kind()));
}
