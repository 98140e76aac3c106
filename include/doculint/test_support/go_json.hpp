// doculint/test_support/go_json.hpp - builders for package dump JSON in tests
//
// Each helper returns one node object of the package dump format. Offsets
// are optional; pass them when a test checks positions.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace doculint::test_support::go
{

using nlohmann::json;

inline json at(json node, uint32_t pos, uint32_t end)
{
  node["pos"] = pos;
  node["end"] = end;
  return node;
}

inline json comment(std::vector<std::string> lines) { return json{{"lines", lines}}; }

inline json ident(const std::string & name) { return json{{"kind", "Ident"}, {"name", name}}; }

inline json lit(const std::string & litKind, const std::string & value)
{
  return json{{"kind", "BasicLit"}, {"lit_kind", litKind}, {"value", value}};
}

inline json int_lit(const std::string & value) { return lit("INT", value); }

inline json binary(json x, const std::string & op, json y)
{
  return json{{"kind", "BinaryExpr"}, {"x", std::move(x)}, {"op", op}, {"y", std::move(y)}};
}

inline json call(json fun, std::vector<json> args = {})
{
  return json{{"kind", "CallExpr"}, {"fun", std::move(fun)}, {"args", std::move(args)}};
}

inline json block(std::vector<json> stmts = {})
{
  return json{{"kind", "BlockStmt"}, {"list", std::move(stmts)}};
}

inline json expr_stmt(json x) { return json{{"kind", "ExprStmt"}, {"x", std::move(x)}}; }

inline json if_stmt(json cond, json body = block(), json elseStmt = nullptr)
{
  json j{{"kind", "IfStmt"}, {"cond", std::move(cond)}, {"body", std::move(body)}};
  if (!elseStmt.is_null()) j["else"] = std::move(elseStmt);
  return j;
}

inline json for_stmt(json body = block(), json cond = nullptr)
{
  json j{{"kind", "ForStmt"}, {"body", std::move(body)}};
  if (!cond.is_null()) j["cond"] = std::move(cond);
  return j;
}

inline json labeled(const std::string & label, json stmt)
{
  return json{{"kind", "LabeledStmt"}, {"label", ident(label)}, {"stmt", std::move(stmt)}};
}

inline json branch(const std::string & tok, const std::string & label = {})
{
  json j{{"kind", "BranchStmt"}, {"tok", tok}};
  if (!label.empty()) j["label"] = ident(label);
  return j;
}

inline json send_stmt(json chan, json value)
{
  return json{{"kind", "SendStmt"}, {"chan", std::move(chan)}, {"value", std::move(value)}};
}

/// A null comm makes the default clause.
inline json comm_clause(json comm, std::vector<json> body = {})
{
  json j{{"kind", "CommClause"}, {"body", std::move(body)}};
  if (!comm.is_null()) j["comm"] = std::move(comm);
  return j;
}

inline json select_stmt(std::vector<json> clauses)
{
  return json{{"kind", "SelectStmt"}, {"body", block(std::move(clauses))}};
}

inline json empty_stmt() { return json{{"kind", "EmptyStmt"}}; }

inline json func(const std::string & name, json doc = nullptr, json body = block())
{
  json j{{"kind", "FuncDecl"}, {"name", ident(name)}, {"body", std::move(body)}};
  if (!doc.is_null()) j["doc"] = std::move(doc);
  return j;
}

inline json method(const std::string & recv, const std::string & name, json doc = nullptr)
{
  json j = func(name, std::move(doc));
  j["recv"] = ident(recv);
  return j;
}

inline json value_spec(std::vector<std::string> names, json doc = nullptr)
{
  std::vector<json> idents;
  for (const auto & n : names) idents.push_back(ident(n));
  json j{{"kind", "ValueSpec"}, {"names", std::move(idents)}, {"values", json::array()}};
  if (!doc.is_null()) j["doc"] = std::move(doc);
  return j;
}

inline json type_spec(const std::string & name, json doc = nullptr)
{
  json j{{"kind", "TypeSpec"}, {"name", ident(name)}, {"type", ident("int")}};
  if (!doc.is_null()) j["doc"] = std::move(doc);
  return j;
}

/// const/type/var declaration; `parenthesized` adds an lparen offset.
inline json gen_decl(
  const std::string & tok, std::vector<json> specs, bool parenthesized, json doc = nullptr)
{
  json j{{"kind", "GenDecl"}, {"tok", tok}, {"specs", std::move(specs)}};
  if (parenthesized) j["lparen"] = 0;
  if (!doc.is_null()) j["doc"] = std::move(doc);
  return j;
}

inline json file(const std::string & path, std::vector<json> decls = {}, json doc = nullptr)
{
  json j{{"path", path}, {"source", ""}, {"decls", std::move(decls)}};
  if (!doc.is_null()) j["doc"] = std::move(doc);
  return j;
}

inline json package(const std::string & name, std::vector<json> files)
{
  return json{{"package", name}, {"files", std::move(files)}};
}

}  // namespace doculint::test_support::go
