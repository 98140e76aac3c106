// doculint/syntax/package_loader.cpp - Builds a Go package AST from its JSON dump
//
#include "doculint/syntax/package_loader.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace doculint
{

namespace
{

using nlohmann::json;

// ============================================================================
// Token tables
// ============================================================================

template <typename E>
struct TokenEntry
{
  std::string_view text;
  E value;
};

constexpr std::array<TokenEntry<BinaryOp>, 19> k_binary_ops = {{
  {"||", BinaryOp::LogicalOr}, {"&&", BinaryOp::LogicalAnd}, {"==", BinaryOp::Eq},
  {"!=", BinaryOp::Ne},        {"<", BinaryOp::Lt},          {"<=", BinaryOp::Le},
  {">", BinaryOp::Gt},         {">=", BinaryOp::Ge},         {"+", BinaryOp::Add},
  {"-", BinaryOp::Sub},        {"|", BinaryOp::Or},          {"^", BinaryOp::Xor},
  {"*", BinaryOp::Mul},        {"/", BinaryOp::Quo},         {"%", BinaryOp::Rem},
  {"<<", BinaryOp::Shl},       {">>", BinaryOp::Shr},        {"&", BinaryOp::And},
  {"&^", BinaryOp::AndNot},
}};

constexpr std::array<TokenEntry<UnaryOp>, 7> k_unary_ops = {{
  {"+", UnaryOp::Plus},
  {"-", UnaryOp::Neg},
  {"!", UnaryOp::Not},
  {"^", UnaryOp::Xor},
  {"*", UnaryOp::Deref},
  {"&", UnaryOp::Addr},
  {"<-", UnaryOp::Arrow},
}};

constexpr std::array<TokenEntry<AssignOp>, 13> k_assign_ops = {{
  {"=", AssignOp::Assign},
  {":=", AssignOp::Define},
  {"+=", AssignOp::AddAssign},
  {"-=", AssignOp::SubAssign},
  {"*=", AssignOp::MulAssign},
  {"/=", AssignOp::QuoAssign},
  {"%=", AssignOp::RemAssign},
  {"&=", AssignOp::AndAssign},
  {"|=", AssignOp::OrAssign},
  {"^=", AssignOp::XorAssign},
  {"<<=", AssignOp::ShlAssign},
  {">>=", AssignOp::ShrAssign},
  {"&^=", AssignOp::AndNotAssign},
}};

constexpr std::array<TokenEntry<LiteralKind>, 5> k_literal_kinds = {{
  {"INT", LiteralKind::Int},
  {"FLOAT", LiteralKind::Float},
  {"IMAG", LiteralKind::Imag},
  {"CHAR", LiteralKind::Char},
  {"STRING", LiteralKind::String},
}};

constexpr std::array<TokenEntry<DeclToken>, 4> k_decl_tokens = {{
  {"import", DeclToken::Import},
  {"const", DeclToken::Const},
  {"type", DeclToken::Type},
  {"var", DeclToken::Var},
}};

constexpr std::array<TokenEntry<BranchToken>, 4> k_branch_tokens = {{
  {"break", BranchToken::Break},
  {"continue", BranchToken::Continue},
  {"goto", BranchToken::Goto},
  {"fallthrough", BranchToken::Fallthrough},
}};

template <typename E, size_t N>
std::optional<E> lookup_token(const std::array<TokenEntry<E>, N> & table, std::string_view text)
{
  for (const auto & entry : table) {
    if (entry.text == text) {
      return entry.value;
    }
  }
  return std::nullopt;
}

/// go/ast expression kinds kept as OpaqueExpr
constexpr std::array<std::string_view, 12> k_opaque_kinds = {
  "ArrayType",      "StructType",   "FuncType", "InterfaceType", "MapType",       "ChanType",
  "TypeAssertExpr", "KeyValueExpr", "Ellipsis", "SliceExpr",     "IndexListExpr", "BadExpr",
};

bool is_opaque_kind(std::string_view kind)
{
  for (const auto k : k_opaque_kinds) {
    if (k == kind) return true;
  }
  return false;
}

// ============================================================================
// TreeBuilder
// ============================================================================

/// Thrown inside the builder and turned into one diagnostic at the boundary.
class LoadError : public std::runtime_error
{
public:
  LoadError(std::string_view code, const std::string & message)
  : std::runtime_error(message), code_(code)
  {
  }

  [[nodiscard]] std::string_view code() const noexcept { return code_; }

private:
  std::string_view code_;
};

/**
 * Converts the JSON description of one file into arena nodes.
 */
class TreeBuilder
{
public:
  TreeBuilder(AstContext & ast, FileId file, std::string filePath)
  : ast_(ast), file_(file), filePath_(std::move(filePath))
  {
  }

  File * build_file(const json & j, std::string_view packageName)
  {
    const std::string_view path = ast_.intern(filePath_);
    const SourceRange pkgRange = offset_range(j, "package_pos", "package_end");
    auto * pkgIdent = ast_.create<Ident>(ast_.intern(packageName), pkgRange);

    auto * file = ast_.create<File>(path, pkgIdent, SourceRange(file_, 0, 0));
    file->doc = build_comment_group(j, "doc");
    file->decls = build_list<Decl>(j, "decls", [this](const json & d) { return build_decl(d); });
    return file;
  }

private:
  // ===========================================================================
  // Field access
  // ===========================================================================

  [[noreturn]] void fail(std::string_view code, const std::string & message) const
  {
    throw LoadError(code, fmt::format("{}: {}", filePath_, message));
  }

  [[noreturn]] void fail_malformed(const std::string & message) const
  {
    fail(loader_code::k_malformed_tree, message);
  }

  const json & require(const json & j, const char * field, std::string_view owner) const
  {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
      fail_malformed(fmt::format("{} is missing required field '{}'", owner, field));
    }
    return *it;
  }

  /// Non-null member or nullptr.
  static const json * optional_field(const json & j, const char * field)
  {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
  }

  std::string_view string_field(const json & j, const char * field, std::string_view owner) const
  {
    const json & v = require(j, field, owner);
    if (!v.is_string()) {
      fail_malformed(fmt::format("{}: field '{}' must be a string", owner, field));
    }
    return ast_.intern(v.get_ref<const std::string &>());
  }

  std::string_view kind_of(const json & j) const
  {
    if (!j.is_object()) {
      fail_malformed(fmt::format("expected a node object, found {}", j.type_name()));
    }
    return string_field(j, "kind", "node");
  }

  std::optional<uint32_t> offset_field(const json & j, const char * field) const
  {
    const json * v = optional_field(j, field);
    if (!v) return std::nullopt;
    if (!v->is_number_unsigned()) {
      fail_malformed(fmt::format("field '{}' must be a non-negative byte offset", field));
    }
    return v->get<uint32_t>();
  }

  SourceRange offset_range(const json & j, const char * posField, const char * endField) const
  {
    const auto pos = offset_field(j, posField);
    if (!pos) return {};
    const auto end = offset_field(j, endField).value_or(*pos);
    if (end < *pos) {
      fail_malformed(fmt::format("'{}' precedes '{}'", endField, posField));
    }
    return SourceRange(file_, *pos, end);
  }

  SourceRange range_of(const json & j) const { return offset_range(j, "pos", "end"); }

  template <typename T, typename Fn>
  gsl::span<T *> build_list(const json & j, const char * field, Fn && fn)
  {
    const json * v = optional_field(j, field);
    if (!v) return {};
    if (!v->is_array()) {
      fail_malformed(fmt::format("field '{}' must be an array", field));
    }
    std::vector<T *> items;
    items.reserve(v->size());
    for (const auto & item : *v) {
      items.push_back(fn(item));
    }
    return ast_.copy_to_arena(items);
  }

  template <typename E, size_t N>
  E token_field(
    const json & j, const char * field, std::string_view owner,
    const std::array<TokenEntry<E>, N> & table) const
  {
    const std::string_view text = string_field(j, field, owner);
    if (auto value = lookup_token(table, text)) {
      return *value;
    }
    fail_malformed(fmt::format("{}: unknown {} '{}'", owner, field, text));
  }

  // ===========================================================================
  // Comments
  // ===========================================================================

  CommentGroup * build_comment_group(const json & j, const char * field)
  {
    const json * v = optional_field(j, field);
    if (!v) return nullptr;
    if (!v->is_object()) {
      fail_malformed(fmt::format("field '{}' must be a comment group object", field));
    }

    const json & lines = require(*v, "lines", "comment group");
    if (!lines.is_array()) {
      fail_malformed("comment group: field 'lines' must be an array");
    }
    std::vector<std::string_view> comments;
    comments.reserve(lines.size());
    for (const auto & line : lines) {
      if (!line.is_string()) {
        fail_malformed("comment group: every line must be a string");
      }
      comments.push_back(ast_.intern(line.get_ref<const std::string &>()));
    }
    return ast_.create<CommentGroup>(ast_.copy_to_arena(comments), range_of(*v));
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Ident * build_ident(const json & j)
  {
    const std::string_view kind = kind_of(j);
    if (kind != "Ident") {
      fail_malformed(fmt::format("expected Ident, found {}", kind));
    }
    return ast_.create<Ident>(string_field(j, "name", "Ident"), range_of(j));
  }

  Expr * build_optional_expr(const json & j, const char * field)
  {
    const json * v = optional_field(j, field);
    return v ? build_expr(*v) : nullptr;
  }

  Expr * build_required_expr(const json & j, const char * field, std::string_view owner)
  {
    return build_expr(require(j, field, owner));
  }

  gsl::span<Expr *> build_expr_list(const json & j, const char * field)
  {
    return build_list<Expr>(j, field, [this](const json & e) { return build_expr(e); });
  }

  CallExpr * build_call(const json & j)
  {
    Expr * e = build_expr(j);
    auto * call = dyn_cast<CallExpr>(e);
    if (!call) {
      fail_malformed("expected CallExpr");
    }
    return call;
  }

  Expr * build_expr(const json & j)
  {
    const std::string_view kind = kind_of(j);
    const SourceRange r = range_of(j);

    if (kind == "Ident") {
      return ast_.create<Ident>(string_field(j, "name", kind), r);
    }
    if (kind == "BasicLit") {
      const LiteralKind litKind = token_field(j, "lit_kind", kind, k_literal_kinds);
      return ast_.create<BasicLit>(litKind, string_field(j, "value", kind), r);
    }
    if (kind == "BinaryExpr") {
      Expr * x = build_required_expr(j, "x", kind);
      const BinaryOp op = token_field(j, "op", kind, k_binary_ops);
      Expr * y = build_required_expr(j, "y", kind);
      return ast_.create<BinaryExpr>(x, op, y, r);
    }
    if (kind == "UnaryExpr") {
      const UnaryOp op = token_field(j, "op", kind, k_unary_ops);
      return ast_.create<UnaryExpr>(op, build_required_expr(j, "x", kind), r);
    }
    if (kind == "StarExpr") {
      return ast_.create<UnaryExpr>(UnaryOp::Deref, build_required_expr(j, "x", kind), r);
    }
    if (kind == "ParenExpr") {
      return ast_.create<ParenExpr>(build_required_expr(j, "x", kind), r);
    }
    if (kind == "CallExpr") {
      auto * call = ast_.create<CallExpr>(build_required_expr(j, "fun", kind), r);
      call->args = build_expr_list(j, "args");
      return call;
    }
    if (kind == "SelectorExpr") {
      Expr * x = build_required_expr(j, "x", kind);
      return ast_.create<SelectorExpr>(x, build_ident(require(j, "sel", kind)), r);
    }
    if (kind == "IndexExpr") {
      Expr * x = build_required_expr(j, "x", kind);
      return ast_.create<IndexExpr>(x, build_required_expr(j, "index", kind), r);
    }
    if (kind == "CompositeLit") {
      auto * lit = ast_.create<CompositeLit>(r);
      lit->type = build_optional_expr(j, "type");
      lit->elts = build_expr_list(j, "elts");
      return lit;
    }
    if (kind == "FuncLit") {
      return ast_.create<FuncLit>(build_block(require(j, "body", kind)), r);
    }
    if (kind == "OpaqueExpr" || is_opaque_kind(kind)) {
      const std::string_view label =
        kind == "OpaqueExpr" ? string_field(j, "label", kind) : kind;
      auto * opaque = ast_.create<OpaqueExpr>(label, r);
      opaque->operands = build_expr_list(j, "operands");
      return opaque;
    }

    fail_malformed(fmt::format("unknown expression kind '{}'", kind));
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  Stmt * build_optional_stmt(const json & j, const char * field)
  {
    const json * v = optional_field(j, field);
    return v ? build_stmt(*v) : nullptr;
  }

  gsl::span<Stmt *> build_stmt_list(const json & j, const char * field)
  {
    return build_list<Stmt>(j, field, [this](const json & s) { return build_stmt(s); });
  }

  BlockStmt * build_block(const json & j)
  {
    const std::string_view kind = kind_of(j);
    if (kind != "BlockStmt") {
      fail_malformed(fmt::format("expected BlockStmt, found {}", kind));
    }
    auto * block = ast_.create<BlockStmt>(range_of(j));
    block->list = build_stmt_list(j, "list");
    return block;
  }

  Stmt * build_stmt(const json & j)
  {
    const std::string_view kind = kind_of(j);
    const SourceRange r = range_of(j);

    if (kind == "BlockStmt") {
      return build_block(j);
    }
    if (kind == "ExprStmt") {
      return ast_.create<ExprStmt>(build_required_expr(j, "x", kind), r);
    }
    if (kind == "AssignStmt") {
      auto * assign = ast_.create<AssignStmt>(token_field(j, "tok", kind, k_assign_ops), r);
      assign->lhs = build_expr_list(j, "lhs");
      assign->rhs = build_expr_list(j, "rhs");
      return assign;
    }
    if (kind == "IncDecStmt") {
      const std::string_view tok = string_field(j, "tok", kind);
      if (tok != "++" && tok != "--") {
        fail_malformed(fmt::format("IncDecStmt: unknown tok '{}'", tok));
      }
      return ast_.create<IncDecStmt>(build_required_expr(j, "x", kind), tok == "++", r);
    }
    if (kind == "ReturnStmt") {
      auto * ret = ast_.create<ReturnStmt>(r);
      ret->results = build_expr_list(j, "results");
      return ret;
    }
    if (kind == "IfStmt") {
      Stmt * init = build_optional_stmt(j, "init");
      Expr * cond = build_required_expr(j, "cond", kind);
      auto * stmt = ast_.create<IfStmt>(cond, build_block(require(j, "body", kind)), r);
      stmt->init = init;
      stmt->elseStmt = build_optional_stmt(j, "else");
      return stmt;
    }
    if (kind == "ForStmt") {
      Stmt * init = build_optional_stmt(j, "init");
      Expr * cond = build_optional_expr(j, "cond");
      Stmt * post = build_optional_stmt(j, "post");
      auto * stmt = ast_.create<ForStmt>(build_block(require(j, "body", kind)), r);
      stmt->init = init;
      stmt->cond = cond;
      stmt->post = post;
      return stmt;
    }
    if (kind == "RangeStmt") {
      Expr * key = build_optional_expr(j, "key");
      Expr * value = build_optional_expr(j, "value");
      Expr * x = build_required_expr(j, "x", kind);
      auto * stmt = ast_.create<RangeStmt>(x, build_block(require(j, "body", kind)), r);
      stmt->key = key;
      stmt->value = value;
      return stmt;
    }
    if (kind == "SwitchStmt" || kind == "TypeSwitchStmt") {
      Stmt * init = build_optional_stmt(j, "init");
      // a type switch guard ("v := x.(type)") has no tag; walk it as the init
      if (!init) init = build_optional_stmt(j, "assign");
      Expr * tag = build_optional_expr(j, "tag");
      auto * stmt = ast_.create<SwitchStmt>(build_block(require(j, "body", kind)), r);
      stmt->init = init;
      stmt->tag = tag;
      return stmt;
    }
    if (kind == "CaseClause") {
      auto * clause = ast_.create<CaseClause>(r);
      clause->list = build_expr_list(j, "list");
      clause->body = build_stmt_list(j, "body");
      return clause;
    }
    if (kind == "DeclStmt") {
      Decl * decl = build_decl(require(j, "decl", kind));
      auto * gen = dyn_cast<GenDecl>(decl);
      if (!gen) {
        fail_malformed("DeclStmt: 'decl' must be a GenDecl");
      }
      return ast_.create<DeclStmt>(gen, r);
    }
    if (kind == "LabeledStmt") {
      Ident * label = build_ident(require(j, "label", kind));
      return ast_.create<LabeledStmt>(label, build_stmt(require(j, "stmt", kind)), r);
    }
    if (kind == "BranchStmt") {
      auto * branch = ast_.create<BranchStmt>(token_field(j, "tok", kind, k_branch_tokens), r);
      if (const json * label = optional_field(j, "label")) {
        branch->label = build_ident(*label);
      }
      return branch;
    }
    if (kind == "SendStmt") {
      Expr * chan = build_required_expr(j, "chan", kind);
      return ast_.create<SendStmt>(chan, build_required_expr(j, "value", kind), r);
    }
    if (kind == "SelectStmt") {
      return ast_.create<SelectStmt>(build_block(require(j, "body", kind)), r);
    }
    if (kind == "CommClause") {
      auto * clause = ast_.create<CommClause>(r);
      clause->comm = build_optional_stmt(j, "comm");
      clause->body = build_stmt_list(j, "body");
      return clause;
    }
    if (kind == "EmptyStmt") {
      return ast_.create<EmptyStmt>(r);
    }
    if (kind == "BadStmt") {
      return ast_.create<BadStmt>(r);
    }
    if (kind == "GoStmt") {
      return ast_.create<GoStmt>(build_call(require(j, "call", kind)), r);
    }
    if (kind == "DeferStmt") {
      return ast_.create<DeferStmt>(build_call(require(j, "call", kind)), r);
    }

    fail_malformed(fmt::format("unknown statement kind '{}'", kind));
  }

  // ===========================================================================
  // Specifications and declarations
  // ===========================================================================

  Spec * build_spec(const json & j)
  {
    const std::string_view kind = kind_of(j);
    const SourceRange r = range_of(j);

    if (kind == "ValueSpec") {
      auto * spec = ast_.create<ValueSpec>(r);
      spec->doc = build_comment_group(j, "doc");
      spec->names =
        build_list<Ident>(j, "names", [this](const json & n) { return build_ident(n); });
      if (spec->names.empty()) {
        fail(loader_code::k_unnamed_spec, "ValueSpec declares no names");
      }
      spec->type = build_optional_expr(j, "type");
      spec->values = build_expr_list(j, "values");
      return spec;
    }
    if (kind == "TypeSpec") {
      const json * name = optional_field(j, "name");
      if (!name) {
        fail(loader_code::k_unnamed_spec, "TypeSpec declares no name");
      }
      auto * spec = ast_.create<TypeSpec>(build_ident(*name), r);
      spec->doc = build_comment_group(j, "doc");
      spec->type = build_optional_expr(j, "type");
      return spec;
    }
    if (kind == "ImportSpec") {
      Expr * path = build_required_expr(j, "path", kind);
      auto * lit = dyn_cast<BasicLit>(path);
      if (!lit) {
        fail_malformed("ImportSpec: 'path' must be a BasicLit");
      }
      auto * spec = ast_.create<ImportSpec>(lit, r);
      spec->doc = build_comment_group(j, "doc");
      if (const json * name = optional_field(j, "name")) {
        spec->name = build_ident(*name);
      }
      return spec;
    }

    fail_malformed(fmt::format("unknown specification kind '{}'", kind));
  }

  Decl * build_decl(const json & j)
  {
    const std::string_view kind = kind_of(j);
    const SourceRange r = range_of(j);

    if (kind == "FuncDecl") {
      auto * decl = ast_.create<FuncDecl>(build_ident(require(j, "name", kind)), r);
      decl->doc = build_comment_group(j, "doc");
      decl->recvType = build_optional_expr(j, "recv");
      if (const json * body = optional_field(j, "body")) {
        decl->body = build_block(*body);
      }
      return decl;
    }
    if (kind == "GenDecl") {
      auto * decl = ast_.create<GenDecl>(token_field(j, "tok", kind, k_decl_tokens), r);
      decl->doc = build_comment_group(j, "doc");
      if (const auto lparen = offset_field(j, "lparen")) {
        decl->lparen = SourceLocation(file_, *lparen);
      }
      decl->specs = build_list<Spec>(j, "specs", [this](const json & s) { return build_spec(s); });
      return decl;
    }

    fail_malformed(fmt::format("unknown declaration kind '{}'", kind));
  }

  AstContext & ast_;
  FileId file_;
  std::string filePath_;
};

void report_load_error(
  DiagnosticBag & diags, std::string_view code, std::string message, const fs::path & json_path)
{
  diags.report_error(SourceRange{}, std::move(message))
    .with_code(code)
    .with_scope(json_path.generic_string());
}

std::string file_source_text(const json & file, const fs::path & located)
{
  if (const auto it = file.find("source"); it != file.end() && it->is_string()) {
    return it->get<std::string>();
  }
  // Positions stay byte offsets when the Go file is not around.
  return read_text_file(located).value_or(std::string{});
}

}  // namespace

std::optional<std::string> read_text_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::optional<Package> load_package_json(
  SourceRegistry & sources, const fs::path & json_path, std::string_view json_text,
  AstContext & ast, DiagnosticBag & diags)
{
  json doc;
  try {
    doc = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    report_load_error(
      diags, loader_code::k_invalid_json,
      fmt::format("{}: invalid JSON: {}", json_path.generic_string(), e.what()), json_path);
    return std::nullopt;
  }

  const std::string where = json_path.generic_string();
  if (!doc.is_object()) {
    report_load_error(
      diags, loader_code::k_malformed_tree,
      fmt::format("{}: top-level value must be an object", where), json_path);
    return std::nullopt;
  }

  const auto pkg_it = doc.find("package");
  if (pkg_it == doc.end() || !pkg_it->is_string()) {
    report_load_error(
      diags, loader_code::k_malformed_tree,
      fmt::format("{}: missing string field 'package'", where), json_path);
    return std::nullopt;
  }

  Package package;
  package.name = pkg_it->get<std::string>();
  package.isEntry = package.name == "main";
  if (const auto it = doc.find("entry"); it != doc.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      report_load_error(
        diags, loader_code::k_malformed_tree, fmt::format("{}: 'entry' must be a boolean", where),
        json_path);
      return std::nullopt;
    }
    package.isEntry = it->get<bool>();
  }
  if (const auto it = doc.find("directory"); it != doc.end() && it->is_string()) {
    package.directory = it->get<std::string>();
  }

  const auto files_it = doc.find("files");
  if (files_it == doc.end() || !files_it->is_array()) {
    report_load_error(
      diags, loader_code::k_malformed_tree, fmt::format("{}: missing array field 'files'", where),
      json_path);
    return std::nullopt;
  }

  const fs::path base_dir = json_path.parent_path();
  for (const auto & file_json : *files_it) {
    const auto path_it = file_json.is_object() ? file_json.find("path") : file_json.end();
    if (!file_json.is_object() || path_it == file_json.end() || !path_it->is_string()) {
      report_load_error(
        diags, loader_code::k_malformed_tree,
        fmt::format("{}: every file needs a string field 'path'", where), json_path);
      return std::nullopt;
    }

    const fs::path path = path_it->get<std::string>();
    // Files of different dumps may share a relative name ("doc.go")
    const fs::path located = path.is_absolute() ? path : base_dir / path;
    const FileId id =
      sources.register_file(located, file_source_text(file_json, located));

    try {
      TreeBuilder builder(ast, id, path.generic_string());
      package.files.push_back(builder.build_file(file_json, package.name));
    } catch (const LoadError & e) {
      report_load_error(diags, e.code(), e.what(), json_path);
      return std::nullopt;
    } catch (const json::exception & e) {
      report_load_error(
        diags, loader_code::k_malformed_tree,
        fmt::format("{}: {}", path.generic_string(), e.what()), json_path);
      return std::nullopt;
    }
  }

  return package;
}

std::optional<Package> load_package_file(
  SourceRegistry & sources, const fs::path & json_path, AstContext & ast, DiagnosticBag & diags)
{
  auto text = read_text_file(json_path);
  if (!text) {
    report_load_error(
      diags, loader_code::k_read_failed,
      fmt::format("failed to open package file: {}", json_path.generic_string()), json_path);
    return std::nullopt;
  }
  return load_package_json(sources, json_path, *text, ast, diags);
}

}  // namespace doculint
