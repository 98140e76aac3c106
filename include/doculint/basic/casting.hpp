// doculint/basic/casting.hpp - LLVM-style RTTI helpers for the Go AST
//
// Node classes expose `static bool classof(const AstNode *)`; the helpers keep
// the constness of their argument.
//
//   if (isa<BasicLit>(expr)) { ... }
//   if (isa<FuncDecl, GenDecl>(decl)) { ... }   // any of the listed kinds
//   const auto * lit = cast<BasicLit>(expr);    // kind known
//   if (auto * call = dyn_cast<CallExpr>(expr)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace doculint
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

/// `To`, const-qualified when `From` is.
template <typename From, typename To>
using copy_const_t = std::conditional_t<std::is_const_v<From>, const To, To>;

}  // namespace detail

/// True if `node` is non-null and of one of the kinds T, Ts...
template <typename T, typename... Ts, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(
    (detail::HasClassof<T, From>::value && ... && detail::HasClassof<Ts, From>::value),
    "isa<> target types need a static classof()");
  return node != nullptr && (T::classof(node) || ... || Ts::classof(node));
}

/// Downcast to a kind the caller has already established.
template <typename T, typename From>
[[nodiscard]] inline detail::copy_const_t<From, T> * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<detail::copy_const_t<From, T> *>(node);
}

/// Downcast that yields nullptr for null or mismatching nodes.
template <typename T, typename From>
[[nodiscard]] inline detail::copy_const_t<From, T> * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<detail::copy_const_t<From, T> *>(node) : nullptr;
}

}  // namespace doculint
