// doculint/ast/ast_context.hpp - Arena for the nodes of one loaded package
//
// Every node, child list and identifier of a package lives in one
// std::pmr::monotonic_buffer_resource and is released with the context.
// Nodes therefore hold string_view and gsl::span, never owning containers.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace doculint
{

class AstNode;

class AstContext
{
public:
  /// A typical Go file dump fits in the first block.
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), names_(&arena_)
  {
  }

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /// Construct a node in the arena; the pointer lives as long as the context.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>, "arena nodes are never destroyed individually");

    ++nodeCount_;
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Copy `s` into the arena once; identifiers repeat a lot in Go code.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto it = names_.find(s); it != names_.end()) {
      return *it;
    }

    auto * storage = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
    if (!s.empty()) {
      std::memcpy(storage, s.data(), s.size());
    }
    return *names_.emplace(storage, s.size()).first;
  }

  /// Child lists are built in a std::vector and frozen into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "arena lists hold pointers or plain values");
    if (items.empty()) {
      return {};
    }
    auto * storage = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), storage);
    return gsl::span<T>(storage, items.size());
  }

  [[nodiscard]] size_t node_count() const noexcept { return nodeCount_; }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
  size_t nodeCount_ = 0;
};

}  // namespace doculint
