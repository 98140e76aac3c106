// doculint/lint/package_name.hpp - Package identifier naming conventions
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace doculint
{

enum class NamingViolationKind : uint8_t {
  Separator,  ///< contains '-' or '_'
  Casing,     ///< not all lowercase
};

struct NamingViolation
{
  NamingViolationKind kind;
  std::string message;
};

/**
 * Check a package identifier against the Go package naming conventions.
 *
 * Separators are checked before casing; at most one violation is returned.
 */
[[nodiscard]] std::optional<NamingViolation> validate_package_name(std::string_view name);

}  // namespace doculint
