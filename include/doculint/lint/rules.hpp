// doculint/lint/rules.hpp - Analyzer identity and rule codes
//
#pragma once

#include <gsl/span>
#include <string_view>

namespace doculint
{

inline constexpr std::string_view k_analyzer_name = "doculint";
inline constexpr std::string_view k_analyzer_doc =
  "checks for proper function, type, package, constant, and string and numeric literal "
  "documentation";

/// Rule codes attached to every lint diagnostic.
namespace rule
{

inline constexpr std::string_view k_package_separator = "D001";
inline constexpr std::string_view k_package_casing = "D002";
inline constexpr std::string_view k_package_comment_missing = "D003";
inline constexpr std::string_view k_package_comment_prefix = "D004";
inline constexpr std::string_view k_package_file_missing = "D005";
inline constexpr std::string_view k_function_comment_missing = "D006";
inline constexpr std::string_view k_function_comment_prefix = "D007";
inline constexpr std::string_view k_literal_in_conditional = "D008";
inline constexpr std::string_view k_const_block_comment_missing = "D009";
inline constexpr std::string_view k_const_multiple_names = "D010";
inline constexpr std::string_view k_const_comment_missing = "D011";
inline constexpr std::string_view k_const_comment_prefix = "D012";
inline constexpr std::string_view k_type_block_comment_missing = "D013";
inline constexpr std::string_view k_type_comment_missing = "D014";
inline constexpr std::string_view k_type_comment_prefix = "D015";

}  // namespace rule

struct RuleInfo
{
  std::string_view code;
  std::string_view summary;
};

/// All rules in code order.
[[nodiscard]] gsl::span<const RuleInfo> all_rules() noexcept;

/// Lookup by code ("D006"); nullptr when unknown.
[[nodiscard]] const RuleInfo * find_rule(std::string_view code) noexcept;

}  // namespace doculint
