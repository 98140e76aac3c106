// doculint/lint/rules.cpp - Rule table
#include "doculint/lint/rules.hpp"

#include <array>

namespace doculint
{

namespace
{

constexpr std::array<RuleInfo, 15> k_rules = {{
  {rule::k_package_separator, "package name should not contain - or _"},
  {rule::k_package_casing, "package name should be all lowercase"},
  {rule::k_package_comment_missing, "package file has no package comment"},
  {rule::k_package_comment_prefix, "package comment should begin with \"Package <name>\""},
  {rule::k_package_file_missing, "package has no file named after it"},
  {rule::k_function_comment_missing, "function has no doc comment"},
  {rule::k_function_comment_prefix, "function comment should begin with the function name"},
  {rule::k_literal_in_conditional, "literal used as operand of an if condition"},
  {rule::k_const_block_comment_missing, "constant block has no doc comment"},
  {rule::k_const_multiple_names, "constants declared together should be separated"},
  {rule::k_const_comment_missing, "constant has no doc comment"},
  {rule::k_const_comment_prefix, "constant comment should begin with the constant name"},
  {rule::k_type_block_comment_missing, "type block has no doc comment"},
  {rule::k_type_comment_missing, "type has no doc comment"},
  {rule::k_type_comment_prefix, "type comment should begin with the type name"},
}};

}  // namespace

gsl::span<const RuleInfo> all_rules() noexcept { return {k_rules.data(), k_rules.size()}; }

const RuleInfo * find_rule(std::string_view code) noexcept
{
  for (const auto & info : k_rules) {
    if (info.code == code) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace doculint
