// doculint/lint/analyzer.cpp - Runs every doculint check over one package
#include "doculint/lint/analyzer.hpp"

#include <string>
#include <utility>

#include "doculint/lint/doc_auditor.hpp"
#include "doculint/lint/package_name.hpp"
#include "doculint/lint/rules.hpp"

namespace doculint
{

std::string package_scope(const Package & package)
{
  if (!package.directory.empty()) {
    return package.directory.generic_string();
  }
  return package.name;
}

size_t analyze_package(const Package & package, DiagnosticBag & diags)
{
  const std::string scope = package_scope(package);
  size_t count = 0;

  if (auto violation = validate_package_name(package.name)) {
    const std::string_view code = violation->kind == NamingViolationKind::Separator
                                    ? rule::k_package_separator
                                    : rule::k_package_casing;
    diags.report_warning(SourceRange{}, std::move(violation->message))
      .with_code(code)
      .with_scope(scope);
    ++count;
  }

  DocAuditor auditor(&diags, package.name, package.isEntry, scope);
  for (const File * file : package.files) {
    auditor.audit_file(*file);
  }
  auditor.finalize();

  return count + auditor.report_count();
}

}  // namespace doculint
