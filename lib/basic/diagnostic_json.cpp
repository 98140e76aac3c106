// doculint/basic/diagnostic_json.cpp - Machine-readable diagnostic output
//
#include "doculint/basic/diagnostic_json.hpp"

#include <string>

#include "doculint/basic/diagnostic_printer.hpp"

namespace doculint
{

using nlohmann::json;

json diagnostic_to_json(const Diagnostic & diag, const SourceRegistry & sources)
{
  json j{
    {"severity", std::string(to_string(diag.severity))},
    {"code", diag.code},
    {"message", diag.message},
    {"file", diag.scope},
    {"line", nullptr},
    {"column", nullptr},
    {"offset", nullptr}};

  const SourceRange range = diag.range;
  if (!range.is_valid()) {
    return j;
  }

  j["file"] = sources.get_path(range.file_id()).generic_string();
  j["offset"] = range.get_begin().offset();

  const LineColumn lc = sources.get_line_column(range.get_begin());
  if (lc.is_valid()) {
    j["line"] = lc.line;
    j["column"] = lc.column;
  }
  return j;
}

json diagnostics_to_json(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  json arr = json::array();
  for (const auto & d : diags) {
    arr.push_back(diagnostic_to_json(d, sources));
  }
  return arr;
}

}  // namespace doculint
