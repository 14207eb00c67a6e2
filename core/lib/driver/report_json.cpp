// numcast/driver/report_json.cpp - JSON report implementation
//
#include "numcast/driver/report_json.hpp"

namespace numcast
{
namespace
{

using nlohmann::json;

void put_position(json & obj, const SourceRegistry & sources, SourceRange range)
{
  if (range.is_invalid()) {
    obj["path"] = nullptr;
    obj["line"] = nullptr;
    obj["column"] = nullptr;
    return;
  }
  const LineColumn lc = sources.get_line_column(range.get_begin());
  obj["path"] = sources.get_path(range.file_id()).generic_string();
  obj["line"] = lc.line;
  obj["column"] = lc.column;
}

json j_script(const ScriptResult & script, const SourceRegistry & sources)
{
  json assertions = json::array();
  for (const auto & a : script.outcome.assertions) {
    const LineColumn lc = sources.get_line_column(a.range.get_begin());
    assertions.push_back(
      json{{"line", lc.line}, {"column", lc.column}, {"text", a.text}, {"passed", a.passed}});
  }

  return json{
    {"path", script.path.generic_string()},
    {"passed", script.outcome.passed},
    {"failed", script.outcome.failed},
    {"assertions", std::move(assertions)},
  };
}

json j_diagnostic(const Diagnostic & diag, const SourceRegistry & sources)
{
  json obj{
    {"severity", to_string(diag.severity)},
    {"code", diag.code.empty() ? json(nullptr) : json(diag.code)},
    {"message", diag.message},
  };
  put_position(obj, sources, diag.primary_range());
  return obj;
}

}  // namespace

json to_json(const RunResult & result)
{
  json scripts = json::array();
  for (const auto & s : result.scripts) {
    scripts.push_back(j_script(s, *result.sources));
  }

  json diagnostics = json::array();
  for (const auto & d : result.diagnostics) {
    diagnostics.push_back(j_diagnostic(d, *result.sources));
  }

  return json{
    {"success", result.success},
    {"scripts", std::move(scripts)},
    {"diagnostics", std::move(diagnostics)},
  };
}

}  // namespace numcast
