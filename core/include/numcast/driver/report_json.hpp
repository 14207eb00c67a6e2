// numcast/driver/report_json.hpp - Machine-readable run report
//
// Serializes a RunResult to nlohmann::json for `numcast check --format json`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "numcast/driver/runner.hpp"

namespace numcast
{

/**
 * Build the JSON report for a run.
 *
 * Line/column values are 1-based, or null when a diagnostic has no source
 * location (missing file, bad configuration).
 */
[[nodiscard]] nlohmann::json to_json(const RunResult & result);

}  // namespace numcast
