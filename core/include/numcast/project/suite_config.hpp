// numcast/project/suite_config.hpp - Suite configuration (numcast.yaml)
//
// Parses and validates numcast.yaml, which lists the conformance scripts a
// `numcast check` run evaluates.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace numcast
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ReportFormat : uint8_t {
  Text,
  Json,
};

[[nodiscard]] std::optional<ReportFormat> parse_report_format(const std::string & name);

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Suite section: which scripts to run and how.
 */
struct SuiteSection
{
  /// Script paths, resolved against the directory of numcast.yaml
  std::vector<std::filesystem::path> scripts;

  /// Stop after the first script that fails
  bool fail_fast = false;

  ReportFormat report = ReportFormat::Text;
};

/**
 * Complete suite configuration (numcast.yaml).
 */
struct SuiteConfig
{
  PackageConfig package;
  SuiteSection suite;

  /// Directory containing numcast.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  SuiteConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(SuiteConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a suite configuration from a numcast.yaml file.
 *
 * Relative script paths are made absolute against the file's directory.
 */
[[nodiscard]] ConfigLoadResult load_suite_config(const std::filesystem::path & config_path);

/**
 * Find numcast.yaml by searching upward from a directory (or a file's
 * directory) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_suite_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_suite_config_file_name = "numcast.yaml";

}  // namespace numcast
