// numcast/project/suite_config.cpp - Suite configuration implementation
//
#include "numcast/project/suite_config.hpp"

#include <yaml-cpp/yaml.h>

namespace numcast
{

std::optional<ReportFormat> parse_report_format(const std::string & name)
{
  if (name == "text") {
    return ReportFormat::Text;
  }
  if (name == "json") {
    return ReportFormat::Json;
  }
  return std::nullopt;
}

ConfigLoadResult load_suite_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  SuiteConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'suite' section
    const YAML::Node suite = root["suite"];
    if (!suite) {
      return ConfigLoadResult::fail("missing 'suite' section");
    }

    const YAML::Node scripts = suite["scripts"];
    if (!scripts) {
      return ConfigLoadResult::fail("suite.scripts is required");
    }
    if (!scripts.IsSequence()) {
      return ConfigLoadResult::fail("suite.scripts must be a list");
    }
    for (const auto & s : scripts) {
      fs::path p = s.as<std::string>();
      if (p.is_relative()) {
        p = config.project_root / p;
      }
      config.suite.scripts.push_back(p.lexically_normal());
    }
    if (config.suite.scripts.empty()) {
      return ConfigLoadResult::fail("suite.scripts must list at least one script");
    }

    if (suite["fail_fast"]) {
      config.suite.fail_fast = suite["fail_fast"].as<bool>();
    }

    if (suite["report"]) {
      const auto name = suite["report"].as<std::string>();
      const auto format = parse_report_format(name);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid suite.report: '" + name + "' (must be 'text' or 'json')");
      }
      config.suite.report = *format;
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_suite_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_suite_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace numcast
