// doculint/project/project_config.cpp - Project configuration implementation
//
#include "doculint/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace doculint
{

std::optional<OutputFormat> parse_output_format(std::string_view text)
{
  if (text == "text") return OutputFormat::Text;
  if (text == "json") return OutputFormat::Json;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view text)
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

namespace
{

ConfigLoadResult parse_config(const YAML::Node & root, ProjectConfig config)
{
  if (!root.IsDefined() || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'packages' section
  if (root["packages"]) {
    if (!root["packages"].IsSequence()) {
      return ConfigLoadResult::fail("packages must be a list");
    }
    for (const auto & pkg : root["packages"]) {
      config.packages.emplace_back(pkg.as<std::string>());
    }
  }

  if (root["entry_package"]) {
    config.entry_package = root["entry_package"].as<std::string>();
    if (config.entry_package.empty()) {
      return ConfigLoadResult::fail("entry_package must not be empty");
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];
    if (!out.IsMap()) {
      return ConfigLoadResult::fail("output must be a map");
    }

    if (out["format"]) {
      const auto text = out["format"].as<std::string>();
      const auto format = parse_output_format(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + text + "' (must be 'text' or 'json')");
      }
      config.output.format = *format;
    }

    if (out["color"]) {
      const auto text = out["color"].as<std::string>();
      const auto color = parse_color_mode(text);
      if (!color) {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')");
      }
      config.output.color = *color;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
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

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    return parse_config(root, std::move(config));
  } catch (const YAML::Exception & e) {
    // scalar conversions, e.g. a map where a string is expected
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
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

}  // namespace doculint
