// doculint/project/project_config.hpp - doculint.yaml project configuration
//
//   packages:            # JSON package dumps, relative to doculint.yaml
//     - build/mypkg.json
//   entry_package: main
//   output:
//     format: text       # text | json
//     color: auto        # auto | always | never
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace doculint
{

inline constexpr const char * k_project_config_file_name = "doculint.yaml";

enum class OutputFormat {
  Text,  ///< Human-readable, source snippets when available
  Json,  ///< One JSON array of findings on stdout
};

enum class ColorMode { Auto, Always, Never };

struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

struct ProjectConfig
{
  std::vector<std::filesystem::path> packages;

  /// Package name whose `main` function is exempt and whose package doc is
  /// not checked.
  std::string entry_package = "main";

  OutputConfig output;

  /// Directory of doculint.yaml; relative package paths resolve against it.
  std::filesystem::path project_root;
};

/// Either a validated configuration or the reason it was rejected.
struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
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
    return r;
  }
};

[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Look for doculint.yaml in `start_dir` and each of its parents.
 *
 * @return Path of the nearest doculint.yaml, std::nullopt when none exists
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text);
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view text);

}  // namespace doculint
