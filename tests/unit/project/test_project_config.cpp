// tests/unit/project/test_project_config.cpp - doculint.yaml loading

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "doculint/project/project_config.hpp"

using namespace doculint;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(std::string_view prefix)
  {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

fs::path write_config(const fs::path & dir, const std::string & text)
{
  const fs::path p = dir / k_project_config_file_name;
  std::ofstream out(p);
  out << text;
  return p;
}

}  // namespace

TEST(ProjectConfig, LoadsAllSections)
{
  const TempDir dir("doculint_cfg_full");
  const auto path = write_config(
    dir.path,
    "packages:\n"
    "  - dumps/mypkg.json\n"
    "  - dumps/main.json\n"
    "entry_package: cmd\n"
    "output:\n"
    "  format: json\n"
    "  color: never\n");

  const auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.config.packages.size(), 2U);
  EXPECT_EQ(result.config.packages[0], fs::path("dumps/mypkg.json"));
  EXPECT_EQ(result.config.entry_package, "cmd");
  EXPECT_EQ(result.config.output.format, OutputFormat::Json);
  EXPECT_EQ(result.config.output.color, ColorMode::Never);
  EXPECT_EQ(result.config.project_root, fs::absolute(path).parent_path());
}

TEST(ProjectConfig, EmptyFileUsesDefaults)
{
  const TempDir dir("doculint_cfg_empty");
  const auto result = load_project_config(write_config(dir.path, ""));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.packages.empty());
  EXPECT_EQ(result.config.entry_package, "main");
  EXPECT_EQ(result.config.output.format, OutputFormat::Text);
  EXPECT_EQ(result.config.output.color, ColorMode::Auto);
}

TEST(ProjectConfig, RejectsUnknownFormat)
{
  const TempDir dir("doculint_cfg_format");
  const auto result = load_project_config(write_config(dir.path, "output:\n  format: xml\n"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid output.format: 'xml' (must be 'text' or 'json')");
}

TEST(ProjectConfig, RejectsUnknownColorMode)
{
  const TempDir dir("doculint_cfg_color");
  const auto result = load_project_config(write_config(dir.path, "output:\n  color: rainbow\n"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid output.color: 'rainbow'"), std::string::npos);
}

TEST(ProjectConfig, RejectsScalarPackages)
{
  const TempDir dir("doculint_cfg_pkgs");
  const auto result = load_project_config(write_config(dir.path, "packages: mypkg.json\n"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "packages must be a list");
}

TEST(ProjectConfig, RejectsEmptyEntryPackage)
{
  const TempDir dir("doculint_cfg_entry");
  const auto result = load_project_config(write_config(dir.path, "entry_package: \"\"\n"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "entry_package must not be empty");
}

TEST(ProjectConfig, RejectsNonMapRoot)
{
  const TempDir dir("doculint_cfg_root");
  const auto result = load_project_config(write_config(dir.path, "- a\n- b\n"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration root must be a map");
}

TEST(ProjectConfig, MissingFileFails)
{
  const auto result = load_project_config("/nonexistent/doculint/doculint.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesParentDirectories)
{
  const TempDir dir("doculint_cfg_find");
  const auto config = write_config(dir.path, "packages: []\n");
  const fs::path nested = dir.path / "a" / "b";
  fs::create_directories(nested);

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(fs::equivalent(*found, config));
}

TEST(ProjectConfig, ParsesOutputKeywords)
{
  EXPECT_EQ(parse_output_format("text"), OutputFormat::Text);
  EXPECT_EQ(parse_output_format("json"), OutputFormat::Json);
  EXPECT_FALSE(parse_output_format("JSON").has_value());
  EXPECT_EQ(parse_color_mode("always"), ColorMode::Always);
  EXPECT_FALSE(parse_color_mode("").has_value());
}
