// tests/unit/project/test_project_config.cpp - itl.yaml loading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "itl/project/project_config.hpp"

using namespace itl;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

std::filesystem::path write_config(const TempDir & dir, const std::string & content)
{
  const std::filesystem::path file = dir.path / k_project_config_file_name;
  std::ofstream f(file);
  f << content;
  return file;
}

}  // namespace

TEST(ProjectConfig, LoadsAllSections)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "itl_cfg_full");
  const auto file = write_config(dir,
                                 "package:\n"
                                 "  name: feeds\n"
                                 "  version: \"0.3.0\"\n"
                                 "schema:\n"
                                 "  documents:\n"
                                 "    - schemas/a.json\n"
                                 "    - schemas/b.json\n"
                                 "  legacy_kinds: true\n"
                                 "  strict_keys: false\n");

  const auto result = load_project_config(file);
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.package.name, "feeds");
  EXPECT_EQ(cfg.package.version, "0.3.0");
  ASSERT_EQ(cfg.schema.documents.size(), 2u);
  EXPECT_EQ(cfg.schema.documents[1], std::filesystem::path("schemas/b.json"));
  EXPECT_EQ(cfg.project_root, std::filesystem::absolute(dir.path));

  const GrammarOptions options = cfg.grammar_options();
  EXPECT_TRUE(options.legacy_kinds);
  EXPECT_FALSE(options.strict_keys);
}

TEST(ProjectConfig, DefaultsWhenSectionsAreOmitted)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "itl_cfg_defaults");
  const auto file = write_config(dir, "package:\n  name: bare\n");

  const auto result = load_project_config(file);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.schema.documents.empty());
  EXPECT_FALSE(result.config.schema.legacy_kinds);
  EXPECT_TRUE(result.config.schema.strict_keys);
}

TEST(ProjectConfig, MissingFile)
{
  const auto result =
    load_project_config(std::filesystem::temp_directory_path() / "itl_cfg_absent" / "itl.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos) << result.error;
}

TEST(ProjectConfig, RejectsMalformedContent)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "itl_cfg_bad");

  const std::pair<const char *, const char *> cases[] = {
    {"", "empty"},
    {"- a\n- b\n", "root must be a map"},
    {"schema:\n  documents: a.json\n", "documents must be a list"},
    {"schema:\n  legacy_kinds: sometimes\n", "legacy_kinds must be a boolean"},
    {"schema:\n  strict_keys: [1]\n", "strict_keys must be a boolean"},
    {"package: [x]\n", "package must be a map"},
    {"schema: {documents: [a.json\n", "failed to parse YAML"},
  };

  for (const auto & [content, expected] : cases) {
    const auto file = write_config(dir, content);
    const auto result = load_project_config(file);
    EXPECT_FALSE(result.success) << content;
    EXPECT_NE(result.error.find(expected), std::string::npos)
      << "content: " << content << "\nerror: " << result.error;
  }
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "itl_cfg_find");
  const auto file = write_config(dir, "package:\n  name: up\n");
  const auto nested = dir.path / "schemas" / "v1";
  std::filesystem::create_directories(nested);

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::absolute(*found), std::filesystem::absolute(file));

  // A file path starts the search from its directory
  const auto doc = nested / "feed.json";
  std::ofstream(doc) << "{}";
  const auto from_file = find_project_config(doc);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(std::filesystem::absolute(*from_file), std::filesystem::absolute(file));
}

TEST(ProjectConfig, FormattedConfigLoadsBack)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "itl_cfg_format");

  ProjectConfig cfg;
  cfg.package.name = "o'brien: \"feeds\" #1";
  cfg.package.version = "0.1.0";
  cfg.schema.documents.emplace_back("./schemas/it's.json");
  cfg.schema.legacy_kinds = true;
  cfg.schema.strict_keys = false;

  const auto file = write_config(dir, format_project_config(cfg));
  const auto result = load_project_config(file);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, cfg.package.name);
  EXPECT_EQ(result.config.package.version, "0.1.0");
  ASSERT_EQ(result.config.schema.documents.size(), 1u);
  EXPECT_EQ(result.config.schema.documents[0], std::filesystem::path("./schemas/it's.json"));
  EXPECT_TRUE(result.config.schema.legacy_kinds);
  EXPECT_FALSE(result.config.schema.strict_keys);
}
