// tests/unit/project/test_project_config.cpp - Unit tests for kleis.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>

#include "kleis/project/project_config.hpp"
#include "kleis/test_support/checker_helpers.hpp"

using namespace kleis;
using test_support::TempDir;

TEST(ProjectConfig, FullConfiguration)
{
  const TempDir dir("kleis_test_config_full");
  const auto path = dir.write("kleis.yaml", R"(
package:
  name: relativity-notes
  version: 0.3.0
checker:
  stdlib: false
  stdlib_path: vendor/std
  load:
    - defs/metric.kleis
    - /abs/extra.kleis
  dispatch: most_specific
)");

  const auto r = load_project_config(path);
  ASSERT_TRUE(r.success) << r.error;
  const ProjectConfig & c = r.config;
  EXPECT_EQ(c.package.name, "relativity-notes");
  EXPECT_EQ(c.package.version, "0.3.0");
  EXPECT_FALSE(c.checker.stdlib);
  EXPECT_EQ(c.checker.dispatch, DispatchPolicy::MostSpecific);

  const auto root = std::filesystem::absolute(dir.path);
  EXPECT_EQ(c.project_root, root);
  ASSERT_TRUE(c.checker.stdlib_path.has_value());
  EXPECT_EQ(*c.checker.stdlib_path, (root / "vendor/std").lexically_normal());
  ASSERT_EQ(c.checker.load.size(), 2u);
  EXPECT_EQ(c.checker.load[0], (root / "defs/metric.kleis").lexically_normal());
  EXPECT_EQ(c.checker.load[1], std::filesystem::path("/abs/extra.kleis"));
}

TEST(ProjectConfig, DefaultsWhenSectionsAreMissing)
{
  const TempDir dir("kleis_test_config_defaults");
  const auto r = load_project_config(dir.write("kleis.yaml", "package:\n  name: bare\n"));
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.checker.stdlib);
  EXPECT_FALSE(r.config.checker.stdlib_path.has_value());
  EXPECT_TRUE(r.config.checker.load.empty());
  EXPECT_EQ(r.config.checker.dispatch, DispatchPolicy::FirstMatch);
}

TEST(ProjectConfig, MissingFile)
{
  const auto r = load_project_config("/nonexistent/kleis.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("configuration file not found: ", 0), 0u);
}

TEST(ProjectConfig, InvalidDispatchPolicy)
{
  const TempDir dir("kleis_test_config_dispatch");
  const auto r = load_project_config(dir.write("kleis.yaml", "checker:\n  dispatch: best\n"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(
    r.error, "invalid checker.dispatch: 'best' (must be 'first_match' or 'most_specific')");
}

TEST(ProjectConfig, LoadMustBeAList)
{
  const TempDir dir("kleis_test_config_load");
  const auto r = load_project_config(dir.write("kleis.yaml", "checker:\n  load: one.kleis\n"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "checker.load must be a list");
}

TEST(ProjectConfig, MalformedYaml)
{
  const TempDir dir("kleis_test_config_malformed");
  const auto r = load_project_config(dir.write("kleis.yaml", "checker: [unclosed\n"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0u);
}

TEST(ProjectConfig, WrongValueTypeIsReported)
{
  const TempDir dir("kleis_test_config_bool");
  const auto r = load_project_config(dir.write("kleis.yaml", "checker:\n  stdlib: maybe\n"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0u);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir("kleis_test_config_find");
  const auto config = dir.write("kleis.yaml", "package:\n  name: up\n");
  const auto nested = dir.write("notes/chapter1/expr.json", "{}");

  const auto from_dir = find_project_config(nested.parent_path());
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_TRUE(std::filesystem::equivalent(*from_dir, config));

  const auto from_file = find_project_config(nested);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_TRUE(std::filesystem::equivalent(*from_file, config));
}
