// kleis/project/project_config.cpp - Project configuration implementation
//
#include "kleis/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace kleis
{

namespace
{

namespace fs = std::filesystem;

fs::path resolve_against(const fs::path & root, const std::string & value)
{
  fs::path p(value);
  return p.is_absolute() ? p : (root / p).lexically_normal();
}

/// Parse the 'checker' section; returns an error message on failure
std::optional<std::string> parse_checker(
  const YAML::Node & node, const fs::path & root, CheckerConfig & out)
{
  if (!node.IsMap()) {
    return "checker must be a map";
  }

  if (node["stdlib"]) {
    out.stdlib = node["stdlib"].as<bool>();
  }

  if (node["stdlib_path"]) {
    out.stdlib_path = resolve_against(root, node["stdlib_path"].as<std::string>());
  }

  if (node["load"]) {
    if (!node["load"].IsSequence()) {
      return "checker.load must be a list";
    }
    for (const auto & entry : node["load"]) {
      out.load.push_back(resolve_against(root, entry.as<std::string>()));
    }
  }

  if (node["dispatch"]) {
    const auto text = node["dispatch"].as<std::string>();
    const auto policy = parse_dispatch_policy(text);
    if (!policy) {
      return "invalid checker.dispatch: '" + text + "' (must be 'first_match' or 'most_specific')";
    }
    out.dispatch = *policy;
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

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

    // Parse 'checker' section
    if (root["checker"]) {
      if (auto err = parse_checker(root["checker"], config.project_root, config.checker)) {
        return ConfigLoadResult::fail(*err);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace kleis
