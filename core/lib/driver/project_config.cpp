// xelogen/driver/project_config.cpp - Project configuration implementation
//
#include "xelogen/driver/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace xelogen
{

std::vector<std::filesystem::path> ProjectConfig::catalog_paths() const
{
  std::vector<std::filesystem::path> paths;
  paths.reserve(catalog.files.size());
  for (const auto & file : catalog.files) {
    paths.push_back(file.is_absolute() ? file : project_root / file);
  }
  return paths;
}

namespace
{

ConfigLoadResult parse_config(const YAML::Node & root, ProjectConfig config)
{
  // Parse 'project' section
  if (root["project"]) {
    const auto & project = root["project"];
    if (project["name"]) {
      config.name = project["name"].as<std::string>();
    }
  }

  // Parse 'catalog' section
  if (root["catalog"]) {
    const auto & cat = root["catalog"];

    if (cat["builtin"]) {
      config.catalog.builtin = cat["builtin"].as<bool>();
    }

    if (cat["files"]) {
      if (!cat["files"].IsSequence()) {
        return ConfigLoadResult::fail("catalog.files must be a list");
      }
      for (const auto & file : cat["files"]) {
        config.catalog.files.emplace_back(file.as<std::string>());
      }
    }
  }

  // Parse 'lint' section
  if (root["lint"]) {
    const auto & lint = root["lint"];

    if (lint["disabled"]) {
      if (!lint["disabled"].IsSequence()) {
        return ConfigLoadResult::fail("lint.disabled must be a list");
      }
      for (const auto & pass : lint["disabled"]) {
        config.lint.disabled.push_back(pass.as<std::string>());
      }
    }

    if (lint["warnings_as_errors"]) {
      config.lint.warnings_as_errors = lint["warnings_as_errors"].as<bool>();
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

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    return parse_config(YAML::LoadFile(config_path.string()), std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace xelogen
