// defcheck/project/project_config.cpp - Project configuration implementation
//
#include "defcheck/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace defcheck
{

namespace
{

/// Parse a list of strings; returns false if the node is not a sequence
bool parse_string_list(const YAML::Node & node, std::vector<std::string> & out)
{
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

}  // namespace

ProjectConfig default_project_config(const std::filesystem::path & root)
{
  ProjectConfig config;
  config.project_root = std::filesystem::absolute(root);
  return config;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config = default_project_config(fs::absolute(config_path).parent_path());

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("defcheck.yaml must contain a map at the top level");
  }

  try {
    // Parse 'analysis' section
    if (root["analysis"]) {
      const auto & an = root["analysis"];

      if (an["paths"]) {
        std::vector<std::string> paths;
        if (!parse_string_list(an["paths"], paths)) {
          return ConfigLoadResult::fail("analysis.paths must be a list");
        }
        for (const auto & p : paths) {
          config.analysis.paths.emplace_back(p);
        }
      }

      if (an["exclude"] && !parse_string_list(an["exclude"], config.analysis.exclude)) {
        return ConfigLoadResult::fail("analysis.exclude must be a list");
      }

      if (an["skip_tests"]) {
        config.analysis.skip_tests = an["skip_tests"].as<bool>();
      }

      if (an["jobs"]) {
        const int jobs = an["jobs"].as<int>();
        if (jobs < 0) {
          return ConfigLoadResult::fail("analysis.jobs must not be negative");
        }
        config.analysis.jobs = static_cast<unsigned>(jobs);
      }

      if (an["lookback_lines"]) {
        const int lines = an["lookback_lines"].as<int>();
        if (lines < 1) {
          return ConfigLoadResult::fail("analysis.lookback_lines must be at least 1");
        }
        config.analysis.lookback_lines = static_cast<uint32_t>(lines);
      }

      if (an["max_file_bytes"]) {
        config.analysis.max_file_bytes = an["max_file_bytes"].as<uint64_t>();
      }
    }

    // Parse 'patterns' entry
    if (root["patterns"]) {
      config.patterns = root["patterns"].as<std::string>();
    }

    // Parse 'integration' section
    if (root["integration"]) {
      const auto & in = root["integration"];
      if (in["components_dir"]) {
        config.integration.components_dir = in["components_dir"].as<std::string>();
      }
      if (in["contracts_dir"]) {
        config.integration.contracts_dir = in["contracts_dir"].as<std::string>();
      }
      if (in["timeout_overhead"]) {
        config.integration.timeout_overhead = in["timeout_overhead"].as<int>();
        if (config.integration.timeout_overhead < 0) {
          return ConfigLoadResult::fail("integration.timeout_overhead must not be negative");
        }
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
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

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace defcheck
