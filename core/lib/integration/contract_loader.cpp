// defcheck/integration/contract_loader.cpp
#include "defcheck/integration/contract_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <string>

#include "defcheck/basic/string_utils.hpp"
#include "defcheck/syntax/frontend.hpp"

namespace defcheck
{

namespace
{

std::string child_path(const std::string & parent, const std::string & key)
{
  return parent.empty() ? key : parent + "." + key;
}

/// Thrown for a contract whose facts cannot be represented
struct ContractError
{
  std::string message;
};

std::optional<int> scalar_seconds(const YAML::Node & node)
{
  if (!node || !node.IsScalar()) return std::nullopt;
  const auto seconds = node.as<double>();
  if (!std::isfinite(seconds) || seconds < 0.0 ||
      seconds > static_cast<double>(k_max_contract_timeout)) {
    throw ContractError{
      "x-timeout must be between 0 and " + std::to_string(k_max_contract_timeout) + " seconds"};
  }
  return static_cast<int>(std::lround(seconds));
}

/// Whether any map in the document declares `format: date-time`
bool declares_date_time(const YAML::Node & node)
{
  if (node.IsMap()) {
    for (const auto & kv : node) {
      if (kv.first.as<std::string>() == "format" && kv.second.IsScalar() &&
          kv.second.as<std::string>() == "date-time") {
        return true;
      }
      if (declares_date_time(kv.second)) return true;
    }
  } else if (node.IsSequence()) {
    for (const auto & item : node) {
      if (declares_date_time(item)) return true;
    }
  }
  return false;
}

std::optional<std::string> id_format_of(const YAML::Node & property)
{
  if (!property.IsMap()) return std::nullopt;
  if (property["format"] && property["format"].IsScalar() &&
      to_lower(property["format"].as<std::string>()) == "uuid") {
    return std::string("UUID");
  }
  if (property["type"] && property["type"].IsScalar()) {
    const std::string type = property["type"].as<std::string>();
    if (type == "integer" || type == "string") return type;
  }
  return std::nullopt;
}

/// Depth-first walk collecting id, enum and nullable facts by dotted path
void collect(const YAML::Node & node, const std::string & path, ContractFacts & facts)
{
  if (node.IsSequence()) {
    size_t i = 0;
    for (const auto & item : node) {
      collect(item, child_path(path, std::to_string(i++)), facts);
    }
    return;
  }
  if (!node.IsMap()) return;

  for (const auto & kv : node) {
    const std::string key = kv.first.as<std::string>();
    const YAML::Node & value = kv.second;

    if (key == "enum" && value.IsSequence()) {
      std::vector<std::string> values;
      for (const auto & v : value) {
        if (v.IsScalar()) values.push_back(v.as<std::string>());
      }
      std::sort(values.begin(), values.end());
      facts.enums[path] = std::move(values);
      continue;
    }

    if (key == "nullable" && value.IsScalar()) {
      facts.nullables[path] = value.as<bool>();
      continue;
    }

    if (!facts.id_format && (key == "id" || ends_with(key, "_id"))) {
      facts.id_format = id_format_of(value);
    }

    collect(value, child_path(path, key), facts);
  }
}

ContractFacts extract(const YAML::Node & root, const std::string & text)
{
  ContractFacts facts;

  if (root.IsMap()) {
    facts.timeout = scalar_seconds(root["x-timeout"]);
    if (!facts.timeout && root["info"] && root["info"].IsMap()) {
      facts.timeout = scalar_seconds(root["info"]["x-timeout"]);
    }
  }

  const std::string lower = to_lower(text);
  if (contains(lower, "iso8601") || contains(lower, "iso-8601")) {
    facts.datetime_format = "ISO8601";
  } else if (contains(lower, "unix") || contains(lower, "epoch")) {
    facts.datetime_format = "Unix timestamp";
  } else if (contains(lower, "rfc3339")) {
    facts.datetime_format = "RFC3339";
  } else if (declares_date_time(root)) {
    facts.datetime_format = "ISO8601";
  }

  collect(root, "", facts);
  return facts;
}

}  // namespace

ContractLoadResult load_contract_from_string(const std::string & text)
{
  try {
    const YAML::Node root = YAML::Load(text);
    if (!root.IsNull() && !root.IsMap()) {
      return ContractLoadResult::fail("contract must contain a map at the top level");
    }
    return ContractLoadResult::ok(extract(root, text));
  } catch (const YAML::Exception & e) {
    return ContractLoadResult::fail("failed to parse contract: " + std::string(e.what()));
  } catch (const ContractError & e) {
    return ContractLoadResult::fail(e.message);
  }
}

ContractLoadResult load_contract(const std::filesystem::path & path)
{
  const auto text = read_file(path);
  if (!text) {
    return ContractLoadResult::fail("cannot read contract: " + path.string());
  }
  auto result = load_contract_from_string(*text);
  if (!result.success) {
    result.error = path.filename().string() + ": " + result.error;
  }
  return result;
}

std::string contract_component_name(const std::filesystem::path & path)
{
  std::string stem = path.stem().string();
  for (const std::string_view suffix : {"_api", "-api"}) {
    if (stem.size() > suffix.size() && ends_with(stem, suffix)) {
      stem.resize(stem.size() - suffix.size());
      break;
    }
  }
  return stem;
}

}  // namespace defcheck
