// defcheck/rules/pattern_library.cpp - Rule file loading
//
#include "defcheck/rules/pattern_library.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <functional>
#include <optional>
#include <regex>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

namespace
{

/// Thrown for semantic errors in an otherwise well-formed file
struct RuleError
{
  std::string message;
};

std::vector<std::string> as_string_list(const YAML::Node & node, const std::string & where)
{
  std::vector<std::string> out;
  if (!node) return out;
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return out;
  }
  if (!node.IsSequence()) {
    throw RuleError{where + " must be a string or a list of strings"};
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

void assign_list(
  const YAML::Node & parent, const char * key, std::vector<std::string> & target,
  const std::string & where)
{
  if (parent[key]) {
    target = as_string_list(parent[key], where + "." + key);
  }
}

Severity parse_severity_node(const YAML::Node & node, const std::string & where)
{
  const std::string text = to_lower(node.as<std::string>());
  const auto s = parse_severity(text);
  if (!s) {
    throw RuleError{"invalid severity '" + text + "' in " + where};
  }
  return *s;
}

std::vector<std::string> lower_all(std::vector<std::string> v)
{
  for (auto & s : v) {
    s = to_lower(s);
  }
  return v;
}

RequiredElement parse_element(
  const std::string & name, const YAML::Node & node, Severity default_severity,
  const std::string & where)
{
  RequiredElement e;
  e.name = name;
  e.severity = default_severity;

  if (!node || node.IsNull()) {
    e.keywords = {to_lower(name)};
    return e;
  }
  if (node.IsSequence() || node.IsScalar()) {
    e.keywords = lower_all(as_string_list(node, where));
    return e;
  }
  if (!node.IsMap()) {
    throw RuleError{where + " must be a map"};
  }

  e.keywords = lower_all(as_string_list(node["keywords"], where + ".keywords"));
  if (e.keywords.empty()) {
    e.keywords = {to_lower(name)};
  }
  if (node["severity"]) {
    e.severity = parse_severity_node(node["severity"], where);
  }
  if (node["optional"]) {
    e.optional = node["optional"].as<bool>();
  }
  if (node["fix_strategy"]) {
    e.fix_strategy = node["fix_strategy"].as<std::string>();
  }
  return e;
}

std::vector<RequiredElement> parse_elements(
  const YAML::Node & node, Severity default_severity, const std::string & where)
{
  std::vector<RequiredElement> out;
  if (node.IsMap()) {
    for (const auto & kv : node) {
      const auto name = kv.first.as<std::string>();
      out.push_back(parse_element(name, kv.second, default_severity, where + "." + name));
    }
    return out;
  }
  if (!node.IsSequence()) {
    throw RuleError{where + " must be a map or a list"};
  }
  for (const auto & item : node) {
    if (item.IsScalar()) {
      const auto name = item.as<std::string>();
      out.push_back(parse_element(name, YAML::Node(), default_severity, where + "." + name));
    } else if (item.IsMap() && item["name"]) {
      const auto name = item["name"].as<std::string>();
      out.push_back(parse_element(name, item, default_severity, where + "." + name));
    } else {
      throw RuleError{where + " entries must be names or maps with a 'name' key"};
    }
  }
  return out;
}

void validate_regexes(const std::vector<std::string> & patterns, const std::string & where)
{
  for (const auto & p : patterns) {
    try {
      const std::regex re(p, std::regex::ECMAScript | std::regex::icase);
      (void)re;
    } catch (const std::regex_error & e) {
      throw RuleError{"invalid regex '" + p + "' in " + where + ": " + e.what()};
    }
  }
}

PatternRule parse_rule(const std::string & id, const YAML::Node & node, const PatternRule * base)
{
  const std::string where = "business_logic_patterns." + id;
  if (!node.IsMap()) {
    throw RuleError{where + " must be a map"};
  }

  PatternRule r = base ? *base : PatternRule{};
  r.id = id;
  if (r.name.empty()) {
    r.name = id;
  }
  if (node["name"]) {
    r.name = node["name"].as<std::string>();
  }
  if (node["detection_keywords"]) {
    r.detection_keywords =
      lower_all(as_string_list(node["detection_keywords"], where + ".detection_keywords"));
  }
  if (node["detection_pattern"]) {
    r.detection_patterns =
      as_string_list(node["detection_pattern"], where + ".detection_pattern");
  }
  if (node["detection_patterns"]) {
    r.detection_patterns =
      as_string_list(node["detection_patterns"], where + ".detection_patterns");
  }
  validate_regexes(r.detection_patterns, where);

  if (node["severity"]) {
    r.severity = parse_severity_node(node["severity"], where);
  }
  if (node["required_elements"]) {
    r.required_elements =
      parse_elements(node["required_elements"], r.severity, where + ".required_elements");
  } else if (node["must_specify"]) {
    r.required_elements =
      parse_elements(node["must_specify"], r.severity, where + ".must_specify");
  }
  if (node["fix_strategy"]) {
    r.fix_strategy = node["fix_strategy"].as<std::string>();
  }

  if (r.detection_keywords.empty() && r.detection_patterns.empty()) {
    throw RuleError{where + " has neither detection_keywords nor detection_pattern"};
  }
  return r;
}

/// Convert a regex-style call pattern such as `\.execute\(` to `.execute`
std::string normalize_call_pattern(std::string p)
{
  std::string out;
  out.reserve(p.size());
  for (const char c : p) {
    if (c != '\\') out += c;
  }
  while (!out.empty() && (out.back() == '(' || out.back() == ' ')) {
    out.pop_back();
  }
  return out;
}

RiskyCallGroup parse_call_group(
  const std::string & name, const YAML::Node & node, const RiskyCallGroup * base)
{
  const std::string where = "error_handling_requirements." + name;
  if (!node.IsMap()) {
    throw RuleError{where + " must be a map"};
  }

  RiskyCallGroup g = base ? *base : RiskyCallGroup{};
  g.name = name;
  if (g.description.empty()) {
    g.description = "Risky operation without error handling";
  }

  std::vector<std::string> patterns;
  if (node["call_patterns"]) {
    patterns = as_string_list(node["call_patterns"], where + ".call_patterns");
  } else if (node["detection_patterns"]) {
    patterns = as_string_list(node["detection_patterns"], where + ".detection_patterns");
  }
  if (!patterns.empty()) {
    g.call_patterns.clear();
    for (auto & p : patterns) {
      auto normalized = normalize_call_pattern(std::move(p));
      if (!normalized.empty()) {
        g.call_patterns.push_back(std::move(normalized));
      }
    }
  }
  if (node["severity"]) {
    g.severity = parse_severity_node(node["severity"], where);
  }
  if (node["with_statement_ok"]) {
    g.with_statement_ok = node["with_statement_ok"].as<bool>();
  }
  if (node["description"]) {
    g.description = node["description"].as<std::string>();
  }
  if (node["fix_strategy"]) {
    g.fix_strategy = node["fix_strategy"].as<std::string>();
  }
  if (g.call_patterns.empty()) {
    throw RuleError{where + " has no call_patterns"};
  }
  return g;
}

PatternLibrary parse_library(const YAML::Node & root)
{
  PatternLibrary lib = PatternLibrary::builtin();

  if (!root || root.IsNull()) {
    return lib;
  }
  if (!root.IsMap()) {
    throw RuleError{"rule file must contain a map at the top level"};
  }

  if (const auto rules = root["business_logic_patterns"]) {
    if (!rules.IsMap()) {
      throw RuleError{"business_logic_patterns must be a map"};
    }
    for (const auto & kv : rules) {
      const auto id = kv.first.as<std::string>();
      auto it = std::find_if(
        lib.business_rules.begin(), lib.business_rules.end(),
        [&](const PatternRule & r) { return r.id == id; });
      if (it != lib.business_rules.end()) {
        *it = parse_rule(id, kv.second, &*it);
      } else {
        lib.business_rules.push_back(parse_rule(id, kv.second, nullptr));
      }
    }
  }

  if (const auto groups = root["error_handling_requirements"]) {
    if (!groups.IsMap()) {
      throw RuleError{"error_handling_requirements must be a map"};
    }
    for (const auto & kv : groups) {
      const auto name = kv.first.as<std::string>();
      auto it = std::find_if(
        lib.error_handling.begin(), lib.error_handling.end(),
        [&](const RiskyCallGroup & g) { return g.name == name; });
      if (it != lib.error_handling.end()) {
        *it = parse_call_group(name, kv.second, &*it);
      } else {
        lib.error_handling.push_back(parse_call_group(name, kv.second, nullptr));
      }
    }
  }

  if (const auto sec = root["security_patterns"]) {
    const std::string where = "security_patterns";
    assign_list(sec, "pii_fields", lib.security.pii_fields, where);
    assign_list(sec, "sql_keywords", lib.security.sql_keywords, where);
    assign_list(sec, "logging_methods", lib.security.logging_methods, where);
    assign_list(sec, "logger_receivers", lib.security.logger_receivers, where);
    assign_list(sec, "route_decorators", lib.security.route_decorators, where);
    assign_list(sec, "auth_markers", lib.security.auth_markers, where);
    assign_list(sec, "public_endpoints", lib.security.public_endpoints, where);
  }

  if (const auto ns = root["null_safety"]) {
    assign_list(ns, "safe_accessors", lib.null_safety.safe_accessors, "null_safety");
    assign_list(ns, "safe_receivers", lib.null_safety.safe_receivers, "null_safety");
  }

  if (root["allowed_modules"]) {
    const auto extra = as_string_list(root["allowed_modules"], "allowed_modules");
    lib.allowed_modules.insert(lib.allowed_modules.end(), extra.begin(), extra.end());
  }

  if (const auto iv = root["input_validation"]) {
    if (iv["enabled"]) {
      lib.input_validation.enabled = iv["enabled"].as<bool>();
    }
    if (iv["min_parameters"]) {
      lib.input_validation.min_parameters = iv["min_parameters"].as<size_t>();
    }
    if (iv["keywords"]) {
      lib.input_validation.keywords =
        lower_all(as_string_list(iv["keywords"], "input_validation.keywords"));
    }
  }

  return lib;
}

PatternLoadResult load_from_node(const std::function<YAML::Node()> & loader)
{
  YAML::Node root;
  try {
    root = loader();
  } catch (const YAML::Exception & e) {
    return PatternLoadResult::fail("failed to parse rule file: " + std::string(e.what()));
  }

  try {
    return PatternLoadResult::ok(parse_library(root));
  } catch (const RuleError & e) {
    return PatternLoadResult::fail(e.message);
  } catch (const YAML::Exception & e) {
    return PatternLoadResult::fail("invalid rule file: " + std::string(e.what()));
  }
}

}  // namespace

const PatternRule * PatternLibrary::find_rule(std::string_view id) const noexcept
{
  for (const auto & r : business_rules) {
    if (r.id == id) {
      return &r;
    }
  }
  return nullptr;
}

PatternLoadResult load_pattern_library(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return PatternLoadResult::fail("rule file not found: " + path.string());
  }
  return load_from_node([&]() { return YAML::LoadFile(path.string()); });
}

PatternLoadResult load_pattern_library_from_string(const std::string & text)
{
  return load_from_node([&]() { return YAML::Load(text); });
}

std::shared_ptr<const PatternLibrary> load_pattern_library_or_builtin(
  const std::filesystem::path & path, std::string * error)
{
  auto result = load_pattern_library(path);
  if (result.success) {
    return std::move(result.library);
  }
  if (error != nullptr) {
    *error = std::move(result.error);
  }
  return std::make_shared<const PatternLibrary>(PatternLibrary::builtin());
}

}  // namespace defcheck
