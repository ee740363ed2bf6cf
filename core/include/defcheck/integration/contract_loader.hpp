// defcheck/integration/contract_loader.hpp - Facts extracted from API contract files
//
// Contracts are OpenAPI-style YAML (or JSON) documents. Only the facts the
// integration predictor compares are extracted; the rest is ignored.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace defcheck
{

/// Largest `x-timeout` accepted, in seconds
inline constexpr int k_max_contract_timeout = 7 * 24 * 60 * 60;

struct ContractFacts
{
  /// `x-timeout` or `info.x-timeout`, in seconds
  std::optional<int> timeout;

  /// "ISO8601", "Unix timestamp" or "RFC3339"
  std::optional<std::string> datetime_format;

  /// "UUID", "integer" or "string", from the first `id`/`*_id` property
  std::optional<std::string> id_format;

  /// Dotted schema path -> sorted enum values
  std::map<std::string, std::vector<std::string>> enums;

  /// Dotted schema path -> nullable flag
  std::map<std::string, bool> nullables;
};

struct ContractLoadResult
{
  ContractFacts facts;
  bool success = false;
  std::string error;

  static ContractLoadResult ok(ContractFacts f)
  {
    ContractLoadResult r;
    r.facts = std::move(f);
    r.success = true;
    return r;
  }

  static ContractLoadResult fail(std::string msg)
  {
    ContractLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

[[nodiscard]] ContractLoadResult load_contract(const std::filesystem::path & path);

[[nodiscard]] ContractLoadResult load_contract_from_string(const std::string & text);

/// Component a contract file describes: file stem without `_api` / `-api`
[[nodiscard]] std::string contract_component_name(const std::filesystem::path & path);

}  // namespace defcheck
