// defcheck/basic/violation.hpp - Violation records and their RAII builder
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "defcheck/basic/source_file.hpp"

namespace defcheck
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for violations and predicted failures.
 * Declaration order is also the report order (most severe first).
 */
enum class Severity : uint8_t {
  Critical,
  Warning,
  Info,
};

enum class ViolationType : uint8_t {
#define VIOLATION_TYPE(Kind, Snake) Kind,
#include "defcheck/basic/violation_types.def"
};

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Critical:
      return "critical";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ViolationType t) noexcept
{
  switch (t) {
#define VIOLATION_TYPE(Kind, Snake) \
  case ViolationType::Kind:         \
    return Snake;
#include "defcheck/basic/violation_types.def"
  }
  return "";
}

[[nodiscard]] std::optional<Severity> parse_severity(std::string_view s) noexcept;

struct Violation
{
  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;
  ViolationType type = ViolationType::NullSafety;
  Severity severity = Severity::Warning;
  std::string description;
  std::string snippet;     ///< Trimmed text of the offending line
  std::string suggestion;  ///< Fix suggestion (may be empty)
};

// ============================================================================
// Forward Declarations
// ============================================================================

class ViolationBag;

// ============================================================================
// ViolationBuilder
// ============================================================================

/**
 * Builds a violation fluently and hands it to the bag in its destructor (RAII).
 */
class ViolationBuilder
{
public:
  ViolationBuilder(ViolationBag & bag, Violation violation);

  ViolationBuilder(const ViolationBuilder &) = delete;
  ViolationBuilder & operator=(const ViolationBuilder &) = delete;

  ViolationBuilder(ViolationBuilder && other) noexcept;

  ~ViolationBuilder();

  ViolationBuilder & with_suggestion(std::string suggestion);

private:
  ViolationBag & bag_;
  Violation violation_;
  bool active_ = true;
};

// ============================================================================
// ViolationBag
// ============================================================================

/**
 * Collects the violations produced for one source file.
 *
 * Positions are resolved against the bound SourceFile. Violations whose line
 * lies outside the file are discarded, so every stored (file, line) pair
 * refers to a real line.
 */
class ViolationBag
{
public:
  explicit ViolationBag(const SourceFile & source) : source_(&source) {}

  // Builder Starters
  ViolationBuilder report(
    SourceRange range, ViolationType type, Severity severity, std::string description);

  ViolationBuilder report_line(
    uint32_t line, ViolationType type, Severity severity, std::string description);

  void add(Violation && v);

  // Accessors
  [[nodiscard]] const std::vector<Violation> & all() const { return violations_; }
  [[nodiscard]] bool empty() const { return violations_.empty(); }
  [[nodiscard]] size_t size() const { return violations_.size(); }
  [[nodiscard]] size_t dropped() const noexcept { return dropped_; }

  [[nodiscard]] std::vector<Violation> take() { return std::move(violations_); }

  void merge(std::vector<Violation> && other);

private:
  [[nodiscard]] Violation make(
    uint32_t line, uint32_t column, ViolationType type, Severity severity,
    std::string description) const;

  const SourceFile * source_;
  std::vector<Violation> violations_;
  size_t dropped_ = 0;
};

}  // namespace defcheck
