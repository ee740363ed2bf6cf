// defcheck/basic/violation.cpp - Violation bag implementation
#include "defcheck/basic/violation.hpp"

#include <utility>

#include "defcheck/basic/string_utils.hpp"

namespace defcheck
{

std::optional<Severity> parse_severity(std::string_view s) noexcept
{
  if (s == "critical" || s == "error" || s == "high") return Severity::Critical;
  if (s == "warning" || s == "medium") return Severity::Warning;
  if (s == "info" || s == "low") return Severity::Info;
  return std::nullopt;
}

// ============================================================================
// ViolationBuilder
// ============================================================================

ViolationBuilder::ViolationBuilder(ViolationBag & bag, Violation violation)
: bag_(bag), violation_(std::move(violation))
{
}

ViolationBuilder::ViolationBuilder(ViolationBuilder && other) noexcept
: bag_(other.bag_), violation_(std::move(other.violation_)), active_(other.active_)
{
  other.active_ = false;
}

ViolationBuilder::~ViolationBuilder()
{
  if (active_) {
    bag_.add(std::move(violation_));
  }
}

ViolationBuilder & ViolationBuilder::with_suggestion(std::string suggestion)
{
  violation_.suggestion = std::move(suggestion);
  return *this;
}

// ============================================================================
// ViolationBag
// ============================================================================

Violation ViolationBag::make(
  uint32_t line, uint32_t column, ViolationType type, Severity severity,
  std::string description) const
{
  Violation v;
  v.file = source_->display_name();
  v.line = line;
  v.column = column;
  v.type = type;
  v.severity = severity;
  v.description = std::move(description);
  v.snippet = std::string(trim(source_->line_text(line)));
  return v;
}

ViolationBuilder ViolationBag::report(
  SourceRange range, ViolationType type, Severity severity, std::string description)
{
  const LineColumn lc = range.is_valid() ? source_->get_line_column(range.begin()) : LineColumn{};
  return {*this, make(lc.line, lc.column, type, severity, std::move(description))};
}

ViolationBuilder ViolationBag::report_line(
  uint32_t line, ViolationType type, Severity severity, std::string description)
{
  uint32_t column = 1;
  const std::string_view text = source_->line_text(line);
  while (column <= text.size() && (text[column - 1] == ' ' || text[column - 1] == '\t')) {
    ++column;
  }
  return {*this, make(line, column, type, severity, std::move(description))};
}

void ViolationBag::add(Violation && v)
{
  if (v.line == 0 || v.line > source_->line_count()) {
    ++dropped_;
    return;
  }
  violations_.push_back(std::move(v));
}

void ViolationBag::merge(std::vector<Violation> && other)
{
  for (auto & v : other) {
    add(std::move(v));
  }
  other.clear();
}

}  // namespace defcheck
