// defcheck/basic/analysis_note.hpp - Records for files that could not be analyzed
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace defcheck
{

enum class NoteKind : uint8_t {
  ParseError,
  IoError,
  ConfigError,
  Skipped,
  InternalError,
};

[[nodiscard]] constexpr std::string_view to_string(NoteKind k) noexcept
{
  switch (k) {
    case NoteKind::ParseError:
      return "parse_error";
    case NoteKind::IoError:
      return "io_error";
    case NoteKind::ConfigError:
      return "config_error";
    case NoteKind::Skipped:
      return "skipped";
    case NoteKind::InternalError:
      return "internal_error";
  }
  return "";
}

/**
 * Low-severity record that a file (or configuration) was not analyzed.
 * Notes never count as violations.
 */
struct AnalysisNote
{
  std::string file;
  NoteKind kind = NoteKind::Skipped;
  std::string message;
};

}  // namespace defcheck
