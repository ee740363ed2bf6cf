// defcheck/basic/string_utils.hpp - Small string helpers shared by the analyzers
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace defcheck
{

[[nodiscard]] std::string to_lower(std::string_view s);

/// Strip leading and trailing ASCII whitespace
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) noexcept
{
  return haystack.find(needle) != std::string_view::npos;
}

[[nodiscard]] inline bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] inline bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// True when any needle occurs in the haystack (both compared as given)
[[nodiscard]] bool contains_any(std::string_view haystack, const std::vector<std::string> & needles);

/**
 * Find `word` in `text` bounded by non-alphanumeric characters on both sides.
 *
 * Underscore counts as a separator so `user_password` matches `password`.
 * A single trailing `s` is accepted for plurals. Comparison is
 * case-insensitive.
 */
[[nodiscard]] bool contains_word(std::string_view text, std::string_view word);

/// Escape ECMAScript regex metacharacters
[[nodiscard]] std::string regex_escape(std::string_view s);

[[nodiscard]] std::string join(const std::vector<std::string> & parts, std::string_view sep);

/// Whether `line` is empty or only a `#` comment
[[nodiscard]] bool is_comment_line(std::string_view line) noexcept;

}  // namespace defcheck
