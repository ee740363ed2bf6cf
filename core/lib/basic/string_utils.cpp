// defcheck/basic/string_utils.cpp
#include "defcheck/basic/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace defcheck
{

namespace
{

bool is_alnum(char c) noexcept { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

}  // namespace

std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string_view trim(std::string_view s) noexcept
{
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])) != 0) {
    ++b;
  }
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) {
    --e;
  }
  return s.substr(b, e - b);
}

bool contains_any(std::string_view haystack, const std::vector<std::string> & needles)
{
  return std::any_of(needles.begin(), needles.end(), [&](const std::string & n) {
    return !n.empty() && contains(haystack, n);
  });
}

bool contains_word(std::string_view text, std::string_view word)
{
  if (word.empty()) {
    return false;
  }
  const std::string hay = to_lower(text);
  const std::string needle = to_lower(word);

  size_t pos = hay.find(needle);
  while (pos != std::string::npos) {
    const bool left_ok = pos == 0 || !is_alnum(hay[pos - 1]);
    size_t after = pos + needle.size();
    if (after < hay.size() && hay[after] == 's') {
      const bool plural_end = after + 1 >= hay.size() || !is_alnum(hay[after + 1]);
      if (plural_end) {
        ++after;
      }
    }
    const bool right_ok = after >= hay.size() || !is_alnum(hay[after]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = hay.find(needle, pos + 1);
  }
  return false;
}

std::string regex_escape(std::string_view s)
{
  static constexpr std::string_view k_special = R"(\^$.|?*+()[]{}/)";
  std::string out;
  out.reserve(s.size() * 2);
  for (const char c : s) {
    if (k_special.find(c) != std::string_view::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

bool is_comment_line(std::string_view line) noexcept
{
  const std::string_view t = trim(line);
  return t.empty() || t.front() == '#';
}

}  // namespace defcheck
