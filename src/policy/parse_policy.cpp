#include "ox_traj/parse_policy.hpp"
#include <charconv>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace oxt {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// fast_float and from_chars both reject an explicit '+'; trajectory writers may emit one.
static std::string_view drop_plus(std::string_view s) {
  if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+') s.remove_prefix(1);
  return s;
}

std::optional<double> parse_double(std::string_view s) {
  s = drop_plus(s);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
  s = drop_plus(s);
  if (s.empty()) return std::nullopt;
  std::uint64_t out;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

void split_tokens(std::string_view s, TokenSplit split, std::vector<std::string_view>& out) {
  out.clear();
  if (split == TokenSplit::Strict) {
    std::size_t start = 0;
    while (true) {
      std::size_t pos = s.find(' ', start);
      if (pos == std::string_view::npos) { out.push_back(s.substr(start)); break; }
      out.push_back(s.substr(start, pos - start));
      start = pos + 1;
    }
    return;
  }

  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    std::size_t j = i;
    while (j < s.size() && s[j] != ' ' && s[j] != '\t') ++j;
    if (j > i) out.push_back(s.substr(i, j - i));
    i = j;
  }
}

std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
  return s;
}

}
