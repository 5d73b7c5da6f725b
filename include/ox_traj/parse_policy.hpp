#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace oxt {

// How value lists ("b = 1 2 3", particle rows) are cut into tokens.
//   Strict   -> split on every single ' '; "1  2" yields an empty token, which fails
//   Collapse -> split on runs of ' ' / '\t'
enum class TokenSplit { Strict, Collapse };

struct ParseConfig {
  TokenSplit split = TokenSplit::Strict;
};

// Numeric parse (fast_float in .cpp). The whole token must be consumed.
std::optional<double> parse_double(std::string_view s);

// Unsigned decimal integer; the whole token must be consumed.
std::optional<std::uint64_t> parse_u64(std::string_view s);

// Cut `s` into tokens per `split`. Views point into `s`.
void split_tokens(std::string_view s, TokenSplit split, std::vector<std::string_view>& out);

// Strip leading/trailing ASCII whitespace.
std::string_view trim(std::string_view s) noexcept;

}
