#include "ox_traj/record_parser.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oxt {

static bool format_error(Error* err, std::string msg) {
  return fail(err, ErrorKind::Format, std::move(msg));
}

// Locate header line `index`, check "<prefix> =" and hand back the trimmed value text.
static bool header_value(const std::vector<std::string>& lines, std::size_t index, char prefix,
                         const char* name, std::string_view& value, Error* err) {
  if (index >= lines.size())
    return format_error(err, std::string("missing ") + name + " header line");

  std::string_view line = lines[index];
  if (line.empty() || line.front() != prefix)
    return format_error(err, std::string("line ") + name + " does not start with " + prefix +
                             ": " + std::string(line));

  std::string_view rest = trim(line.substr(1));
  if (rest.empty() || rest.front() != '=')
    return format_error(err, std::string("invalid ") + name + " header format: " + std::string(line));

  value = trim(rest.substr(1));
  return true;
}

// Parse exactly `count` floats from `text` into `out`.
static bool parse_values(std::string_view text, std::size_t count, const char* name, TokenSplit split,
                         double* out, Error* err) {
  thread_local std::vector<std::string_view> tokens;
  split_tokens(text, split, tokens);

  if (tokens.size() != count)
    return format_error(err, std::string("expected ") + std::to_string(count) + " " + name +
                             " values, got " + std::to_string(tokens.size()) + ": \"" +
                             std::string(text) + "\"");

  for (std::size_t i = 0; i < count; ++i) {
    auto v = parse_double(tokens[i]);
    if (!v)
      return format_error(err, std::string("invalid ") + name + " value \"" + std::string(tokens[i]) +
                               "\" in \"" + std::string(text) + "\"");
    out[i] = *v;
  }
  return true;
}

bool parse_record(const std::vector<std::string>& lines, Record& out, Error* err,
                  const ParseConfig& cfg) {
  Record r;
  std::string_view text;

  if (!header_value(lines, 0, 't', "time", text, err)) return false;
  auto t = parse_u64(text);
  if (!t) return format_error(err, "invalid time header value \"" + std::string(text) + "\"");
  r.time = *t;

  if (!header_value(lines, 1, 'b', "box", text, err)) return false;
  if (!parse_values(text, kHeaderValues, "box", cfg.split, r.box.data(), err)) return false;

  if (!header_value(lines, 2, 'E', "energy", text, err)) return false;
  if (!parse_values(text, kHeaderValues, "energy", cfg.split, r.energy.data(), err)) return false;

  r.particles.resize(lines.size() > 3 ? lines.size() - 3 : 0);
  for (std::size_t i = 3; i < lines.size(); ++i) {
    if (!parse_values(trim(lines[i]), kParticleWidth, "particle", cfg.split,
                      r.particles[i - 3].data(), err))
      return false;
  }

  out = std::move(r);
  return true;
}

}
