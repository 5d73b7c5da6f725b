#pragma once
#include <string>
#include <vector>

#include "ox_traj/parse_policy.hpp"
#include "ox_traj/record.hpp"

namespace oxt {

// Parse one block's raw lines (header lines first) into a Record.
//
//   line 0: t = <unsigned integer>
//   line 1: b = <float> <float> <float>
//   line 2: E = <float> <float> <float>
//   rest  : 15 floats per particle row (surrounding whitespace ignored)
//
// All-or-nothing: on any bad line `out` is left untouched, *err gets a
// Format error naming the offending text, and false is returned.
bool parse_record(const std::vector<std::string>& lines, Record& out,
                  Error* err = nullptr, const ParseConfig& cfg = {});

}
