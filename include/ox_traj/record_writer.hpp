#pragma once
#include <string>
#include <vector>

#include "ox_traj/record.hpp"

namespace oxt {

struct EncodeConfig {
  unsigned threads = 0;  // 0 -> resolve_threads()
};

// Canonical text of one block:
//   t = <time>
//   b = <x> <y> <z>
//   E = <x> <y> <z>
//   <15 values> (one line per particle)
// Every line ends in '\n'. Numbers use the shortest text that parses back to
// the same double, so parse_record(serialize_record(r)) == r bit for bit
// (NaN payloads aside).
std::string serialize_record(const Record& r);

// Same for a batch, in parallel; result[i] is the text of records[i].
// If no more threads can be started the remaining slices are encoded on the
// calling thread. std::bad_alloc from a worker is rethrown here after join.
std::vector<std::string> serialize_records(const std::vector<Record>& records,
                                           const EncodeConfig& cfg = {});

// Append the shortest round-trip form of `x` to `out`.
void append_number(std::string& out, double x);

}
