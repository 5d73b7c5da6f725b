#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ox_traj/line_cursor.hpp"
#include "ox_traj/parse_policy.hpp"
#include "ox_traj/record.hpp"

namespace oxt {

class MetricsRegistry;

struct DecodeConfig {
  unsigned    threads        = 0;   // 0 -> resolve_threads()
  std::size_t queue_capacity = 64;  // raw blocks in flight between scanner and workers
  LineCursor::Config cursor{};
  ParseConfig parse{};
  MetricsRegistry* metrics = nullptr;
};

// Decode up to `limit` blocks, scanning from byte `offset` (skips forward to
// the next block if `offset` is not on one). Blocks are scanned sequentially
// and parsed on a worker pool; `out` is in file order.
// All-or-nothing: on failure `out` is cleared and *err holds the error of the
// lowest-index block that failed (scan I/O or format). Failing to start the
// worker threads, or running out of memory in one, is an Io error.
bool read_records(const std::string& path, std::uint64_t offset, std::size_t limit,
                  std::vector<DecodedRecord>& out, Error* err = nullptr,
                  const DecodeConfig& cfg = {});

// Block end offsets only; block text is never kept.
bool read_offsets(const std::string& path, std::uint64_t offset, std::size_t limit,
                  std::vector<std::uint64_t>& out, Error* err = nullptr,
                  const LineCursor::Config& cursor_cfg = {});

}
