#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ox_traj/record.hpp"

namespace oxt {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t blocks = 0;
  std::uint64_t particles = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double blocks_per_sec = 0.0;
  unsigned threads = 0;  // most decode workers any call actually ran

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Counters for one caller. Not thread-safe: only the thread that drives a
// decode/encode call touches it.
class MetricsRegistry {
public:
  void reset();
  void add_block(std::uint64_t particles) noexcept { ++blocks_; particles_ += particles; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void note_threads(unsigned n) noexcept { if (n > threads_) threads_ = n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);
  // For stages measured elsewhere (e.g. summed across worker threads).
  void add_stage_time(std::string_view name, std::chrono::nanoseconds d);

  void add_error(ErrorKind kind);
  RunStats snapshot(double wall_ms) const;

  std::uint64_t blocks() const noexcept { return blocks_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

private:
  std::uint64_t blocks_{0};
  std::uint64_t particles_{0};
  std::uint64_t bytes_{0};
  unsigned threads_{0};
  std::unordered_map<std::string, std::uint64_t> kind_errs_;
  std::unordered_map<std::string, std::chrono::nanoseconds> stage_accum_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
