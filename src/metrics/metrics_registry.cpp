#include "ox_traj/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace oxt {

void MetricsRegistry::reset() {
  blocks_ = particles_ = bytes_ = 0;
  threads_ = 0;
  kind_errs_.clear();
  stage_accum_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  stage_accum_[key] += std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::steady_clock::now() - it->second);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_stage_time(std::string_view name, std::chrono::nanoseconds d) {
  stage_accum_[std::string(name)] += d;
}

void MetricsRegistry::add_error(ErrorKind kind) {
  ++kind_errs_[to_string(kind)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.blocks = blocks_;
  r.particles = particles_;
  r.bytes = bytes_;
  r.threads = threads_;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.blocks_per_sec  = (wall_ms > 0.0) ? blocks_ / (wall_ms / 1000.0) : 0.0;

  r.errors_by_kind = kind_errs_;
  r.stages.reserve(stage_accum_.size());
  for (auto& kv : stage_accum_) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(kv.second).count();
    r.stages.push_back(StageTiming{kv.first, static_cast<std::uint64_t>(ms)});
  }
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return r;
}

}
