#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oxt {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t blocks = 0;
  std::uint64_t particles = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double blocks_per_sec = 0.0;
  unsigned threads = 0;

  // First/last "t =" values seen
  std::uint64_t first_time = 0;
  std::uint64_t last_time = 0;

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

}
