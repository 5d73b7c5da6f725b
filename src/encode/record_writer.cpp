#include "ox_traj/record_writer.hpp"
#include "ox_traj/work_queue.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <exception>
#include <new>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace oxt {

void append_number(std::string& out, double x) {
  char tmp[64];
  auto [ptr, ec] = std::to_chars(tmp, tmp + sizeof(tmp), x);
  // 64 bytes always fits a shortest-form double
  out.append(tmp, ec == std::errc() ? static_cast<std::size_t>(ptr - tmp) : 0);
}

static void append_values(std::string& out, const double* v, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out.push_back(' ');
    append_number(out, v[i]);
  }
}

std::string serialize_record(const Record& r) {
  std::string out;
  out.reserve(64 + r.particles.size() * kParticleWidth * 12);

  char tmp[32];
  auto [ptr, ec] = std::to_chars(tmp, tmp + sizeof(tmp), r.time);
  out += "t = ";
  out.append(tmp, ec == std::errc() ? static_cast<std::size_t>(ptr - tmp) : 0);
  out += "\nb = ";
  append_values(out, r.box.data(), r.box.size());
  out += "\nE = ";
  append_values(out, r.energy.data(), r.energy.size());
  out.push_back('\n');

  for (const auto& row : r.particles) {
    append_values(out, row.data(), row.size());
    out.push_back('\n');
  }
  return out;
}

std::vector<std::string> serialize_records(const std::vector<Record>& records,
                                           const EncodeConfig& cfg) {
  std::vector<std::string> out(records.size());
  if (records.empty()) return out;

  const std::size_t n = records.size();
  const std::size_t num_workers = std::min<std::size_t>(resolve_threads(cfg.threads), n);
  if (num_workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) out[i] = serialize_record(records[i]);
    return out;
  }

  // contiguous slices; each worker writes only its own slots
  const std::size_t per = (n + num_workers - 1) / num_workers;
  std::vector<std::exception_ptr> thrown(num_workers);
  auto encode_slice = [&records, &out, &thrown, per, n](std::size_t w) {
    try {
      for (std::size_t i = w * per; i < std::min(n, (w + 1) * per); ++i)
        out[i] = serialize_record(records[i]);
    } catch (const std::bad_alloc&) {
      thrown[w] = std::current_exception();
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  std::size_t w = 0;
  try {
    for (; w < num_workers && w * per < n; ++w) workers.emplace_back(encode_slice, w);
  } catch (const std::system_error&) {
    // out of threads: the caller encodes whatever was not handed out
    for (std::size_t rest = w; rest < num_workers && rest * per < n; ++rest) encode_slice(rest);
  }
  for (auto& th : workers) th.join();
  for (auto& e : thrown)
    if (e) std::rethrow_exception(e);
  return out;
}

}
