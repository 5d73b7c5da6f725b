#include "ox_traj/batch_decoder.hpp"
#include "ox_traj/metrics.hpp"
#include "ox_traj/path_utils.hpp"
#include "ox_traj/record_writer.hpp"
#include "ox_traj/run_json.hpp"
#include "ox_traj/trajectory.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk     = 0;
constexpr int kExitUsage  = 1;
constexpr int kExitIo     = 2;
constexpr int kExitFormat = 3;
constexpr int kExitRange  = 4;

struct Cli {
  std::string command;
  std::string file;
  unsigned threads = 0;
  std::size_t chunk = 1000;
  std::size_t from = 0;
  std::size_t count = std::numeric_limits<std::size_t>::max();
  std::string report;
  std::string out;
  bool collapse_spaces = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: ox-traj index <file>\n"
    "       ox-traj stats <file> [--threads=N] [--chunk=N] [--report=PATH] [--collapse-spaces]\n"
    "       ox-traj dump  <file> [--from=N] [--count=K] [--out=PATH] [--chunk=N]\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::size_t threads = 0;
    if (eat_n("--threads=", &threads)) { c.threads = static_cast<unsigned>(threads); continue; }
    if (eat_n("--chunk=", &c.chunk)) continue;
    if (eat_n("--from=", &c.from)) continue;
    if (eat_n("--count=", &c.count)) continue;
    if (eat("--report=", &c.report)) continue;
    if (eat("--out=", &c.out)) continue;
    if (a == "--collapse-spaces") { c.collapse_spaces = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kExitOk); }
    if (a.rfind("--", 0) == 0) { std::cerr << "unknown option: " << a << "\n"; return false; }
    positional.push_back(a);
  }
  if (positional.size() != 2) return false;
  c.command = positional[0];
  c.file = positional[1];
  if (c.chunk == 0) c.chunk = 1;
  return true;
}

int exit_code_for(const oxt::Error& e) {
  switch (e.kind) {
    case oxt::ErrorKind::Io:     return kExitIo;
    case oxt::ErrorKind::Format: return kExitFormat;
    case oxt::ErrorKind::Range:  return kExitRange;
    default:                     return kExitOk;
  }
}

int report_error(const char* tag, const oxt::Error& e) {
  std::cerr << "[" << tag << "] " << oxt::to_string(e.kind) << " error: " << e.message << "\n";
  return exit_code_for(e);
}

int run_index(const Cli& cli) {
  oxt::Trajectory::Config tcfg;
  tcfg.chunk_size = cli.chunk;
  tcfg.decode.threads = cli.threads;
  oxt::Trajectory traj(cli.file, tcfg);

  oxt::Error err;
  std::size_t n = 0;
  if (!traj.open(&err) || !traj.size(n, &err)) return report_error("index", err);

  std::cout << "[index] " << cli.file << ": " << n << " blocks, "
            << traj.file_size() << " bytes -> " << oxt::index_path_for(cli.file) << "\n";
  return kExitOk;
}

int run_stats(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  oxt::MetricsRegistry metrics;
  oxt::DecodeConfig dcfg;
  dcfg.threads = cli.threads;
  dcfg.metrics = &metrics;
  if (cli.collapse_spaces) dcfg.parse.split = oxt::TokenSplit::Collapse;

  oxt::RunJsonPayload p{};
  std::uint64_t offset = 0;
  std::vector<oxt::DecodedRecord> batch;
  bool first_batch = true;
  while (true) {
    oxt::Error err;
    if (!oxt::read_records(cli.file, offset, cli.chunk, batch, &err, dcfg))
      return report_error("stats", err);
    if (batch.empty()) break;
    if (first_batch) p.first_time = batch.front().record.time;
    first_batch = false;
    p.last_time = batch.back().record.time;
    offset = batch.back().end_offset;
    if (batch.size() < cli.chunk) break;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const oxt::RunStats s = metrics.snapshot(wall_ms);

  p.blocks = s.blocks;
  p.particles = s.particles;
  p.bytes = s.bytes;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = s.throughput_mb_s;
  p.blocks_per_sec = s.blocks_per_sec;
  p.threads = s.threads;
  for (const auto& st : s.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
  p.errors_by_kind = s.errors_by_kind;
  p.filename = cli.file;
  std::error_code fec;
  if (!oxt::file_size_of(cli.file, p.file_size, &fec))
    std::cerr << "[stats] cannot stat " << cli.file << ": " << fec.message() << "\n";

  std::cout << "[stats] " << cli.file << ": blocks=" << p.blocks
            << " particles=" << p.particles
            << " bytes=" << p.bytes
            << " time=" << wall_ms << "ms"
            << " throughput=" << p.throughput_mb_s << " MiB/s\n";

  if (!cli.report.empty()) {
    const std::filesystem::path rp(cli.report);
    if (!oxt::ensure_parent_dirs(rp)) {
      std::cerr << "[stats] cannot create directory for " << cli.report << "\n";
      return kExitIo;
    }
    std::ofstream rj(rp, std::ios::binary);
    const std::string json = oxt::RunJsonWriter::to_json(p);
    rj.write(json.data(), static_cast<std::streamsize>(json.size()));
    if (!rj) {
      std::cerr << "[stats] failed to write " << cli.report << "\n";
      return kExitIo;
    }
  }
  return kExitOk;
}

int run_dump(const Cli& cli) {
  oxt::Trajectory::Config tcfg;
  tcfg.chunk_size = cli.chunk;
  tcfg.decode.threads = cli.threads;
  oxt::Trajectory traj(cli.file, tcfg);

  oxt::Error err;
  if (!traj.open(&err)) return report_error("dump", err);

  std::ofstream file_out;
  if (!cli.out.empty()) {
    file_out.open(cli.out, std::ios::binary | std::ios::trunc);
    if (!file_out) { std::cerr << "[dump] cannot open " << cli.out << "\n"; return kExitIo; }
  }
  std::ostream& os = cli.out.empty() ? std::cout : file_out;

  oxt::EncodeConfig ecfg;
  ecfg.threads = cli.threads;
  std::vector<oxt::Record> pending;
  auto flush = [&]() {
    for (const auto& text : oxt::serialize_records(pending, ecfg)) os << text;
    pending.clear();
  };

  std::size_t written = 0;
  for (std::size_t i = cli.from; written < cli.count; ++i, ++written) {
    const oxt::Record* r = nullptr;
    if (!traj.get(i, r, &err)) {
      // running off the end is fine unless the caller asked for an exact count
      if (err.kind == oxt::ErrorKind::Range &&
          (cli.count == std::numeric_limits<std::size_t>::max() || written > 0)) break;
      flush();
      return report_error("dump", err);
    }
    pending.push_back(*r);
    if (pending.size() >= cli.chunk) flush();
  }
  flush();
  os.flush();
  if (!os) { std::cerr << "[dump] write failed\n"; return kExitIo; }

  std::cerr << "[dump] wrote " << written << " blocks from " << cli.file << "\n";
  return kExitOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  bool ok = false;
  try {
    ok = parse_cli(argc, argv, cli);
  } catch (const std::exception& e) {
    std::cerr << "bad option value: " << e.what() << "\n";
  }
  if (!ok) { usage(std::cerr); return kExitUsage; }

  if (cli.command == "index") return run_index(cli);
  if (cli.command == "stats") return run_stats(cli);
  if (cli.command == "dump")  return run_dump(cli);

  std::cerr << "unknown command: " << cli.command << "\n";
  usage(std::cerr);
  return kExitUsage;
}
