#include "ox_traj/batch_decoder.hpp"
#include "ox_traj/block_scanner.hpp"
#include "ox_traj/metrics.hpp"
#include "ox_traj/record_parser.hpp"
#include "ox_traj/work_queue.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <new>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace oxt {

bool read_records(const std::string& path, std::uint64_t offset, std::size_t limit,
                  std::vector<DecodedRecord>& out, Error* err, const DecodeConfig& cfg) {
  out.clear();
  LineCursor cursor(path, cfg.cursor);
  if (!cursor.open(offset, err)) {
    if (cfg.metrics) cfg.metrics->add_error(ErrorKind::Io);
    return false;
  }
  if (limit == 0) return true;

  struct Job {
    std::size_t index = 0;
    std::uint64_t end = 0;
    std::vector<std::string> lines;
  };
  struct Slot {
    std::size_t index = 0;
    std::uint64_t end = 0;
    bool ok = false;
    Record record;
    Error error;
  };
  struct WorkerCtx {
    std::vector<Slot> done;
    std::chrono::nanoseconds busy{0};
  };

  const unsigned num_workers = static_cast<unsigned>(
      std::min<std::size_t>(resolve_threads(cfg.threads), limit));
  WorkQueue<Job> q(cfg.queue_capacity);

  std::vector<std::unique_ptr<WorkerCtx>> wctx;
  wctx.reserve(num_workers);
  for (unsigned t = 0; t < num_workers; ++t) wctx.emplace_back(std::make_unique<WorkerCtx>());

  // workers: each parses only the job it popped
  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  try {
    for (unsigned t = 0; t < num_workers; ++t) {
      workers.emplace_back([&, t]() {
        Job job;
        while (q.pop(job)) {
          const auto t0 = std::chrono::steady_clock::now();
          Slot s;
          s.index = job.index;
          s.end = job.end;
          try {
            s.ok = parse_record(job.lines, s.record, &s.error, cfg.parse);
          } catch (const std::bad_alloc&) {
            s.ok = fail(&s.error, ErrorKind::Io,
                        "out of memory parsing block " + std::to_string(job.index) + " of " + path);
          }
          wctx[t]->busy += std::chrono::steady_clock::now() - t0;
          wctx[t]->done.push_back(std::move(s));
        }
      });
    }
  } catch (const std::system_error& e) {
    q.close();
    for (auto& th : workers) th.join();
    if (cfg.metrics) cfg.metrics->add_error(ErrorKind::Io);
    return fail(err, ErrorKind::Io, std::string("cannot start decode workers: ") + e.what());
  }
  if (cfg.metrics) cfg.metrics->note_threads(num_workers);

  // producer: sequential scan
  if (cfg.metrics) cfg.metrics->start_stage("scan");
  BlockScanner scanner(cursor, /*keep_lines=*/true);
  Error scan_err;
  std::size_t produced = 0;
  bool scan_failed = false;
  std::uint64_t first_start = 0, last_end = 0;
  while (produced < limit) {
    RawBlock blk;
    ScanStatus st = scanner.next(blk, &scan_err);
    if (st == ScanStatus::End) break;
    if (st == ScanStatus::Failed) { scan_failed = true; break; }
    if (produced == 0) first_start = blk.start;
    last_end = blk.end;
    q.push(Job{produced, blk.end, std::move(blk.lines)});
    ++produced;
  }
  if (cfg.metrics) cfg.metrics->end_stage("scan");

  q.close();
  for (auto& th : workers) th.join();

  // restore discovery order
  std::vector<Slot> slots;
  slots.reserve(produced);
  std::chrono::nanoseconds busy{0};
  for (auto& w : wctx) {
    busy += w->busy;
    for (auto& s : w->done) slots.push_back(std::move(s));
  }
  std::sort(slots.begin(), slots.end(),
            [](const Slot& a, const Slot& b){ return a.index < b.index; });
  if (cfg.metrics) cfg.metrics->add_stage_time("parse", busy);

  // a scan failure sits at index `produced`, after every parsed block
  for (auto& s : slots) {
    if (!s.ok) {
      if (cfg.metrics) cfg.metrics->add_error(s.error.kind);
      if (err) *err = std::move(s.error);
      return false;
    }
  }
  if (scan_failed) {
    if (cfg.metrics) cfg.metrics->add_error(ErrorKind::Io);
    if (err) *err = std::move(scan_err);
    return false;
  }

  out.reserve(slots.size());
  for (auto& s : slots) {
    if (cfg.metrics) cfg.metrics->add_block(s.record.particles.size());
    out.push_back(DecodedRecord{s.end, std::move(s.record)});
  }
  if (cfg.metrics && !slots.empty()) cfg.metrics->add_bytes(last_end - first_start);
  return true;
}

bool read_offsets(const std::string& path, std::uint64_t offset, std::size_t limit,
                  std::vector<std::uint64_t>& out, Error* err,
                  const LineCursor::Config& cursor_cfg) {
  out.clear();
  LineCursor cursor(path, cursor_cfg);
  if (!cursor.open(offset, err)) return false;

  BlockScanner scanner(cursor, /*keep_lines=*/false);
  RawBlock blk;
  while (out.size() < limit) {
    ScanStatus st = scanner.next(blk, err);
    if (st == ScanStatus::End) break;
    if (st == ScanStatus::Failed) { out.clear(); return false; }
    out.push_back(blk.end);
  }
  return true;
}

}
