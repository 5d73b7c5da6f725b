#include "ox_traj/block_scanner.hpp"
#include "ox_traj/line_cursor.hpp"
#include "ox_traj/record.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Bounds { std::uint64_t start, end; std::size_t lines; };

static std::vector<Bounds> scan(const fs::path& f, std::uint64_t offset, bool keep) {
  std::vector<Bounds> out;
  oxt::LineCursor c(f.string());
  if (!c.open(offset)) return out;
  oxt::BlockScanner s(c, keep);
  oxt::RawBlock b;
  while (s.next(b) == oxt::ScanStatus::Block) out.push_back({b.start, b.end, b.lines.size()});
  return out;
}

int main(){
  const fs::path f = "tests/data/scenario.dat";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
  const std::uint64_t size = fs::file_size(f);

  // content retention on
  {
    oxt::LineCursor c(f.string());
    check(c.open(0), "open");
    oxt::BlockScanner s(c, true);
    oxt::RawBlock b;
    check(s.next(b) == oxt::ScanStatus::Block, "block 1");
    check(b.start == 0 && b.end == 71, "block 1 bounds");
    check(b.lines.size() == 4 && b.lines[0] == "t = 0" && b.lines[2] == "E = 1.0 2.0 3.0",
          "block 1 lines");
    check(s.next(b) == oxt::ScanStatus::Block, "block 2");
    check(b.start == 71 && b.end == size, "block 2 bounds");
    check(b.lines.size() == 4 && b.lines[0] == "t = 1", "block 2 starts with its marker");
    check(s.next(b) == oxt::ScanStatus::End, "end");
    check(s.next(b) == oxt::ScanStatus::End, "end is sticky");
    check(s.blocks() == 2, "block count");
  }

  // content retention off: same bounds, no text
  {
    auto kept = scan(f, 0, true);
    auto bare = scan(f, 0, false);
    check(kept.size() == 2 && bare.size() == 2, "same block count");
    for (std::size_t i = 0; i < bare.size() && i < kept.size(); ++i) {
      check(bare[i].start == kept[i].start && bare[i].end == kept[i].end, "same bounds");
      check(bare[i].lines == 0, "no lines kept");
    }
  }

  // any start inside block 1 resumes at block 2, exactly like starting on it
  {
    auto at_marker = scan(f, 71, false);
    for (std::uint64_t off : {1u, 4u, 30u, 50u, 70u}) {
      auto mid = scan(f, off, false);
      check(mid.size() == 1 && at_marker.size() == 1 &&
            mid[0].start == at_marker[0].start && mid[0].end == at_marker[0].end,
            "mid-block start at " + std::to_string(off));
    }
    check(scan(f, size, false).empty(), "start at EOF yields nothing");
  }

  // lines before the first marker are skipped
  {
    const fs::path j = "tests/data/leading_junk_no_particles.dat";
    auto b = scan(j, 0, true);
    check(b.size() == 1 && b[0].lines == 3 && b[0].start == 29 && b[0].end == fs::file_size(j),
          "leading junk skipped");
  }

  // I/O failure surfaces once, then the sequence ends
  {
    oxt::LineCursor::Config cfg;
    cfg.max_line_bytes = 20;  // the 29-byte particle row trips the guard
    oxt::LineCursor c(f.string(), cfg);
    check(c.open(0), "open guarded");
    oxt::BlockScanner s(c, true);
    oxt::RawBlock b;
    oxt::Error err;
    check(s.next(b, &err) == oxt::ScanStatus::Failed, "failed item");
    check(err.kind == oxt::ErrorKind::Io, "failure is Io");
    check(s.next(b, &err) == oxt::ScanStatus::End, "terminated after failure");
  }

  if (failures) { std::cerr << "[FAIL] block_scanner: " << failures << " checks failed\n"; return 1; }
  std::cout << "[PASS] block_scanner\n";
  return 0;
}
