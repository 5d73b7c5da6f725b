#include "ox_traj/block_scanner.hpp"
#include "ox_traj/line_cursor.hpp"
#include "ox_traj/record.hpp"

namespace oxt {

static constexpr char kTimeMarker = 't';

BlockScanner::BlockScanner(LineCursor& cursor, bool keep_lines)
  : cursor_(cursor), keep_lines_(keep_lines) {}

bool BlockScanner::at_marker() const noexcept {
  // A line we joined halfway through can't open a block.
  if (cursor_.partial()) return false;
  auto s = cursor_.line();
  return !s.empty() && s.front() == kTimeMarker;
}

ScanStatus BlockScanner::finish() {
  done_ = true;
  return cursor_.failed() ? ScanStatus::Failed : ScanStatus::End;
}

ScanStatus BlockScanner::next(RawBlock& out, Error* err) {
  out.lines.clear();
  out.start = out.end = 0;
  if (done_ || cursor_.failed()) { done_ = true; return ScanStatus::End; }

  // (1) skip forward to the next "t" line; it may already be pending
  while (!at_marker()) {
    if (!cursor_.read_line(err)) return finish();
  }

  // (2) the block opens here
  out.start = cursor_.line_start();
  if (keep_lines_) out.lines.emplace_back(cursor_.take_line());

  // (3) collect until EOF or the next marker, which stays pending
  while (true) {
    if (!cursor_.read_line(err)) {
      if (cursor_.failed()) return finish();
      break;
    }
    if (at_marker()) break;
    if (keep_lines_) out.lines.emplace_back(cursor_.take_line());
  }

  // (4) at EOF line_start() is the file size
  out.end = cursor_.line_start();
  ++blocks_;
  return ScanStatus::Block;
}

}
