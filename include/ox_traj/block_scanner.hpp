#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace oxt {

class LineCursor;
struct Error;

// Raw lines of one block; only filled when the scanner keeps content.
struct RawBlock {
  std::uint64_t start = 0;  // offset of the block's "t" line
  std::uint64_t end   = 0;  // offset of the next "t" line, or the file size
  std::vector<std::string> lines;
};

enum class ScanStatus { Block, End, Failed };

// Sequential iterator over the blocks of an opened LineCursor.
// A block opens on a line that begins with 't' and runs up to (not including)
// the next such line. The lookahead line stays in the cursor for the next call.
// Once End or Failed has been returned, every later call returns End.
class BlockScanner {
public:
  BlockScanner(LineCursor& cursor, bool keep_lines);

  ScanStatus next(RawBlock& out, Error* err = nullptr);

  std::uint64_t blocks() const noexcept { return blocks_; }

private:
  bool at_marker() const noexcept;
  ScanStatus finish();

  LineCursor& cursor_;
  bool keep_lines_;
  bool done_{false};
  std::uint64_t blocks_{0};
};

}
