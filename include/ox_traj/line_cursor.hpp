#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace oxt {

struct Error;

// Buffered, seekable line reader over one file. Tracks the byte offset of
// every line it hands out, so any returned offset is an exact resume point.
class LineCursor {
public:
  struct Config {
    std::size_t chunk_bytes    = 256 * 1024;        // 256 KiB read buffer
    std::size_t max_line_bytes = 64 * 1024 * 1024;  // 64 MiB guard per line
    bool        strip_cr       = true;              // trim trailing '\r' (CRLF)
  };

  explicit LineCursor(std::string path);      // uses default Config{}
  LineCursor(std::string path, Config cfg);   // explicit Config
  ~LineCursor();

  LineCursor(const LineCursor&) = delete;
  LineCursor& operator=(const LineCursor&) = delete;

  // Open the file and position it at `offset`. If `offset` falls inside a
  // line, the first line read is flagged partial().
  bool open(std::uint64_t offset, Error* err = nullptr);

  // Read the next line (without its '\n'). Returns false at end of file or on
  // an I/O failure; after a failure the cursor stays exhausted.
  bool read_line(Error* err = nullptr);

  std::string_view line() const noexcept;
  std::string take_line();

  std::uint64_t line_start() const noexcept;  // offset of the current line
  std::uint64_t position() const noexcept;    // offset just past it
  bool partial() const noexcept;              // current line began mid-line
  bool at_end() const noexcept;
  bool failed() const noexcept;
  int  last_error() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
