#include "ox_traj/line_cursor.hpp"
#include "ox_traj/record.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace oxt {

struct LineCursor::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};

  std::vector<char> buf;
  std::size_t head{0};   // next unread byte in buf
  std::size_t fill{0};   // valid bytes in buf

  std::string line;
  std::uint64_t cursor{0};      // offset of the next unread byte
  std::uint64_t line_start{0};
  bool first_partial{false};
  bool partial{false};
  bool reached_end{false};
  bool got_error{false};

  ~Impl() { if (f) std::fclose(f); }

  bool io_fail(Error* err, int code, const char* what) {
    last_errno = code;
    got_error = true;
    reached_end = true;
    return fail(err, ErrorKind::Io,
                std::string(what) + " failed for " + path + ": " + std::strerror(code));
  }

  bool open(std::uint64_t offset, Error* err) {
    if (f) { std::fclose(f); f = nullptr; }
    head = fill = 0;
    line.clear();
    reached_end = got_error = partial = first_partial = false;
    cursor = line_start = offset;

    f = std::fopen(path.c_str(), "rb");
    if (!f) return io_fail(err, errno, "open");

    if (offset > 0) {
      // Peek at the byte before `offset` to learn whether we start mid-line.
      if (::fseeko(f, static_cast<off_t>(offset - 1), SEEK_SET) != 0) return io_fail(err, errno, "seek");
      int c = std::fgetc(f);
      if (c == EOF && std::ferror(f)) return io_fail(err, errno, "read");
      first_partial = (c != EOF && c != '\n');
    }
    if (::fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) return io_fail(err, errno, "seek");
    buf.assign(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1, 0);
    return true;
  }

  // Refill the buffer. Returns false only on a read error; fill == 0 means EOF.
  bool refill(Error* err) {
    head = 0;
    fill = std::fread(buf.data(), 1, buf.size(), f);
    if (fill == 0 && std::ferror(f)) return io_fail(err, errno, "read");
    return true;
  }

  bool read_line(Error* err) {
    line.clear();
    line_start = cursor;
    partial = false;
    if (reached_end || got_error || !f) return false;

    std::uint64_t consumed = 0;
    while (true) {
      if (head == fill) {
        if (!refill(err)) return false;
        if (fill == 0) break;
      }
      const char* s = buf.data() + head;
      const std::size_t avail = fill - head;
      const void* nl = std::memchr(s, '\n', avail);
      const std::size_t take = nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - s) : avail;

      if (line.size() + take > cfg.max_line_bytes) return io_fail(err, EOVERFLOW, "line length guard");
      line.append(s, take);
      if (nl) {
        head += take + 1;
        consumed += take + 1;
        break;
      }
      head += take;
      consumed += take;
    }

    cursor += consumed;
    if (consumed == 0) { reached_end = true; return false; }

    if (cfg.strip_cr && !line.empty() && line.back() == '\r') line.pop_back();
    partial = first_partial;
    first_partial = false;
    return true;
  }
};

LineCursor::LineCursor(std::string path)
  : LineCursor(std::move(path), Config{}) {}

LineCursor::LineCursor(std::string path, Config cfg)
  : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

LineCursor::~LineCursor() { delete p_; }

bool LineCursor::open(std::uint64_t offset, Error* err) { return p_->open(offset, err); }
bool LineCursor::read_line(Error* err) { return p_->read_line(err); }

std::string_view LineCursor::line() const noexcept { return p_->line; }
std::string LineCursor::take_line() { return std::move(p_->line); }

std::uint64_t LineCursor::line_start() const noexcept { return p_->line_start; }
std::uint64_t LineCursor::position() const noexcept { return p_->cursor; }
bool LineCursor::partial() const noexcept { return p_->partial; }
bool LineCursor::at_end() const noexcept { return p_->reached_end; }
bool LineCursor::failed() const noexcept { return p_->got_error; }
int  LineCursor::last_error() const noexcept { return p_->last_errno; }
const std::string& LineCursor::path() const noexcept { return p_->path; }

}
