#include "ox_traj/trajectory.hpp"
#include "ox_traj/offset_index.hpp"
#include "ox_traj/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace oxt {

struct Trajectory::Impl {
  std::string path;
  Config cfg;
  std::uint64_t file_size{0};
  bool opened{false};

  std::vector<std::uint64_t> ends;   // end offset of block i == start of block i+1
  std::vector<Record> cache;
  std::size_t cache_first{0};

  bool partial() const noexcept {
    return file_size > 0 && (ends.empty() || ends.back() < file_size);
  }

  bool range_error(Error* err, std::size_t index) const {
    return fail(err, ErrorKind::Range,
                "block " + std::to_string(index) + " is past the end of " + path);
  }

  bool open(Error* err) {
    std::error_code ec;
    if (!file_size_of(path, file_size, &ec))
      return fail(err, ErrorKind::Io, "cannot stat " + path + ": " + ec.message());

    ends.clear();
    cache.clear();
    cache_first = 0;
    const std::string idx = index_path_for(path);
    if (std::filesystem::exists(idx, ec)) {
      ends = load_offset_index(idx, file_size);
      if (ends.empty()) std::cerr << "[index] ignoring stale index " << idx << "\n";
    }
    opened = true;
    return true;
  }

  bool require_open(Error* err) {
    return opened || open(err);
  }

  // Splice offsets learned from block `first` onwards into the index.
  bool merge(std::size_t first, const std::vector<std::uint64_t>& offs, Error* err) {
    if (first > ends.size())
      return fail(err, ErrorKind::Range,
                  "offsets for block " + std::to_string(first) + " leave a gap after block " +
                  std::to_string(ends.size()));
    if (ends.size() >= first + offs.size()) return true;

    ends.resize(first);
    ends.insert(ends.end(), offs.begin(), offs.end());

    if (!partial() && cfg.persist_index) {
      Error save_err;
      if (!save_offset_index(index_path_for(path), ends, &save_err))
        std::cerr << "[index] could not save index: " << save_err.message << "\n";
    }
    return true;
  }

  // Read offsets for at least blocks [known, target).
  bool extend(std::size_t target, Error* err) {
    const std::size_t first = ends.size();
    const std::uint64_t from = first == 0 ? 0 : ends.back();
    const std::size_t limit = std::max(cfg.chunk_size, target > first ? target - first : 0);

    std::vector<std::uint64_t> offs;
    if (!read_offsets(path, from, std::max<std::size_t>(limit, 1), offs, err, cfg.decode.cursor))
      return false;
    if (offs.empty())
      return fail(err, ErrorKind::Format,
                  "failed to build index for \"" + path + "\" from block " + std::to_string(first));
    return merge(first, offs, err);
  }

  bool start_offset(std::size_t index, std::uint64_t& out, Error* err) {
    if (partial() && index > ends.size()) {
      if (!extend(index, err)) return false;
    }
    if (index == 0) {
      if (file_size == 0) return range_error(err, index);
      out = 0;
      return true;
    }
    if (index - 1 >= ends.size() || ends[index - 1] >= file_size) return range_error(err, index);
    out = ends[index - 1];
    return true;
  }

  bool load(std::size_t index, Error* err) {
    std::uint64_t from = 0;
    if (!start_offset(index, from, err)) return false;

    std::vector<DecodedRecord> decoded;
    if (!read_records(path, from, std::max<std::size_t>(cfg.chunk_size, 1), decoded, err, cfg.decode))
      return false;
    if (decoded.empty()) return range_error(err, index);

    std::vector<std::uint64_t> offs;
    offs.reserve(decoded.size());
    std::vector<Record> recs;
    recs.reserve(decoded.size());
    for (auto& d : decoded) {
      offs.push_back(d.end_offset);
      recs.push_back(std::move(d.record));
    }
    if (!merge(index, offs, err)) return false;

    cache = std::move(recs);
    cache_first = index;
    return true;
  }

  bool ensure_index(Error* err) {
    while (partial()) {
      if (!extend(ends.size() + cfg.chunk_size, err)) return false;
    }
    return true;
  }
};

Trajectory::Trajectory(std::string path)
  : Trajectory(std::move(path), Config{}) {}

Trajectory::Trajectory(std::string path, Config cfg)
  : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

Trajectory::~Trajectory() { delete p_; }

bool Trajectory::open(Error* err) { return p_->open(err); }

bool Trajectory::get(std::size_t index, const Record*& out, Error* err) {
  if (!p_->require_open(err)) return false;
  if (index < p_->cache_first || index - p_->cache_first >= p_->cache.size()) {
    if (!p_->load(index, err)) return false;
  }
  out = &p_->cache[index - p_->cache_first];
  return true;
}

bool Trajectory::start_offset(std::size_t index, std::uint64_t& out, Error* err) {
  if (!p_->require_open(err)) return false;
  return p_->start_offset(index, out, err);
}

bool Trajectory::ensure_index(Error* err) {
  if (!p_->require_open(err)) return false;
  return p_->ensure_index(err);
}

bool Trajectory::size(std::size_t& out, Error* err) {
  if (!ensure_index(err)) return false;
  out = p_->ends.size();
  return true;
}

bool Trajectory::for_each(const RecordCallback& cb, Error* err) {
  for (std::size_t i = 0;; ++i) {
    const Record* r = nullptr;
    Error e;
    if (!get(i, r, &e)) {
      if (e.kind == ErrorKind::Range) return true;
      if (err) *err = std::move(e);
      return false;
    }
    if (!cb(i, *r)) return true;
  }
}

std::size_t Trajectory::known_blocks() const noexcept { return p_->ends.size(); }
bool Trajectory::index_complete() const noexcept { return p_->opened && !p_->partial(); }
std::uint64_t Trajectory::file_size() const noexcept { return p_->file_size; }
const std::vector<std::uint64_t>& Trajectory::end_offsets() const noexcept { return p_->ends; }
const std::string& Trajectory::path() const noexcept { return p_->path; }

}
