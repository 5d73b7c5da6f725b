#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "ox_traj/batch_decoder.hpp"
#include "ox_traj/record.hpp"

namespace oxt {

// Random access to the blocks of one trajectory file.
//
// Block start offsets are learned lazily (read_offsets) and, once the whole
// file is known, persisted to "<path>.idx" so the next open skips the scan.
// Records are decoded `chunk_size` at a time; the last chunk is cached.
class Trajectory {
public:
  struct Config {
    std::size_t  chunk_size    = 20;
    bool         persist_index = true;
    DecodeConfig decode{};
  };

  explicit Trajectory(std::string path);   // uses default Config{}
  Trajectory(std::string path, Config cfg);
  ~Trajectory();

  Trajectory(const Trajectory&) = delete;
  Trajectory& operator=(const Trajectory&) = delete;

  // Stat the file and pick up a valid sidecar index, if any.
  bool open(Error* err = nullptr);

  // Record `index`. The pointer stays valid until the next call that loads a
  // different chunk. Range error past the last block.
  bool get(std::size_t index, const Record*& out, Error* err = nullptr);

  // Byte offset where block `index` starts. Extends the index as needed.
  bool start_offset(std::size_t index, std::uint64_t& out, Error* err = nullptr);

  // Scan to the end of the file so every block offset is known.
  bool ensure_index(Error* err = nullptr);

  // Total block count (completes the index first).
  bool size(std::size_t& out, Error* err = nullptr);

  // Visit records in order from the first; stops early if `cb` returns false.
  using RecordCallback = std::function<bool(std::size_t, const Record&)>;
  bool for_each(const RecordCallback& cb, Error* err = nullptr);

  std::size_t known_blocks() const noexcept;
  bool index_complete() const noexcept;
  std::uint64_t file_size() const noexcept;
  const std::vector<std::uint64_t>& end_offsets() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
