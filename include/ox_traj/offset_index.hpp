#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace oxt {

struct Error;

// Sidecar index: a JSON array of [start_offset, length, index] triples, one per
// block. Only complete indices (last end == file size) are ever written.

// Load block end offsets from `idx_path`. Returns an empty vector when the file
// is missing, unparsable, non-contiguous, or does not end at `file_size`.
std::vector<std::uint64_t> load_offset_index(const std::string& idx_path,
                                             std::uint64_t file_size);

// Write the triples for `end_offsets` (first block starts at 0). The file is
// written beside the target and renamed into place.
bool save_offset_index(const std::string& idx_path,
                       const std::vector<std::uint64_t>& end_offsets,
                       Error* err = nullptr);

// JSON text of the sidecar for `end_offsets`.
std::string offset_index_json(const std::vector<std::uint64_t>& end_offsets);

}
