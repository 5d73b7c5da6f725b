#include "ox_traj/offset_index.hpp"
#include "ox_traj/path_utils.hpp"
#include "ox_traj/record.hpp"

#include <simdjson.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace oxt {

std::vector<std::uint64_t> load_offset_index(const std::string& idx_path,
                                             std::uint64_t file_size) {
  std::vector<std::uint64_t> ends;
  std::error_code fec;
  if (!std::filesystem::exists(idx_path, fec)) return ends;

  simdjson::padded_string json;
  if (simdjson::padded_string::load(idx_path).get(json)) return ends;

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (parser.iterate(json).get(doc)) return ends;
  simdjson::ondemand::array entries;
  if (doc.get_array().get(entries)) return ends;

  std::uint64_t expect_start = 0;
  for (auto entry : entries) {
    simdjson::ondemand::array triple;
    if (entry.get_array().get(triple)) return {};

    std::uint64_t v[3] = {0, 0, 0};
    std::size_t k = 0;
    for (auto field : triple) {
      std::uint64_t x;
      if (k >= 3 || field.get_uint64().get(x)) return {};
      v[k++] = x;
    }
    // [start, length, index], contiguous and in order; every block holds at
    // least its marker line, and no block runs past the file
    if (k != 3 || v[2] != ends.size() || v[0] != expect_start) return {};
    if (v[1] == 0 || v[1] > file_size - v[0]) return {};
    expect_start = v[0] + v[1];
    ends.push_back(expect_start);
  }

  if (!doc.at_end()) return {};
  if (ends.empty() || ends.back() != file_size) return {};
  return ends;
}

std::string offset_index_json(const std::vector<std::uint64_t>& end_offsets) {
  std::ostringstream o;
  o << "[";
  std::uint64_t start = 0;
  for (std::size_t i = 0; i < end_offsets.size(); ++i) {
    if (i) o << ", ";
    o << "[" << start << ", " << (end_offsets[i] - start) << ", " << i << "]";
    start = end_offsets[i];
  }
  o << "]";
  return o.str();
}

bool save_offset_index(const std::string& idx_path,
                       const std::vector<std::uint64_t>& end_offsets,
                       Error* err) {
  const std::filesystem::path target(idx_path);
  if (!ensure_parent_dirs(target))
    return fail(err, ErrorKind::Io, "cannot create directory for " + idx_path);

  std::filesystem::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) return fail(err, ErrorKind::Io, "failed to write " + tmp.string());
    const std::string json = offset_index_json(end_offsets);
    f.write(json.data(), static_cast<std::streamsize>(json.size()));
    if (!f) return fail(err, ErrorKind::Io, "failed to write " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);  // replaces target on POSIX
  if (ec) {
    const std::string why = ec.message();
    std::filesystem::remove(tmp, ec);
    return fail(err, ErrorKind::Io, "failed to replace " + idx_path + ": " + why);
  }
  return true;
}

}
