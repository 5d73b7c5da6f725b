#include "ox_traj/path_utils.hpp"
#include <system_error>

namespace oxt {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string index_path_for(std::string_view trajectory_path) {
  std::string out(trajectory_path);
  out += ".idx";
  return out;
}

bool file_size_of(const std::string& path, std::uint64_t& size, std::error_code* ec) {
  std::error_code local;
  auto n = std::filesystem::file_size(path, local);
  if (local) {
    if (ec) *ec = local;
    return false;
  }
  size = static_cast<std::uint64_t>(n);
  return true;
}

}
