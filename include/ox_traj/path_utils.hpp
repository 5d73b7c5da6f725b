#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace oxt {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// "<trajectory>.idx", the offset index sidecar.
std::string index_path_for(std::string_view trajectory_path);

// File size in bytes; false (and errno-style code in *ec) if it can't be stat'ed.
bool file_size_of(const std::string& path, std::uint64_t& size, std::error_code* ec = nullptr);

}
