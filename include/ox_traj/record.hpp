#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace oxt {

constexpr std::size_t kHeaderValues  = 3;
constexpr std::size_t kParticleWidth = 15;

using Triple      = std::array<double, kHeaderValues>;
using ParticleRow = std::array<double, kParticleWidth>;

// One configuration block of a trajectory.
// Field widths are fixed by the types; the parser refuses anything else.
struct Record {
  std::uint64_t time = 0;
  Triple box{};
  Triple energy{};
  std::vector<ParticleRow> particles;
};

// A decoded record together with the byte offset where its block ends
// (the start of the next block, or the file size).
struct DecodedRecord {
  std::uint64_t end_offset = 0;
  Record record;
};

enum class ErrorKind { None, Io, Format, Range };

const char* to_string(ErrorKind k) noexcept;

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  explicit operator bool() const noexcept { return kind != ErrorKind::None; }
};

// Fill *err (when given) and return false, so call sites can `return fail(...)`.
bool fail(Error* err, ErrorKind kind, std::string message);

}
