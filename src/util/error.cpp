#include "ox_traj/record.hpp"
#include <utility>

namespace oxt {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:   return "none";
    case ErrorKind::Io:     return "io";
    case ErrorKind::Format: return "format";
    case ErrorKind::Range:  return "range";
  }
  return "unknown";
}

bool fail(Error* err, ErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
  return false;
}

}
