#include "ox_traj/work_queue.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>
#include <thread>

namespace oxt {

static int env_int(const char* key, int defv) {
  const char* v = std::getenv(key);
  if (!v || !*v) return defv;
  char* end = nullptr;
  long x = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return defv;
  return static_cast<int>(x);
}

unsigned resolve_threads(unsigned requested) {
  unsigned n = requested;
  if (n == 0) {
    int from_env = env_int("OXT_THREADS", 0);
    if (from_env > 0) n = static_cast<unsigned>(from_env);
  }
  if (n == 0) {
    n = std::thread::hardware_concurrency();
    if (n == 0) n = 4;
  }
  return std::min<unsigned>(n, 64u);
}

}
