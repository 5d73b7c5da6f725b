#include "ox_traj/offset_index.hpp"
#include "ox_traj/path_utils.hpp"
#include "ox_traj/record.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static void write_text(const fs::path& p, const std::string& body) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << body;
}

int main(){
  const fs::path dir = fs::temp_directory_path() / "oxt_offset_index";
  fs::create_directories(dir);
  const std::string idx = (dir / "traj.dat.idx").string();

  check(oxt::index_path_for("a/b/traj.dat") == "a/b/traj.dat.idx", "sidecar path");
  check(oxt::offset_index_json({71, 142}) == "[[0, 71, 0], [71, 71, 1]]", "json layout");

  // save -> load
  {
    const std::vector<std::uint64_t> ends = {71, 142, 300};
    oxt::Error err;
    check(oxt::save_offset_index(idx, ends, &err), "save: " + err.message);
    check(!fs::exists(idx + ".tmp"), "temp file renamed away");
    check(oxt::load_offset_index(idx, 300) == ends, "load matches");
    check(oxt::load_offset_index(idx, 301).empty(), "size mismatch discards");
  }

  // saving into a directory that doesn't exist yet
  {
    const std::string nested = (dir / "deeper" / "more" / "t.dat.idx").string();
    check(oxt::save_offset_index(nested, {5}) && oxt::load_offset_index(nested, 5).size() == 1,
          "parent dirs created");
  }

  // broken sidecars are ignored
  {
    write_text(idx, "[[0, 71, 0], [70, 71, 1]]");
    check(oxt::load_offset_index(idx, 141).empty(), "gap between entries");
    write_text(idx, "[[0, 0, 0], [0, 142, 1]]");
    check(oxt::load_offset_index(idx, 142).empty(), "zero-length entry");
    write_text(idx, "[[0, 71, 0], [71, 18446744073709551615, 1], [70, 72, 2]]");
    check(oxt::load_offset_index(idx, 142).empty(), "length wraps past the file");
    write_text(idx, "[[0, 200, 0]]");
    check(oxt::load_offset_index(idx, 142).empty(), "entry longer than the file");
    write_text(idx, "[[0, 71, 1]]");
    check(oxt::load_offset_index(idx, 71).empty(), "index out of sequence");
    write_text(idx, "[[0, 71]]");
    check(oxt::load_offset_index(idx, 71).empty(), "short triple");
    write_text(idx, "[[0, 71, 0, 9]]");
    check(oxt::load_offset_index(idx, 71).empty(), "long triple");
    write_text(idx, "[[0, -71, 0]]");
    check(oxt::load_offset_index(idx, 71).empty(), "negative length");
    write_text(idx, "[[0, 71, 0]");
    check(oxt::load_offset_index(idx, 71).empty(), "truncated json");
    write_text(idx, "{\"offsets\": []}");
    check(oxt::load_offset_index(idx, 71).empty(), "not an array");
    write_text(idx, "[]");
    check(oxt::load_offset_index(idx, 0).empty(), "empty array");
    check(oxt::load_offset_index((dir / "absent.idx").string(), 10).empty(), "missing file");
  }

  // a file another tool wrote with whitespace and newlines
  {
    write_text(idx, "[\n  [0, 10, 0],\n  [10, 15, 1]\n]\n");
    check(oxt::load_offset_index(idx, 25) == std::vector<std::uint64_t>{10, 25}, "pretty-printed sidecar");
  }

  if (failures) { std::cerr << "[FAIL] offset_index: " << failures << " checks failed\n"; return 1; }
  std::cout << "[PASS] offset_index\n";
  return 0;
}
