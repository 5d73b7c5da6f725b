#include "ox_traj/record_parser.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool contains(const std::string& s, const std::string& part) {
  return s.find(part) != std::string::npos;
}

using Lines = std::vector<std::string>;

static oxt::Error parse_err(const Lines& lines, const oxt::ParseConfig& cfg = {}) {
  oxt::Record r;
  oxt::Error err;
  if (oxt::parse_record(lines, r, &err, cfg)) err.message = "<parsed>";
  return err;
}

int main(){
  const std::string zeros = "0 0 0 0 0 0 0 0 0 0 0 0 0 0 0";
  const std::string row = "1.5 -2 3e2 0.25 0 0 0 0 1 0 0 0 0 0 -0.125";

  // happy path
  {
    oxt::Record r;
    oxt::Error err;
    bool ok = oxt::parse_record({"t = 42", "b = 10.0 11.5 12", "E = -1.25 2 3.0", zeros, "  " + row + "\t"},
                                r, &err);
    check(ok && !err, "valid block parses");
    check(r.time == 42, "time");
    check(r.box[0] == 10.0 && r.box[1] == 11.5 && r.box[2] == 12.0, "box");
    check(r.energy[0] == -1.25 && r.energy[1] == 2.0 && r.energy[2] == 3.0, "energy");
    check(r.particles.size() == 2, "particle count");
    check(r.particles[0][14] == 0.0 && r.particles[1][0] == 1.5 && r.particles[1][2] == 300.0 &&
          r.particles[1][14] == -0.125, "particle values (row trimmed)");
  }

  // header-only block is a record with no particles
  {
    oxt::Record r;
    check(oxt::parse_record({"t = 0", "b = 1 1 1", "E = 0 0 0"}, r), "no particles");
    check(r.particles.empty(), "empty particle list");
  }

  // energy header absent: either the block is too short or the row sits where E should be
  {
    auto e1 = parse_err({"t = 0", "b = 1 1 1"});
    check(e1.kind == oxt::ErrorKind::Format && contains(e1.message, "energy"), "short block names energy");
    auto e2 = parse_err({"t = 0", "b = 1 1 1", zeros});
    check(e2.kind == oxt::ErrorKind::Format && contains(e2.message, "energy") &&
          contains(e2.message, zeros), "row in energy slot names energy and the text");
  }

  // 14-field row names the row text
  {
    const std::string short_row = "1 1 1 1 1 1 1 1 1 1 1 1 1 1";
    auto e = parse_err({"t = 0", "b = 1 1 1", "E = 1 2 3", zeros, short_row});
    check(e.kind == oxt::ErrorKind::Format && contains(e.message, short_row), "14 fields names row");
    check(contains(e.message, "particle"), "14 fields says particle");
  }

  // header failures
  {
    auto e = parse_err({});
    check(e.kind == oxt::ErrorKind::Format && contains(e.message, "time"), "missing time header");
    e = parse_err({"x = 0", "b = 1 1 1", "E = 1 2 3"});
    check(contains(e.message, "time") && contains(e.message, "x = 0"), "wrong time prefix");
    e = parse_err({"t 0", "b = 1 1 1", "E = 1 2 3"});
    check(contains(e.message, "time") && contains(e.message, "t 0"), "time without '='");
    e = parse_err({"t = abc", "b = 1 1 1", "E = 1 2 3"});
    check(contains(e.message, "invalid time") && contains(e.message, "abc"), "invalid time value");
    e = parse_err({"t = -1", "b = 1 1 1", "E = 1 2 3"});
    check(e.kind == oxt::ErrorKind::Format, "negative time rejected");
    e = parse_err({"t = 1", "B = 1 1 1", "E = 1 2 3"});
    check(contains(e.message, "box") && contains(e.message, "B = 1 1 1"), "wrong box prefix");
    e = parse_err({"t = 1", "b = 1 1", "E = 1 2 3"});
    check(contains(e.message, "box") && contains(e.message, "1 1"), "two box values");
    e = parse_err({"t = 1", "b = 1 1 1 1", "E = 1 2 3"});
    check(contains(e.message, "box"), "four box values");
    e = parse_err({"t = 1", "b = 1 1 1", "E = 1 two 3"});
    check(contains(e.message, "energy") && contains(e.message, "two"), "bad energy token");
  }

  // tokenization policy: strict splits on every space, collapse does not
  {
    const Lines doubled = {"t = 1", "b = 1  1 1", "E = 1 2 3"};
    auto e = parse_err(doubled);
    check(e.kind == oxt::ErrorKind::Format && contains(e.message, "box"), "strict rejects double space");

    oxt::ParseConfig collapse;
    collapse.split = oxt::TokenSplit::Collapse;
    oxt::Record r;
    check(oxt::parse_record(doubled, r, nullptr, collapse) && r.box[1] == 1.0, "collapse accepts");
    check(oxt::parse_record({"t = 1", "b = 1\t1 1", "E = 1 2 3", "0\t0 0  0 0 0 0 0 0 0 0 0 0 0 0"},
                            r, nullptr, collapse) && r.particles.size() == 1, "collapse handles tabs");
  }

  // all-or-nothing: a failed parse leaves the output alone
  {
    oxt::Record r;
    r.time = 99;
    r.particles.resize(3);
    oxt::Error err;
    check(!oxt::parse_record({"t = 1", "b = 1 1 1", "E = 1 2 3", zeros, "bad"}, r, &err), "fails");
    check(r.time == 99 && r.particles.size() == 3, "output untouched");
  }

  // explicit '+' and special values are accepted like other writers produce them
  {
    oxt::Record r;
    check(oxt::parse_record({"t = +3", "b = +1 inf 1", "E = nan 2 3"}, r), "plus / inf / nan");
    check(r.time == 3 && r.box[0] == 1.0 && r.box[1] > 1e308 && r.energy[0] != r.energy[0],
          "special values");
  }

  if (failures) { std::cerr << "[FAIL] record_parser: " << failures << " checks failed\n"; return 1; }
  std::cout << "[PASS] record_parser\n";
  return 0;
}
