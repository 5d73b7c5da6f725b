#include "ox_traj/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace oxt {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"blocks\":" << p.blocks << ",";
  o << "\"particles\":" << p.particles << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"blocks_per_sec\":" << safe_num(p.blocks_per_sec) << ",";
  o << "\"threads\":" << p.threads << ",";
  o << "\"first_time\":" << p.first_time << ",";
  o << "\"last_time\":" << p.last_time << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : p.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
