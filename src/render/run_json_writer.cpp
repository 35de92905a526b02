#include "byline/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace bl {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static void esc_list(std::ostringstream& o, const std::vector<std::string>& v){
  o << "[";
  for (size_t i=0;i<v.size();++i){
    if (i) o << ",";
    esc(o, v[i]);
  }
  o << "]";
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"records_in\":" << p.records_in << ",";
  o << "\"records_out\":" << p.records_out << ",";
  o << "\"records_omitted\":" << p.records_omitted << ",";
  o << "\"bytes_in\":" << p.bytes_in << ",";
  o << "\"bytes_out\":" << p.bytes_out << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(p.records_per_sec) << ",";

  o << "\"inputs\":"; esc_list(o, p.inputs); o << ",";
  o << "\"rs\":";     esc(o, std::string(1, p.rs)); o << ",";
  o << "\"fs\":";     esc(o, p.fs); o << ",";
  o << "\"filters\":"; esc_list(o, p.filters); o << ",";
  o << "\"status\":"; esc(o, p.status);

  o << "}";
  return o.str();
}

}
