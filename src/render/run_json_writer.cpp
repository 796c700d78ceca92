#include "rtcsv/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace rtcsv {

static void esc(std::ostringstream& o, std::string_view s){
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
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void counts(std::ostringstream& o, const char* key, const std::map<std::string, std::uint64_t>& m) {
  o << "\"" << key << "\":{";
  bool first = true;
  for (auto& kv : m) {
    if (!first) o << ",";
    first = false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"dialect\":{";
  o << "\"delimiter\":"; esc(o, p.delimiter); o << ",";
  o << "\"enclosure\":"; esc(o, p.enclosure); o << ",";
  o << "\"country\":";   esc(o, p.country);   o << ",";
  o << "\"header\":" << (p.header ? "true" : "false");
  o << "},";

  o << "\"records\":" << p.records << ",";
  o << "\"physical_lines\":" << p.physical_lines << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"fields\":" << p.fields << ",";
  o << "\"quoted_fields\":" << p.quoted_fields << ",";
  o << "\"malformed\":" << p.malformed << ",";
  o << "\"rebuild_mismatches\":" << p.rebuild_mismatches << ",";
  o << "\"round_trip_ok\":" << (p.round_trip_ok ? "true" : "false") << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  counts(o, "errors_by_kind", p.errors_by_kind);     o << ",";
  counts(o, "warnings_by_code", p.warnings_by_code); o << ",";
  counts(o, "values_by_kind", p.values_by_kind);     o << ",";

  o << "\"issues\":[";
  for (size_t i=0;i<p.issues.size();++i){
    if (i) o << ",";
    const auto& s = p.issues[i];
    o << "{\"line\":" << s.line << ",\"kind\":"; esc(o, s.kind);
    o << ",\"index\":" << s.index << ",\"context\":"; esc(o, s.context);
    o << ",\"message\":"; esc(o, s.message);
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
