#include "record_streamer/summary_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace rs {

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

std::string SummaryJsonWriter::to_json(const Summary& s, const std::string& source_path) {
  std::ostringstream o;
  o << "{";
  o << "\"source\":"; esc(o, source_path); o << ",";
  o << "\"source_size\":" << s.source_size << ",";
  o << "\"phase\":\"" << to_string(s.phase) << "\",";
  o << "\"stop_reason\":\"" << to_string(s.stop_reason) << "\",";
  o << "\"resumed\":" << (s.resumed ? "true" : "false") << ",";
  o << "\"resumed_from_record\":" << s.resumed_from_record << ",";
  o << "\"start_offset\":" << s.start_offset << ",";
  o << "\"seeked_via_index\":" << (s.seeked_via_index ? "true" : "false") << ",";
  o << "\"first_record\":" << s.first_record << ",";
  o << "\"last_record\":" << s.last_record << ",";
  o << "\"final_position\":" << s.final_position << ",";
  o << "\"emitted\":" << s.emitted << ",";
  o << "\"skipped_by_offset\":" << s.skipped_by_offset << ",";
  o << "\"skipped_errors\":" << s.skipped_errors << ",";
  o << "\"checkpoint_cleared\":" << (s.checkpoint_cleared ? "true" : "false") << ",";
  o << "\"checkpoint_retained\":" << (s.checkpoint_retained ? "true" : "false") << ",";

  const auto& st = s.stats;
  o << "\"stats\":{";
  o << "\"records_scanned\":" << st.records_scanned << ",";
  o << "\"bytes\":" << st.bytes << ",";
  o << "\"checkpoints_written\":" << st.checkpoints_written << ",";
  o << "\"degraded_events\":" << st.degraded_events << ",";
  o << "\"peak_buffer_bytes\":" << st.peak_buffer_bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(st.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(st.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(st.records_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<st.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, st.stages[i].name);
    o << ",\"duration_ms\":" << st.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : st.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}},";

  o << "\"warnings\":[";
  for (size_t i=0;i<s.warnings.size();++i){
    if (i) o << ",";
    o << "{\"kind\":\"" << to_string(s.warnings[i].kind) << "\",\"message\":";
    esc(o, s.warnings[i].message);
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
