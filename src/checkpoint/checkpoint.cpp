#include "record_streamer/checkpoint.hpp"

#include <simdjson.h>
#include <sstream>

namespace rs {

const char* to_string(Phase p) noexcept {
  switch (p) {
    case Phase::Init:        return "init";
    case Phase::Scanning:    return "scanning";
    case Phase::Interrupted: return "interrupted";
    case Phase::Completed:   return "completed";
    case Phase::Failed:      return "failed";
  }
  return "init";
}

std::optional<Phase> parse_phase(std::string_view s) noexcept {
  if (s == "init")        return Phase::Init;
  if (s == "scanning")    return Phase::Scanning;
  if (s == "interrupted") return Phase::Interrupted;
  if (s == "completed")   return Phase::Completed;
  if (s == "failed")      return Phase::Failed;
  return std::nullopt;
}

static void esc(std::ostringstream& o, std::string_view s) {
  static const char* hex = "0123456789abcdef";
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

std::string to_json(const Checkpoint& cp) {
  std::ostringstream o;
  o << "{\n";
  o << "  \"version\": " << cp.version << ",\n";
  o << "  \"source_path\": "; esc(o, cp.source_path); o << ",\n";
  o << "  \"byte_position\": " << cp.byte_position << ",\n";
  o << "  \"record_count\": " << cp.record_count << ",\n";
  o << "  \"timestamp\": " << cp.created_at << ",\n";
  o << "  \"source_size\": " << cp.source_size << ",\n";
  o << "  \"fingerprint\": "; esc(o, cp.fingerprint.digest); o << ",\n";
  o << "  \"fingerprint_bytes\": " << cp.fingerprint.sample_bytes << ",\n";
  o << "  \"chunk_size\": " << cp.chunk_size << ",\n";

  const auto& st = cp.state;
  o << "  \"state\": {\n";
  o << "    \"namespace_detected\": " << (st.namespace_detected ? "true" : "false") << ",\n";
  o << "    \"namespace_prefix\": ";
  if (st.namespace_prefix) esc(o, *st.namespace_prefix); else o << "null";
  o << ",\n";
  o << "    \"header_processed\": " << (st.header_processed ? "true" : "false") << ",\n";
  o << "    \"total_record_count\": " << st.total_record_count << ",\n";
  o << "    \"processed_count\": " << st.processed_count << ",\n";
  o << "    \"skipped_count\": " << st.skipped_count << ",\n";
  o << "    \"phase\": "; esc(o, to_string(st.phase)); o << "\n";
  o << "  }\n";
  o << "}\n";
  return o.str();
}

std::optional<Checkpoint> checkpoint_from_json(std::string_view json, std::string* err_out) {
  auto fail = [&](const std::string& why) -> std::optional<Checkpoint> {
    if (err_out) *err_out = why;
    return std::nullopt;
  };

  simdjson::padded_string padded(json);
  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (auto err = parser.iterate(padded).get(doc)) {
    return fail(std::string("invalid json: ") + simdjson::error_message(err));
  }
  simdjson::ondemand::object root;
  if (doc.get_object().get(root)) return fail("checkpoint is not an object");

  Checkpoint cp;
  std::int64_t version = 0;
  if (root["version"].get(version)) return fail("missing field: version");
  if (version != kCheckpointVersion) return fail("unsupported checkpoint version " + std::to_string(version));
  cp.version = static_cast<int>(version);

  std::string_view sv;
  if (root["source_path"].get(sv) == simdjson::SUCCESS) cp.source_path.assign(sv);

  if (root["byte_position"].get(cp.byte_position)) return fail("missing field: byte_position");
  if (root["record_count"].get(cp.record_count))   return fail("missing field: record_count");
  if (root["timestamp"].get(cp.created_at))        return fail("missing field: timestamp");
  if (root["source_size"].get(cp.source_size))     return fail("missing field: source_size");
  if (root["fingerprint"].get(sv))                 return fail("missing field: fingerprint");
  cp.fingerprint.digest.assign(sv);
  if (root["fingerprint_bytes"].get(cp.fingerprint.sample_bytes)) return fail("missing field: fingerprint_bytes");
  cp.fingerprint.source_size = cp.source_size;
  if (root["chunk_size"].get(cp.chunk_size))       return fail("missing field: chunk_size");

  simdjson::ondemand::object st;
  if (root["state"].get(st)) return fail("missing field: state");
  auto& s = cp.state;
  if (st["namespace_detected"].get(s.namespace_detected)) return fail("missing field: state.namespace_detected");
  simdjson::ondemand::value prefix;
  if (st["namespace_prefix"].get(prefix)) return fail("missing field: state.namespace_prefix");
  simdjson::ondemand::json_type prefix_type;
  if (prefix.type().get(prefix_type)) return fail("state.namespace_prefix is unreadable");
  if (prefix_type != simdjson::ondemand::json_type::null) {
    if (prefix.get(sv)) return fail("state.namespace_prefix is not a string");
    s.namespace_prefix = std::string(sv);
  }
  if (st["header_processed"].get(s.header_processed))     return fail("missing field: state.header_processed");
  if (st["total_record_count"].get(s.total_record_count)) return fail("missing field: state.total_record_count");
  if (st["processed_count"].get(s.processed_count))       return fail("missing field: state.processed_count");
  if (st["skipped_count"].get(s.skipped_count))           return fail("missing field: state.skipped_count");
  if (st["phase"].get(sv)) return fail("missing field: state.phase");
  auto phase = parse_phase(sv);
  if (!phase) return fail("unknown phase: " + std::string(sv));
  s.phase = *phase;

  if (cp.byte_position > cp.source_size) return fail("byte_position beyond source_size");
  if (cp.record_count > 0 && cp.byte_position == 0) return fail("records counted at byte 0");
  return cp;
}

}
