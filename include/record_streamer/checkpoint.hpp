#pragma once
#include "record_streamer/fingerprint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rs {

enum class Phase { Init, Scanning, Interrupted, Completed, Failed };

const char* to_string(Phase p) noexcept;
std::optional<Phase> parse_phase(std::string_view s) noexcept;

// Parser state carried inside a checkpoint so a resumed run picks up the
// same tag configuration and cumulative counters.
struct SessionState {
  bool namespace_detected = false;
  std::optional<std::string> namespace_prefix;
  bool header_processed = false;
  std::uint64_t total_record_count = 0;  // records scanned up to byte_position
  std::uint64_t processed_count = 0;     // records handed to the callback
  std::uint64_t skipped_count = 0;       // records skipped after a callback error
  Phase phase = Phase::Init;
};

inline constexpr int kCheckpointVersion = 1;

// byte_position is always one past the '>' closing a record, never mid-record.
struct Checkpoint {
  int           version = kCheckpointVersion;
  std::string   source_path;
  std::uint64_t byte_position = 0;
  std::uint64_t record_count = 0;
  std::int64_t  created_at = 0;   // unix seconds
  std::uint64_t source_size = 0;
  Fingerprint   fingerprint;
  std::uint64_t chunk_size = 0;
  SessionState  state;
};

std::string to_json(const Checkpoint& cp);

// Parse a checkpoint document. Returns nullopt (with a reason) when the text
// is not valid JSON or a required field is missing or has the wrong type.
std::optional<Checkpoint> checkpoint_from_json(std::string_view json, std::string* err_out = nullptr);

}
