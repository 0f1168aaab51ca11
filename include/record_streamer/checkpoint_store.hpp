#pragma once
#include "record_streamer/checkpoint.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rs {

// Durable resume state for one source, stored as "<source>.checkpoint"
// unless a path is given. Writes are atomic (temp file + rename).
class CheckpointStore {
public:
  struct Config {
    std::string  path;                                  // empty: "<source>.checkpoint"
    std::size_t  fingerprint_bytes = kDefaultFingerprintBytes;
    std::int64_t max_age_s = 0;                         // 0: never expires
  };

  enum class LoadStatus { Absent, Valid, Stale, Expired, Corrupt };

  struct LoadResult {
    LoadStatus status = LoadStatus::Absent;
    std::optional<Checkpoint> checkpoint;  // set only when Valid
    std::string message;
  };

  explicit CheckpointStore(std::string source_path);
  CheckpointStore(std::string source_path, Config cfg);

  // Fingerprint the source as it is now and persist the checkpoint.
  std::optional<Checkpoint> save(std::uint64_t byte_position,
                                 std::uint64_t record_count,
                                 const SessionState& state,
                                 std::uint64_t chunk_size);

  // Read and validate against the live source without touching the file.
  LoadResult inspect() const;

  // inspect(), then remove the file when its fingerprint is stale; corrupt
  // or expired files are reported and ignored.
  LoadResult load() const;

  // Read without validation (diagnostics).
  std::optional<Checkpoint> peek() const;

  bool clear();
  bool exists() const;

  const std::string& path() const noexcept { return path_; }
  const std::string& source_path() const noexcept { return source_; }
  const std::string& last_error() const noexcept { return err_; }

private:
  std::string source_;
  std::string path_;
  Config cfg_;
  mutable std::string err_;
};

const char* to_string(CheckpointStore::LoadStatus s) noexcept;

}
