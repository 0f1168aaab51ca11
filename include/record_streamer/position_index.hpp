#pragma once
#include "record_streamer/fingerprint.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace rs {

// Sparse record-number -> start-offset map used to seek near a large window
// offset. Only ever a hint: callers re-validate the offset before trusting it.
class PositionIndex {
public:
  struct Config {
    std::string   path;                 // empty: "<source>.position_cache"
    std::uint64_t stride = 100;         // sample every `stride` records
    std::size_t   max_entries = 10000;  // coarsen the stride beyond this
  };

  struct Entry {
    std::uint64_t record_number = 0;
    std::uint64_t byte_offset = 0;
  };

  PositionIndex(std::string source_path, Config cfg);

  // Load entries recorded for `fp` and the source's current modification
  // time; a missing, corrupt or stale file leaves the index empty and
  // returns false.
  bool load(const Fingerprint& fp);
  bool save(const Fingerprint& fp);

  void sample(std::uint64_t record_number, std::uint64_t byte_offset);
  bool wants(std::uint64_t record_number) const noexcept { return record_number % stride_ == 0; }

  std::optional<Entry> nearest_at_or_below(std::uint64_t record_number) const;

  void clear();
  bool remove_file();

  std::size_t   size() const noexcept { return entries_.size(); }
  std::uint64_t stride() const noexcept { return stride_; }
  bool          dirty() const noexcept { return dirty_; }
  const std::map<std::uint64_t, std::uint64_t>& entries() const noexcept { return entries_; }
  const std::string& path() const noexcept { return path_; }
  const std::string& last_error() const noexcept { return err_; }

private:
  void downsample();

  std::string source_;
  std::string path_;
  Config cfg_;
  std::uint64_t stride_;
  std::map<std::uint64_t, std::uint64_t> entries_;
  bool dirty_{false};
  std::string err_;
};

}
