#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace rs {

// Digest of a bounded leading slice plus the total length of a source.
struct Fingerprint {
  std::string   digest;            // hex SHA-256 of the first sample_bytes
  std::uint64_t source_size = 0;
  std::uint64_t sample_bytes = 0;  // bytes actually hashed

  bool operator==(const Fingerprint& o) const noexcept {
    return source_size == o.source_size && sample_bytes == o.sample_bytes && digest == o.digest;
  }
  bool operator!=(const Fingerprint& o) const noexcept { return !(*this == o); }
};

inline constexpr std::size_t kDefaultFingerprintBytes = 8 * 1024;

std::optional<Fingerprint> compute_fingerprint(const std::string& path,
                                               std::size_t sample_bytes = kDefaultFingerprintBytes,
                                               std::string* err_out = nullptr);

}
