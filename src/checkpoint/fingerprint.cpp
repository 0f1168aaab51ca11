#include "record_streamer/fingerprint.hpp"
#include "record_streamer/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace rs {

std::optional<Fingerprint> compute_fingerprint(const std::string& path,
                                               std::size_t sample_bytes,
                                               std::string* err_out) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (err_out) *err_out = "stat failed: " + path + ": " + ec.message();
    return std::nullopt;
  }
  std::string head;
  if (!read_slice(path, 0, sample_bytes, head, err_out)) return std::nullopt;

  Fingerprint fp;
  fp.digest = hex_sha256(head);
  fp.source_size = static_cast<std::uint64_t>(size);
  fp.sample_bytes = head.size();
  return fp;
}

}
