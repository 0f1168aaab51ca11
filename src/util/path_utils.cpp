#include "record_streamer/path_utils.hpp"
#include <openssl/sha.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace rs {

std::string checkpoint_path_for(const std::string& source, const std::string& override_path) {
  return override_path.empty() ? source + ".checkpoint" : override_path;
}

std::string position_cache_path_for(const std::string& source, const std::string& override_path) {
  return override_path.empty() ? source + ".position_cache" : override_path;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::optional<std::int64_t> file_mtime_ticks(const std::string& path, std::string* err_out) {
  std::error_code ec;
  const auto t = std::filesystem::last_write_time(path, ec);
  if (ec) {
    if (err_out) *err_out = "stat failed: " + path + ": " + ec.message();
    return std::nullopt;
  }
  return static_cast<std::int64_t>(t.time_since_epoch().count());
}

bool read_slice(const std::string& path, std::uint64_t offset, std::size_t len,
                std::string& out, std::string* err_out) {
  out.clear();
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (err_out) *err_out = "open failed: " + path + ": " + std::strerror(errno);
    return false;
  }
  if (fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
    if (err_out) *err_out = "seek failed: " + path + ": " + std::strerror(errno);
    std::fclose(f);
    return false;
  }
  out.resize(len);
  std::size_t n = std::fread(out.data(), 1, len, f);
  const bool bad = (n < len) && std::ferror(f);
  std::fclose(f);
  out.resize(n);
  if (bad) {
    if (err_out) *err_out = "read failed: " + path;
    return false;
  }
  return true;
}

std::optional<std::string> read_whole_file(const std::string& path, std::string* err_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err_out) *err_out = "open failed: " + path;
    return std::nullopt;
  }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

bool write_file_atomic(const std::string& path, std::string_view data, std::string* err_out) {
  const std::filesystem::path target(path);
  if (!ensure_parent_dirs(target)) {
    if (err_out) *err_out = "cannot create parent directory for " + path;
    return false;
  }
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (err_out) *err_out = "open failed: " + tmp;
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      if (err_out) *err_out = "write failed: " + tmp;
      std::error_code ec; std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    if (err_out) *err_out = "rename failed: " + tmp + " -> " + path + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

std::string hex_sha256(std::string_view data) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  return o.str();
}

}
