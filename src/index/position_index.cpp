#include "record_streamer/position_index.hpp"
#include "record_streamer/path_utils.hpp"

#include <simdjson.h>
#include <charconv>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

namespace rs {

static constexpr std::uint64_t kIndexVersion = 2;

PositionIndex::PositionIndex(std::string source_path, Config cfg)
  : source_(std::move(source_path)),
    path_(position_cache_path_for(source_, cfg.path)),
    cfg_(std::move(cfg)),
    stride_(cfg_.stride ? cfg_.stride : 1) {}

void PositionIndex::sample(std::uint64_t record_number, std::uint64_t byte_offset) {
  if (record_number == 0 || !wants(record_number)) return;
  auto it = entries_.find(record_number);
  if (it != entries_.end() && it->second == byte_offset) return;
  entries_[record_number] = byte_offset;
  dirty_ = true;
  if (cfg_.max_entries && entries_.size() > cfg_.max_entries * 2) downsample();
}

std::optional<PositionIndex::Entry> PositionIndex::nearest_at_or_below(std::uint64_t record_number) const {
  auto it = entries_.upper_bound(record_number);
  if (it == entries_.begin()) return std::nullopt;
  --it;
  return Entry{it->first, it->second};
}

// Double the stride until the map fits, keeping only its multiples.
void PositionIndex::downsample() {
  while (cfg_.max_entries && entries_.size() > cfg_.max_entries) {
    stride_ *= 2;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->first % stride_ != 0) it = entries_.erase(it); else ++it;
    }
    dirty_ = true;
  }
}

void PositionIndex::clear() {
  if (!entries_.empty()) dirty_ = true;
  entries_.clear();
  stride_ = cfg_.stride ? cfg_.stride : 1;
}

bool PositionIndex::remove_file() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) { err_ = ec.message(); return false; }
  return true;
}

bool PositionIndex::load(const Fingerprint& fp) {
  entries_.clear();
  stride_ = cfg_.stride ? cfg_.stride : 1;
  dirty_ = false;

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return false;

  try {
    simdjson::padded_string json = simdjson::padded_string::load(path_);
    simdjson::ondemand::parser parser;
    auto doc = parser.iterate(json);

    if (doc["version"].get_uint64().value() != kIndexVersion) {
      err_ = "unsupported position cache version";
      return false;
    }
    std::string_view digest = doc["fingerprint"].get_string().value();
    std::uint64_t size = doc["source_size"].get_uint64().value();
    std::uint64_t sampled = doc["fingerprint_bytes"].get_uint64().value();
    if (digest != fp.digest || size != fp.source_size || sampled != fp.sample_bytes) {
      err_ = "position cache was built for a different version of the source";
      return false;
    }
    std::int64_t mtime = doc["source_mtime"].get_int64().value();
    auto live = file_mtime_ticks(source_, &err_);
    if (!live) return false;
    if (mtime != *live) {
      err_ = "source modified since the position cache was written";
      return false;
    }
    std::uint64_t stride = doc["stride"].get_uint64().value();

    std::map<std::uint64_t, std::uint64_t> loaded;
    for (auto field : doc["entries"].get_object()) {
      std::string_view key = field.unescaped_key().value();
      std::uint64_t n = 0;
      auto [ptr, ec2] = std::from_chars(key.data(), key.data() + key.size(), n);
      if (ec2 != std::errc() || ptr != key.data() + key.size() || n == 0) {
        err_ = "bad record number key: " + std::string(key);
        return false;
      }
      loaded[n] = field.value().get_uint64().value();
    }
    if (stride > stride_) stride_ = stride;
    entries_ = std::move(loaded);
    return true;
  } catch (const simdjson::simdjson_error& e) {
    err_ = std::string("unreadable position cache: ") + e.what();
    entries_.clear();
    return false;
  }
}

bool PositionIndex::save(const Fingerprint& fp) {
  auto mtime = file_mtime_ticks(source_, &err_);
  if (!mtime) return false;
  downsample();
  std::ostringstream o;
  o << "{\"version\":" << kIndexVersion
    << ",\"fingerprint\":\"" << fp.digest << "\""
    << ",\"fingerprint_bytes\":" << fp.sample_bytes
    << ",\"source_size\":" << fp.source_size
    << ",\"source_mtime\":" << *mtime
    << ",\"stride\":" << stride_
    << ",\"entries\":{";
  bool first = true;
  for (const auto& kv : entries_) {
    if (!first) o << ",";
    first = false;
    o << "\"" << kv.first << "\":" << kv.second;
  }
  o << "}}\n";
  if (!write_file_atomic(path_, o.str(), &err_)) return false;
  dirty_ = false;
  return true;
}

}
