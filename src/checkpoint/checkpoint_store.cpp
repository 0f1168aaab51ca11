#include "record_streamer/checkpoint_store.hpp"
#include "record_streamer/path_utils.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

namespace rs {

static std::int64_t now_s() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

const char* to_string(CheckpointStore::LoadStatus s) noexcept {
  switch (s) {
    case CheckpointStore::LoadStatus::Absent:  return "absent";
    case CheckpointStore::LoadStatus::Valid:   return "valid";
    case CheckpointStore::LoadStatus::Stale:   return "stale";
    case CheckpointStore::LoadStatus::Expired: return "expired";
    case CheckpointStore::LoadStatus::Corrupt: return "corrupt";
  }
  return "absent";
}

CheckpointStore::CheckpointStore(std::string source_path)
  : CheckpointStore(std::move(source_path), Config{}) {}

CheckpointStore::CheckpointStore(std::string source_path, Config cfg)
  : source_(std::move(source_path)), cfg_(std::move(cfg)) {
  path_ = checkpoint_path_for(source_, cfg_.path);
}

std::optional<Checkpoint> CheckpointStore::save(std::uint64_t byte_position,
                                                std::uint64_t record_count,
                                                const SessionState& state,
                                                std::uint64_t chunk_size) {
  auto fp = compute_fingerprint(source_, cfg_.fingerprint_bytes, &err_);
  if (!fp) return std::nullopt;

  Checkpoint cp;
  cp.source_path = source_;
  cp.byte_position = byte_position;
  cp.record_count = record_count;
  cp.created_at = now_s();
  cp.source_size = fp->source_size;
  cp.fingerprint = std::move(*fp);
  cp.chunk_size = chunk_size;
  cp.state = state;

  if (!write_file_atomic(path_, to_json(cp), &err_)) return std::nullopt;
  return cp;
}

std::optional<Checkpoint> CheckpointStore::peek() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return std::nullopt;
  auto text = read_whole_file(path_, &err_);
  if (!text) return std::nullopt;
  return checkpoint_from_json(*text, &err_);
}

CheckpointStore::LoadResult CheckpointStore::inspect() const {
  LoadResult r;
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return r;

  auto text = read_whole_file(path_, &err_);
  if (!text) {
    r.status = LoadStatus::Corrupt;
    r.message = err_;
    return r;
  }
  std::string why;
  auto cp = checkpoint_from_json(*text, &why);
  if (!cp) {
    r.status = LoadStatus::Corrupt;
    r.message = "unreadable checkpoint " + path_ + ": " + why;
    return r;
  }

  auto live = compute_fingerprint(source_, cp->fingerprint.sample_bytes, &err_);
  if (!live || *live != cp->fingerprint) {
    r.status = LoadStatus::Stale;
    r.message = "source changed since checkpoint " + path_ + " was written";
    return r;
  }

  if (cfg_.max_age_s > 0 && now_s() - cp->created_at > cfg_.max_age_s) {
    r.status = LoadStatus::Expired;
    r.message = "checkpoint older than " + std::to_string(cfg_.max_age_s) + "s";
    return r;
  }

  r.status = LoadStatus::Valid;
  r.checkpoint = std::move(cp);
  return r;
}

CheckpointStore::LoadResult CheckpointStore::load() const {
  LoadResult r = inspect();
  if (r.status == LoadStatus::Stale) {
    std::error_code ec;
    if (!std::filesystem::remove(path_, ec) && ec)
      r.message += "; remove failed: " + ec.message();
  }
  return r;
}

bool CheckpointStore::clear() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return true;
  if (!std::filesystem::remove(path_, ec) || ec) {
    err_ = "remove failed: " + path_ + ": " + ec.message();
    return false;
  }
  return true;
}

bool CheckpointStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

}
