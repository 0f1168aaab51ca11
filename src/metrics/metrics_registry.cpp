#include "record_streamer/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rs {

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_error(std::string_view kind) {
  ++errs_[std::string(kind)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records_scanned = scanned_;
  r.records_emitted = emitted_;
  r.records_skipped = skipped_;
  r.bytes = bytes_;
  r.checkpoints_written = checkpoints_;
  r.degraded_events = degraded_;
  r.peak_buffer_bytes = peak_buffer_;
  r.wall_time_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.records_per_sec = (sec > 0.0) ? scanned_ / sec : 0.0;

  r.errors_by_kind = errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
