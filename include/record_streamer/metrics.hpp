#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t records_scanned = 0;
  std::uint64_t records_emitted = 0;
  std::uint64_t records_skipped = 0;
  std::uint64_t bytes = 0;
  std::uint64_t checkpoints_written = 0;
  std::uint64_t degraded_events = 0;
  std::uint64_t peak_buffer_bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

class MetricsRegistry {
public:
  void add_scanned() noexcept { ++scanned_; }
  void add_emitted() noexcept { ++emitted_; }
  void add_skipped() noexcept { ++skipped_; }
  void add_checkpoint() noexcept { ++checkpoints_; }
  void add_degraded() noexcept { ++degraded_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }
  void note_buffer(std::uint64_t b) noexcept { if (b > peak_buffer_) peak_buffer_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(std::string_view kind);
  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t scanned_{0};
  std::uint64_t emitted_{0};
  std::uint64_t skipped_{0};
  std::uint64_t checkpoints_{0};
  std::uint64_t degraded_{0};
  std::uint64_t bytes_{0};
  std::uint64_t peak_buffer_{0};
  std::unordered_map<std::string, std::uint64_t> errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
