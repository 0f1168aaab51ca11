#pragma once
#include "record_streamer/checkpoint.hpp"
#include "record_streamer/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rs {

class BoundaryScanner;
class CheckpointStore;

// Where a run starts and what it carries over from a previous run.
struct StartPlan {
  enum class Kind { Fresh, Resume };

  Kind kind = Kind::Fresh;
  std::optional<Checkpoint> checkpoint;
  std::uint64_t start_offset = 0;   // byte to start reading at
  std::uint64_t start_record = 0;   // records already accounted for before it
  SessionState state;
  std::vector<Warning> warnings;

  bool resumed() const noexcept { return kind == Kind::Resume; }
};

// An offset/limit slice of the record sequence (1-based record numbers).
// Record n is emitted iff n > offset and (limit == 0 or n <= offset + limit).
struct BatchWindow {
  std::uint64_t offset = 0;
  std::uint64_t limit = 0;  // 0: unbounded

  bool skips(std::uint64_t n) const noexcept { return n <= offset; }
  bool contains(std::uint64_t n) const noexcept { return n > offset && (limit == 0 || n <= offset + limit); }
  bool done_after(std::uint64_t n) const noexcept { return limit != 0 && n >= offset + limit; }

  // Records still to emit once `scanned` records are behind us.
  std::uint64_t remaining(std::uint64_t scanned) const noexcept;
};

class ResumeCoordinator {
public:
  struct Policy {
    bool resume = false;       // explicit request
    bool auto_resume = true;   // resume whenever a valid checkpoint exists
  };

  ResumeCoordinator(CheckpointStore& store, const BoundaryScanner& scanner);

  // Decide between a fresh start and resuming. Checkpoint problems are
  // recovered here (reported as warnings); a checkpoint whose position does
  // not sit right after a record close throws ResumePositionMismatch.
  StartPlan prepare(const Policy& policy) const;

private:
  bool position_follows_record(const std::string& path, std::uint64_t pos) const;

  CheckpointStore& store_;
  const BoundaryScanner& scanner_;
};

}
