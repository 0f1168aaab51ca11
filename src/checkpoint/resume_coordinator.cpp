#include "record_streamer/resume_coordinator.hpp"
#include "record_streamer/boundary_scanner.hpp"
#include "record_streamer/checkpoint_store.hpp"
#include "record_streamer/log.hpp"
#include "record_streamer/path_utils.hpp"

#include <algorithm>
#include <string>

namespace rs {

// First read before the resume position; doubled until it reaches a '<'.
static constexpr std::size_t kTailProbeBytes = 16 * 1024;

std::uint64_t BatchWindow::remaining(std::uint64_t scanned) const noexcept {
  if (limit == 0) return 0;
  const std::uint64_t last = offset + limit;
  if (scanned >= last) return 0;
  return last - std::max(scanned, offset);
}

ResumeCoordinator::ResumeCoordinator(CheckpointStore& store, const BoundaryScanner& scanner)
  : store_(store), scanner_(scanner) {}

bool ResumeCoordinator::position_follows_record(const std::string& path, std::uint64_t pos) const {
  std::uint64_t probe = std::min<std::uint64_t>(pos, kTailProbeBytes);
  std::string tail;
  for (;;) {
    if (!read_slice(path, pos - probe, static_cast<std::size_t>(probe), tail)) return false;
    if (tail.size() != probe) return false;
    if (tail.find('<') != std::string::npos || probe == pos) break;
    probe = std::min<std::uint64_t>(pos, probe * 2);
  }
  return scanner_.ends_with_record_close(tail);
}

StartPlan ResumeCoordinator::prepare(const Policy& policy) const {
  StartPlan plan;

  if (!policy.resume && !policy.auto_resume) {
    if (store_.exists())
      log::info("resume", "auto-resume disabled; existing checkpoint will be overwritten");
    return plan;
  }

  auto r = store_.load();
  switch (r.status) {
    case CheckpointStore::LoadStatus::Absent:
      if (policy.resume) log::info("resume", "resume requested but no checkpoint at " + store_.path() + "; starting fresh");
      return plan;
    case CheckpointStore::LoadStatus::Stale:
    case CheckpointStore::LoadStatus::Expired:
      log::warn("resume", r.message + "; starting fresh");
      plan.warnings.push_back(Warning{ErrorKind::ChecksumMismatch, r.message});
      return plan;
    case CheckpointStore::LoadStatus::Corrupt:
      log::warn("resume", r.message + "; starting fresh");
      plan.warnings.push_back(Warning{ErrorKind::CorruptCheckpoint, r.message});
      return plan;
    case CheckpointStore::LoadStatus::Valid:
      break;
  }

  const Checkpoint& cp = *r.checkpoint;
  if (cp.byte_position > 0 && !position_follows_record(store_.source_path(), cp.byte_position)) {
    throw ScanError(ErrorKind::ResumePositionMismatch,
                    "checkpoint position " + std::to_string(cp.byte_position) +
                    " does not follow a closing " + scanner_.pattern().close_tag +
                    " in " + store_.source_path());
  }

  const std::string prefix = cp.state.namespace_prefix.value_or(std::string{});
  if (cp.state.header_processed && prefix != scanner_.pattern().prefix) {
    log::warn("resume", "checkpoint recorded prefix '" + prefix + "', document head now gives '" +
              scanner_.pattern().prefix + "'");
  }

  plan.kind = StartPlan::Kind::Resume;
  plan.start_offset = cp.byte_position;
  plan.start_record = cp.record_count;
  plan.state = cp.state;
  plan.checkpoint = cp;
  log::info("resume", "resuming after record " + std::to_string(cp.record_count) +
            " at byte " + std::to_string(cp.byte_position));
  return plan;
}

}
