#include "record_streamer/record_streamer.hpp"
#include "record_streamer/boundary_scanner.hpp"
#include "record_streamer/checkpoint_store.hpp"
#include "record_streamer/chunk_buffer.hpp"
#include "record_streamer/fingerprint.hpp"
#include "record_streamer/log.hpp"
#include "record_streamer/path_utils.hpp"
#include "record_streamer/position_index.hpp"
#include "record_streamer/resume_coordinator.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace rs {

const char* to_string(StopReason r) noexcept {
  switch (r) {
    case StopReason::EndOfStream:   return "end_of_stream";
    case StopReason::CallbackAbort: return "callback_abort";
    case StopReason::LimitReached:  return "limit_reached";
  }
  return "end_of_stream";
}

bool Summary::has_warning(ErrorKind k) const noexcept {
  for (const auto& w : warnings) if (w.kind == k) return true;
  return false;
}

namespace {

std::string pct(std::uint64_t part, std::uint64_t whole) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << (whole ? part * 100.0 / whole : 100.0) << "%";
  return o.str();
}

std::string range(const RawRecord& r) {
  return "record #" + std::to_string(r.record_number) + " [" + std::to_string(r.start_offset) +
         ", " + std::to_string(r.end_offset) + ")";
}

}

struct RecordStreamer::Impl {
  struct Request {
    bool checkpoints = false;
    std::uint64_t interval = 0;
    BatchWindow window;
    bool resume = false;
    bool auto_resume = false;
  };

  std::string path;
  ScanOptions opts;
  std::optional<TagPattern> pattern;
  std::string pattern_key;

  Impl(std::string p, ScanOptions o) : path(std::move(p)), opts(std::move(o)) {}

  std::uint64_t source_size() const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) throw ScanError(ErrorKind::SourceNotFound, "cannot stat " + path + ": " + ec.message());
    return static_cast<std::uint64_t>(size);
  }

  // The head is inspected once per session; changing the record name or
  // hint through options() forces a new look.
  const TagPattern& resolve() {
    std::string key = opts.record_name + '\n' + opts.namespace_hint + '\n' + std::to_string(opts.head_bytes);
    if (pattern && key == pattern_key) return *pattern;
    std::string head, err;
    if (!read_slice(path, 0, opts.head_bytes, head, &err))
      throw ScanError(ErrorKind::SourceReadFailed, err);
    pattern = TagResolver({opts.record_name, opts.namespace_hint}).detect(head);
    pattern_key = std::move(key);
    log::info("scan", "record tags: '" + pattern->open_tag + "' / '" + pattern->close_tag + "'" +
              (pattern->namespace_uri.empty() ? std::string{} : " (" + pattern->namespace_uri + ")"));
    return *pattern;
  }

  CheckpointStore make_store() const {
    CheckpointStore::Config c;
    c.path = opts.checkpoint_path;
    c.fingerprint_bytes = opts.fingerprint_bytes;
    c.max_age_s = opts.max_checkpoint_age_s;
    return CheckpointStore(path, c);
  }

  PositionIndex make_index() const {
    return PositionIndex(path, {opts.position_cache_path, opts.index_stride, opts.index_max_entries});
  }

  Summary execute(const RecordCallback& cb, const Request& req);
  std::uint64_t count();
};

Summary RecordStreamer::Impl::execute(const RecordCallback& cb, const Request& req) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  MetricsRegistry metrics;
  Summary sum;
  sum.source_size = source_size();

  auto finish_stats = [&]() {
    const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
    sum.stats = metrics.snapshot(wall_ms);
  };
  auto warn = [&](ErrorKind k, const std::string& tag, const std::string& msg) {
    log::warn(tag, msg);
    metrics.add_error(to_string(k));
    sum.warnings.push_back(Warning{k, msg});
  };

  // --- Init: tags, start plan
  metrics.start_stage("resolve");
  const TagPattern& pat = resolve();
  BoundaryScanner scanner(pat);
  metrics.end_stage("resolve");

  CheckpointStore store = make_store();
  StartPlan plan;
  if (req.checkpoints) {
    plan = ResumeCoordinator(store, scanner).prepare({req.resume, req.auto_resume});
    for (auto& w : plan.warnings) {
      metrics.add_error(to_string(w.kind));
      sum.warnings.push_back(w);
    }
  }

  SessionState state = plan.state;
  state.namespace_detected = pat.namespace_detected();
  state.namespace_prefix = pat.prefix.empty() ? std::nullopt : std::optional<std::string>(pat.prefix);
  state.header_processed = true;
  state.phase = Phase::Scanning;
  sum.resumed = plan.resumed();
  sum.resumed_from_record = plan.start_record;

  const BatchWindow& win = req.window;
  std::uint64_t start_offset = plan.start_offset;
  std::uint64_t start_record = plan.start_record;

  if (win.limit != 0 && start_record >= win.offset + win.limit) {
    log::info("scan", "window ending at record " + std::to_string(win.offset + win.limit) +
              " was already covered (checkpoint at record " + std::to_string(start_record) + ")");
    state.phase = Phase::Interrupted;
    sum.phase = state.phase;
    sum.stop_reason = StopReason::LimitReached;
    sum.start_offset = sum.final_position = start_offset;
    sum.checkpoint_retained = store.exists();
    sum.state = state;
    finish_stats();
    return sum;
  }

  // --- fast skip through the position index
  PositionIndex index = make_index();
  std::optional<Fingerprint> fp;
  if (opts.use_position_index) {
    std::string err;
    fp = compute_fingerprint(path, opts.fingerprint_bytes, &err);
    if (!fp) log::warn("index", "fingerprint failed, index disabled: " + err);
    else if (!index.load(*fp) && !index.last_error().empty()) log::debug("index", index.last_error());
  }
  if (fp && win.offset > start_record + opts.seek_threshold) {
    metrics.start_stage("seek");
    auto e = index.nearest_at_or_below(win.offset + 1);
    if (e && e->record_number - 1 > start_record) {
      std::string probe;
      if (read_slice(path, e->byte_offset, pat.open_tag.size() + 1, probe) &&
          scanner.starts_with_record_open(probe)) {
        start_offset = e->byte_offset;
        start_record = e->record_number - 1;
        sum.seeked_via_index = true;
        log::info("index", "seeking to byte " + std::to_string(start_offset) + " (record " +
                  std::to_string(e->record_number) + ") for offset " + std::to_string(win.offset));
      } else {
        warn(ErrorKind::StaleIndex, "index",
             "no record opens at byte " + std::to_string(e->byte_offset) + "; discarding " + index.path());
        index.clear();
        if (!index.remove_file()) log::warn("index", index.last_error());
      }
    }
    metrics.end_stage("seek");
  }

  // --- Scanning
  ChunkBuffer buffer(path, {opts.chunk_bytes, opts.max_buffer_multiple}, scanner);
  buffer.on_event([&](const ChunkBuffer::Event& ev) {
    switch (ev.kind) {
      case ChunkBuffer::EventKind::Degraded:
        metrics.add_degraded();
        warn(ErrorKind::DegradedBuffer, "buffer",
             "record at byte " + std::to_string(ev.offset) + " exceeds the " +
             std::to_string(buffer.max_buffer_bytes()) + "-byte window; holding " +
             std::to_string(ev.buffer_bytes) + " bytes until it closes");
        break;
      case ChunkBuffer::EventKind::Trimmed:
        log::debug("buffer", "trimmed to byte " + std::to_string(ev.offset));
        break;
      case ChunkBuffer::EventKind::Recovered:
        log::debug("buffer", "window back under bound at byte " + std::to_string(ev.offset));
        break;
    }
  });

  ScanSession session;
  if (!buffer.open(session, start_offset, start_record))
    throw ScanError(ErrorKind::SourceReadFailed,
                    "cannot open " + path + ": " + std::strerror(buffer.last_error()));
  sum.start_offset = start_offset;
  log::info("scan", "scanning " + path + " (" + std::to_string(sum.source_size) + " bytes, chunk " +
            std::to_string(opts.chunk_bytes) + " bytes) from byte " + std::to_string(start_offset));
  if (win.limit != 0)
    log::info("scan", "window (" + std::to_string(win.offset) + ", " + std::to_string(win.limit) + "): " +
              std::to_string(win.remaining(start_record)) + " records left to emit");

  std::uint64_t last_pos = start_offset;
  std::uint64_t last_rec = start_record;
  // After an index seek the start offset is a record opening, not a
  // position after a close; it becomes checkpointable once a record is read.
  bool position_valid = !sum.seeked_via_index;

  auto save_checkpoint = [&](Phase ph) -> bool {
    if (!req.checkpoints || !position_valid) return false;
    state.phase = ph;
    state.total_record_count = last_rec;
    auto cp = store.save(last_pos, last_rec, state, opts.chunk_bytes);
    if (!cp) {
      log::warn("checkpoint", "save failed: " + store.last_error());
      return false;
    }
    metrics.add_checkpoint();
    sum.last_checkpoint = std::move(cp);
    return true;
  };

  // Hand one record to the callback. Returns false when it asked to stop.
  auto deliver = [&](const RawRecord& rec) -> bool {
    try {
      const bool keep = cb(rec);
      ++state.processed_count;
      ++sum.emitted;
      metrics.add_emitted();
      return keep;
    } catch (const std::exception& e) {
      const std::string msg = range(rec) + ": " + e.what();
      if (!opts.continue_on_error) {
        metrics.add_error(to_string(ErrorKind::MalformedRecordFragment));
        save_checkpoint(Phase::Failed);
        log::error("scan", msg);
        throw ScanError(ErrorKind::MalformedRecordFragment, msg,
                        rec.record_number, rec.start_offset, rec.end_offset);
      }
      warn(ErrorKind::MalformedRecordFragment, "scan", msg + "; skipped");
      ++state.skipped_count;
      ++sum.skipped_errors;
      metrics.add_skipped();
      return true;
    }
  };

  metrics.start_stage("scan");
  bool stopped = false;
  RawRecord rec;
  while (buffer.next(session, rec)) {
    const std::uint64_t n = rec.record_number;
    metrics.add_scanned();
    if (sum.first_record == 0) sum.first_record = n;
    if (fp && index.wants(n)) index.sample(n, rec.start_offset);

    bool keep = true;
    if (win.contains(n)) keep = deliver(rec);
    else ++sum.skipped_by_offset;

    last_pos = rec.end_offset;
    last_rec = n;
    position_valid = true;

    if (!keep) {
      stopped = true;
      sum.stop_reason = StopReason::CallbackAbort;
      log::info("scan", "callback requested stop at record #" + std::to_string(n));
      break;
    }
    if (win.done_after(n)) {
      stopped = true;
      sum.stop_reason = StopReason::LimitReached;
      break;
    }
    if (req.checkpoints && req.interval && n % req.interval == 0 && save_checkpoint(Phase::Scanning)) {
      const double sec = ch::duration<double>(ch::steady_clock::now() - t0).count();
      log::info("checkpoint", "saved at record " + std::to_string(n) + " - progress " +
                pct(last_pos, sum.source_size) + " (" +
                std::to_string(sec > 0 ? static_cast<std::uint64_t>((n - start_record) / sec) : 0) +
                " records/s)");
    }
  }
  metrics.end_stage("scan");
  metrics.set_bytes(buffer.bytes_read());
  metrics.note_buffer(session.peak_buffer);

  sum.last_record = sum.first_record ? last_rec : 0;
  sum.final_position = last_pos;

  if (buffer.failed()) {
    save_checkpoint(Phase::Failed);
    throw ScanError(ErrorKind::SourceReadFailed,
                    "read failed on " + path + " near byte " + std::to_string(session.stream_offset) +
                    ": " + std::strerror(buffer.last_error()));
  }

  // --- Interrupted | Completed
  if (stopped) {
    sum.checkpoint_retained = save_checkpoint(Phase::Interrupted);
    state.phase = Phase::Interrupted;
  } else if (session.stream_offset == sum.source_size && !buffer.has_pending_record(session)) {
    state.phase = Phase::Completed;
    if (req.checkpoints) {
      if (store.clear()) sum.checkpoint_cleared = true;
      else log::warn("checkpoint", store.last_error());
    }
  } else {
    const std::string msg = session.stream_offset != sum.source_size
        ? "stream ended at byte " + std::to_string(session.stream_offset) + " of " +
          std::to_string(sum.source_size)
        : "unterminated " + pat.open_tag + " after byte " + std::to_string(last_pos);
    warn(ErrorKind::IncompleteStreamAtEnd, "scan", msg + "; checkpoint kept at byte " + std::to_string(last_pos));
    sum.checkpoint_retained = save_checkpoint(Phase::Completed);
    state.phase = Phase::Completed;
  }

  if (fp && index.dirty() && !index.save(*fp))
    log::warn("index", "save failed: " + index.last_error());

  state.total_record_count = last_rec;
  sum.phase = state.phase;
  sum.state = state;
  finish_stats();

  log::info("scan", "done: " + std::to_string(sum.emitted) + " emitted, " +
            std::to_string(sum.skipped_by_offset) + " skipped by offset, " +
            std::to_string(sum.skipped_errors) + " failed, phase " + to_string(sum.phase) +
            " in " + std::to_string(static_cast<std::uint64_t>(sum.stats.wall_time_ms)) + " ms");
  return sum;
}

std::uint64_t RecordStreamer::Impl::count() {
  (void)source_size();
  BoundaryScanner scanner(resolve());
  PositionIndex index = make_index();
  std::optional<Fingerprint> fp;
  if (opts.use_position_index) {
    fp = compute_fingerprint(path, opts.fingerprint_bytes);
    if (fp) (void)index.load(*fp);
  }

  ChunkBuffer buffer(path, {opts.chunk_bytes, opts.max_buffer_multiple}, scanner);
  ScanSession session;
  if (!buffer.open(session, 0, 0))
    throw ScanError(ErrorKind::SourceReadFailed, "cannot open " + path + ": " + std::strerror(buffer.last_error()));

  std::uint64_t n = 0;
  RawRecord rec;
  while (buffer.next(session, rec)) {
    n = rec.record_number;
    if (fp && index.wants(n)) index.sample(n, rec.start_offset);
  }
  if (buffer.failed())
    throw ScanError(ErrorKind::SourceReadFailed, "read failed on " + path + ": " + std::strerror(buffer.last_error()));

  if (fp && index.dirty() && !index.save(*fp))
    log::warn("index", "save failed: " + index.last_error());
  log::info("scan", "found " + std::to_string(n) + " records in " + path);
  return n;
}

RecordStreamer::RecordStreamer(std::string path)
  : RecordStreamer(std::move(path), ScanOptions{}) {}

RecordStreamer::RecordStreamer(std::string path, ScanOptions opts) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    throw ScanError(ErrorKind::SourceNotFound, "file not found: " + path);
  p_ = new Impl(std::move(path), std::move(opts));
}

RecordStreamer::~RecordStreamer() { delete p_; }

Summary RecordStreamer::scan_with_checkpoints(const RecordCallback& cb, std::uint64_t interval) {
  Impl::Request r;
  r.checkpoints = true;
  r.interval = interval;
  r.window = BatchWindow{p_->opts.offset, p_->opts.limit};
  r.resume = p_->opts.resume;
  r.auto_resume = p_->opts.auto_resume;
  return p_->execute(cb, r);
}

Summary RecordStreamer::scan_with_checkpoints(const RecordCallback& cb) {
  return scan_with_checkpoints(cb, p_->opts.checkpoint_interval);
}

Summary RecordStreamer::scan_with_limits(const RecordCallback& cb, std::uint64_t offset, std::uint64_t limit) {
  Impl::Request r;
  r.window = BatchWindow{offset, limit};
  return p_->execute(cb, r);
}

Summary RecordStreamer::run(const RecordCallback& cb) {
  Impl::Request r;
  r.checkpoints = p_->opts.checkpoints;
  r.interval = p_->opts.checkpoint_interval;
  r.window = BatchWindow{p_->opts.offset, p_->opts.limit};
  r.resume = p_->opts.resume;
  r.auto_resume = p_->opts.auto_resume;
  return p_->execute(cb, r);
}

std::uint64_t RecordStreamer::count_records() { return p_->count(); }

std::optional<Checkpoint> RecordStreamer::checkpoint_info() const {
  auto r = p_->make_store().inspect();
  if (r.status != CheckpointStore::LoadStatus::Valid && r.status != CheckpointStore::LoadStatus::Absent)
    log::warn("checkpoint", r.message);
  return r.checkpoint;
}

void RecordStreamer::clear_checkpoint() {
  auto store = p_->make_store();
  if (!store.clear()) log::warn("checkpoint", store.last_error());
}

void RecordStreamer::set_chunk_size(std::size_t bytes) {
  p_->opts.chunk_bytes = bytes ? bytes : 1;
  log::info("scan", "chunk size set to " + std::to_string(p_->opts.chunk_bytes) + " bytes");
}

SourceStats RecordStreamer::stats() const {
  SourceStats s;
  s.path = p_->path;
  s.size = p_->source_size();
  s.chunk_bytes = p_->opts.chunk_bytes;
  auto store = p_->make_store();
  s.checkpoint_path = store.path();
  s.checkpoint = store.peek();
  s.has_checkpoint = s.checkpoint.has_value();
  auto index = p_->make_index();
  s.position_cache_path = index.path();
  if (auto fp = compute_fingerprint(p_->path, p_->opts.fingerprint_bytes)) {
    if (index.load(*fp)) s.index_entries = index.size();
  }
  return s;
}

std::string RecordStreamer::read_range(std::uint64_t start, std::uint64_t end) const {
  if (end < start)
    throw ScanError(ErrorKind::SourceReadFailed, "invalid range [" + std::to_string(start) + ", " +
                    std::to_string(end) + ")");
  std::string out, err;
  if (!read_slice(p_->path, start, static_cast<std::size_t>(end - start), out, &err))
    throw ScanError(ErrorKind::SourceReadFailed, err);
  return out;
}

const TagPattern& RecordStreamer::tag_pattern() { return p_->resolve(); }

ScanOptions& RecordStreamer::options() noexcept { return p_->opts; }
const ScanOptions& RecordStreamer::options() const noexcept { return p_->opts; }
const std::string& RecordStreamer::path() const noexcept { return p_->path; }
std::string RecordStreamer::checkpoint_path() const { return checkpoint_path_for(p_->path, p_->opts.checkpoint_path); }
std::string RecordStreamer::position_cache_path() const {
  return position_cache_path_for(p_->path, p_->opts.position_cache_path);
}

}
