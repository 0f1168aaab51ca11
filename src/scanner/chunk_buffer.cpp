#include "record_streamer/chunk_buffer.hpp"
#include "record_streamer/boundary_scanner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <utility>

namespace rs {

struct ChunkBuffer::Impl {
  std::string path;
  Config cfg;
  const BoundaryScanner& scanner;
  EventCallback on_event;
  FILE* f{nullptr};
  int last_errno{0};
  bool failed{false};
  std::uint64_t bytes{0};

  Impl(std::string p, Config c, const BoundaryScanner& sc)
    : path(std::move(p)), cfg(c), scanner(sc) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    if (cfg.max_buffer_multiple < 2) cfg.max_buffer_multiple = 2;
  }

  ~Impl() { close(); }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  std::size_t bound() const { return cfg.chunk_bytes * cfg.max_buffer_multiple; }

  void emit(EventKind k, const ScanSession& s) {
    if (on_event) on_event(Event{k, s.buffer_base, s.buffer.size()});
  }

  bool open(ScanSession& s, std::uint64_t start, std::uint64_t records_before) {
    close();
    failed = false; last_errno = 0; bytes = 0;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; failed = true; return false; }
    if (start > 0 && fseeko(f, static_cast<off_t>(start), SEEK_SET) != 0) {
      last_errno = errno; failed = true; close(); return false;
    }
    s = ScanSession{};
    s.buffer_base = start;
    s.stream_offset = start;
    s.record_number = records_before;
    s.buffer.reserve(bound());
    return true;
  }

  // Drop the first n bytes; never past the cursor or a pending record.
  static void drop_front(ScanSession& s, std::size_t n) {
    s.buffer.erase(0, n);
    s.buffer_base += n;
    s.cursor -= std::min(s.cursor, n);
    if (s.pending.open && s.pending.start >= n) {
      s.pending.start -= n;
      s.pending.resume -= n;
    } else {
      s.pending = RecordProgress{};
    }
  }

  // Drop everything already handed out.
  void compact(ScanSession& s) {
    if (s.cursor == 0) return;
    drop_front(s, s.cursor);
  }

  // Keep room for one more chunk under the bound. Only bytes before the
  // first record opening (or unfinished markup) may go; a record that does
  // not fit is kept whole and the window runs degraded until it closes.
  void enforce_bound(ScanSession& s) {
    if (s.buffer.size() + cfg.chunk_bytes > bound()) {
      const std::size_t cut = scanner.safe_trim_point(s.buffer, 0);
      if (cut > 0) {
        drop_front(s, cut);
        emit(EventKind::Trimmed, s);
      }
    }
    const bool over = s.buffer.size() + cfg.chunk_bytes > bound();
    if (over && !s.degraded) {
      s.degraded = true;
      ++s.degraded_events;
      emit(EventKind::Degraded, s);
    } else if (!over && s.degraded) {
      s.degraded = false;
      emit(EventKind::Recovered, s);
    }
  }

  bool fill(ScanSession& s) {
    const std::size_t old = s.buffer.size();
    s.buffer.resize(old + cfg.chunk_bytes);
    const std::size_t n = std::fread(s.buffer.data() + old, 1, cfg.chunk_bytes, f);
    s.buffer.resize(old + n);
    if (n == 0) {
      if (std::ferror(f)) { last_errno = errno; failed = true; }
      s.eof = true;
      return false;
    }
    s.stream_offset += n;
    bytes += n;
    s.peak_buffer = std::max(s.peak_buffer, s.buffer.size());
    return true;
  }

  bool next(ScanSession& s, RawRecord& out) {
    if (!f) return false;
    for (;;) {
      auto b = scanner.find_next_record(s.buffer, s.cursor, &s.pending);
      if (b) {
        out.record_number = ++s.record_number;
        out.start_offset = s.buffer_base + b->start;
        out.end_offset = s.buffer_base + b->end;
        out.bytes = std::string_view(s.buffer).substr(b->start, b->length());
        s.cursor = b->end;
        return true;
      }
      if (s.eof || failed) return false;
      compact(s);
      enforce_bound(s);
      (void)fill(s);
    }
  }
};

ChunkBuffer::ChunkBuffer(std::string path, Config cfg, const BoundaryScanner& scanner)
  : p_(new Impl(std::move(path), cfg, scanner)) {}

ChunkBuffer::~ChunkBuffer() { delete p_; }

bool ChunkBuffer::open(ScanSession& s, std::uint64_t start_offset, std::uint64_t records_before) {
  return p_->open(s, start_offset, records_before);
}

bool ChunkBuffer::next(ScanSession& s, RawRecord& out) { return p_->next(s, out); }

bool ChunkBuffer::has_pending_record(const ScanSession& s) const {
  return p_->scanner.safe_trim_point(s.buffer, s.cursor) < s.buffer.size();
}

void ChunkBuffer::on_event(EventCallback cb) { p_->on_event = std::move(cb); }

bool ChunkBuffer::failed() const noexcept { return p_->failed; }
int  ChunkBuffer::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkBuffer::bytes_read() const noexcept { return p_->bytes; }
std::size_t   ChunkBuffer::max_buffer_bytes() const noexcept { return p_->bound(); }

}
