#pragma once
#include "record_streamer/record.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace rs {

class BoundaryScanner;

// Mutable state of one scan pass. Owned by the caller of ChunkBuffer and
// passed by reference; nothing else holds on to it.
struct ScanSession {
  std::string   buffer;              // working window
  std::uint64_t buffer_base = 0;     // absolute offset of buffer[0]
  std::size_t   cursor = 0;          // first unconsumed byte in buffer
  std::uint64_t stream_offset = 0;   // absolute offset of the next byte to read
  std::uint64_t record_number = 0;   // number of the last record handed out
  RecordProgress pending;            // walk state of a record still being read
  std::size_t   peak_buffer = 0;
  std::uint64_t degraded_events = 0;
  bool          degraded = false;    // window currently held past its bound
  bool          eof = false;
};

// Reads a source in fixed-size chunks and hands out complete records one at
// a time. The buffer is compacted only at consumed-record boundaries and is
// bounded by chunk_bytes * max_buffer_multiple, except while a single record
// larger than that is being assembled (degraded mode).
class ChunkBuffer {
public:
  struct Config {
    std::size_t chunk_bytes         = 512 * 1024;  // 512 KiB
    std::size_t max_buffer_multiple = 3;           // bound = chunk_bytes * this (min 2)
  };

  enum class EventKind { Trimmed, Degraded, Recovered };
  struct Event {
    EventKind     kind;
    std::uint64_t offset = 0;        // absolute offset of the retained window
    std::size_t   buffer_bytes = 0;  // window size when the event fired
  };
  using EventCallback = std::function<void(const Event&)>;

  ChunkBuffer(std::string path, Config cfg, const BoundaryScanner& scanner);
  ~ChunkBuffer();

  ChunkBuffer(const ChunkBuffer&) = delete;
  ChunkBuffer& operator=(const ChunkBuffer&) = delete;

  // Open the source and position the session at `start_offset`, where
  // `records_before` records are already accounted for.
  bool open(ScanSession& s, std::uint64_t start_offset, std::uint64_t records_before);

  // Pull the next complete record. Returns false at end of data or on a
  // read error (see failed()).
  bool next(ScanSession& s, RawRecord& out);

  // At end of data: an opening record tag remains without its close.
  bool has_pending_record(const ScanSession& s) const;

  void on_event(EventCallback cb);

  bool failed() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::size_t   max_buffer_bytes() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
