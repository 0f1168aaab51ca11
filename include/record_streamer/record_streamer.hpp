#pragma once
#include "record_streamer/checkpoint.hpp"
#include "record_streamer/errors.hpp"
#include "record_streamer/metrics.hpp"
#include "record_streamer/record.hpp"
#include "record_streamer/tag_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rs {

struct ScanOptions {
  std::string   record_name         = "Product";
  std::string   namespace_hint      = "onix";
  std::size_t   chunk_bytes         = 512 * 1024;   // 512 KiB
  std::size_t   max_buffer_multiple = 3;
  std::size_t   head_bytes          = 4 * 1024;     // inspected once for the namespace
  std::size_t   fingerprint_bytes   = 8 * 1024;

  bool          checkpoints         = true;         // read/write the checkpoint file in run()
  std::uint64_t checkpoint_interval = 1000;         // records; 0: only on stop
  bool          continue_on_error   = false;
  std::uint64_t offset              = 0;
  std::uint64_t limit               = 0;            // 0: unbounded
  bool          auto_resume         = true;
  bool          resume              = false;
  std::string   checkpoint_path;                    // empty: "<source>.checkpoint"
  std::int64_t  max_checkpoint_age_s = 0;           // 0: never expires

  bool          use_position_index  = true;
  std::string   position_cache_path;                // empty: "<source>.position_cache"
  std::uint64_t index_stride        = 100;
  std::size_t   index_max_entries   = 10000;
  std::uint64_t seek_threshold      = 50;           // seek via index only past this many records
};

enum class StopReason { EndOfStream, CallbackAbort, LimitReached };

const char* to_string(StopReason r) noexcept;

struct Summary {
  Phase         phase = Phase::Init;
  StopReason    stop_reason = StopReason::EndOfStream;
  bool          resumed = false;
  std::uint64_t resumed_from_record = 0;
  std::uint64_t start_offset = 0;
  bool          seeked_via_index = false;

  std::uint64_t first_record = 0;        // first record number scanned this run (0: none)
  std::uint64_t last_record = 0;         // last record number scanned this run
  std::uint64_t final_position = 0;      // byte after the last record scanned
  std::uint64_t source_size = 0;
  std::uint64_t emitted = 0;
  std::uint64_t skipped_by_offset = 0;
  std::uint64_t skipped_errors = 0;

  bool checkpoint_cleared = false;
  bool checkpoint_retained = false;
  std::optional<Checkpoint> last_checkpoint;

  RunStats stats;
  std::vector<Warning> warnings;
  SessionState state;

  bool has_warning(ErrorKind k) const noexcept;
};

struct SourceStats {
  std::string   path;
  std::uint64_t size = 0;
  std::size_t   chunk_bytes = 0;
  bool          has_checkpoint = false;
  std::optional<Checkpoint> checkpoint;
  std::string   checkpoint_path;
  std::string   position_cache_path;
  std::size_t   index_entries = 0;
};

// Streams the records of one large document, with exact-position
// checkpointing and offset/limit windows. One instance drives one source;
// runs are synchronous and the callback is invoked on the calling thread.
class RecordStreamer {
public:
  // Return false to stop; the run ends Interrupted and can be resumed.
  // Throwing std::exception marks the record as failed.
  using RecordCallback = std::function<bool(const RawRecord&)>;

  explicit RecordStreamer(std::string path);          // default ScanOptions{}
  RecordStreamer(std::string path, ScanOptions opts);  // throws ScanError(SourceNotFound)
  ~RecordStreamer();

  RecordStreamer(const RecordStreamer&) = delete;
  RecordStreamer& operator=(const RecordStreamer&) = delete;

  // Resumable full pass; saves a checkpoint every `interval` records.
  Summary scan_with_checkpoints(const RecordCallback& cb, std::uint64_t interval);
  Summary scan_with_checkpoints(const RecordCallback& cb);

  // Window pass without checkpoint files; seeks through the position index.
  Summary scan_with_limits(const RecordCallback& cb, std::uint64_t offset, std::uint64_t limit);

  // Pass driven entirely by options().
  Summary run(const RecordCallback& cb);

  std::uint64_t count_records();

  std::optional<Checkpoint> checkpoint_info() const;
  void clear_checkpoint();

  void set_chunk_size(std::size_t bytes);
  SourceStats stats() const;

  // Raw bytes of [start, end), e.g. to re-read a record by its boundary.
  std::string read_range(std::uint64_t start, std::uint64_t end) const;

  const TagPattern& tag_pattern();

  ScanOptions& options() noexcept;
  const ScanOptions& options() const noexcept;
  const std::string& path() const noexcept;
  std::string checkpoint_path() const;
  std::string position_cache_path() const;

private:
  struct Impl; Impl* p_;
};

}
