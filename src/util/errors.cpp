#include "record_streamer/errors.hpp"

namespace rs {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::SourceNotFound:          return "source_not_found";
    case ErrorKind::SourceReadFailed:        return "source_read_failed";
    case ErrorKind::MalformedRecordFragment: return "malformed_record_fragment";
    case ErrorKind::ChecksumMismatch:        return "checksum_mismatch";
    case ErrorKind::CorruptCheckpoint:       return "corrupt_checkpoint";
    case ErrorKind::IncompleteStreamAtEnd:   return "incomplete_stream_at_end";
    case ErrorKind::ResumePositionMismatch:  return "resume_position_mismatch";
    case ErrorKind::DegradedBuffer:          return "degraded_buffer";
    case ErrorKind::StaleIndex:              return "stale_index";
  }
  return "unknown";
}

}
