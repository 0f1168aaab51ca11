#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rs {

enum class ErrorKind {
  SourceNotFound,
  SourceReadFailed,
  MalformedRecordFragment,
  ChecksumMismatch,
  CorruptCheckpoint,
  IncompleteStreamAtEnd,
  ResumePositionMismatch,
  DegradedBuffer,
  StaleIndex
};

const char* to_string(ErrorKind k) noexcept;

// Thrown by the engine for conditions it cannot recover from locally.
// Record failures carry the record number and its [start, end) byte range.
class ScanError : public std::runtime_error {
public:
  ScanError(ErrorKind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}
  ScanError(ErrorKind kind, const std::string& msg,
            std::uint64_t record_number, std::uint64_t start, std::uint64_t end)
    : std::runtime_error(msg), kind_(kind), record_number_(record_number),
      start_(start), end_(end), has_range_(true) {}

  ErrorKind kind() const noexcept { return kind_; }
  bool has_range() const noexcept { return has_range_; }
  std::uint64_t record_number() const noexcept { return record_number_; }
  std::uint64_t start_offset() const noexcept { return start_; }
  std::uint64_t end_offset() const noexcept { return end_; }

private:
  ErrorKind kind_;
  std::uint64_t record_number_{0};
  std::uint64_t start_{0};
  std::uint64_t end_{0};
  bool has_range_{false};
};

// A condition recovered locally during a run; reported in the summary.
struct Warning {
  ErrorKind kind;
  std::string message;
};

}
