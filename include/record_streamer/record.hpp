#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rs {

// [start, end) of one record inside a working buffer. Offsets are relative
// to the buffer the scanner was handed.
struct RecordBoundary {
  std::size_t start = 0;
  std::size_t end = 0;

  std::size_t length() const noexcept { return end - start; }
};

// Where the walk through an unfinished record stopped. Passed back with a
// longer window, it lets the walk continue instead of restarting at the
// opening tag. Offsets are relative to the window.
struct RecordProgress {
  bool        open = false;  // an opening tag was found but not its close
  std::size_t start = 0;     // offset of the opening tag
  std::size_t resume = 0;    // first offset not yet walked
  std::size_t depth = 0;     // 0 while the opening tag itself is unfinished
};

// One complete record as handed to the caller. Offsets are absolute within
// the source; `bytes` points into the working buffer and is only valid until
// the next record is pulled.
struct RawRecord {
  std::uint64_t record_number = 0;   // 1-based
  std::uint64_t start_offset = 0;
  std::uint64_t end_offset = 0;      // one past the closing '>'
  std::string_view bytes;
};

}
