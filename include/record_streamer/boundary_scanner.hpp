#pragma once
#include "record_streamer/record.hpp"
#include "record_streamer/tag_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rs {

// Finds complete records in an in-memory window. A window that ends
// mid-record yields nothing until more bytes arrive.
class BoundaryScanner {
public:
  explicit BoundaryScanner(TagPattern pattern);

  // Next complete record at or after `search_from`, or nullopt when the
  // window holds no opening tag or the record is not yet closed. With
  // `progress`, an unfinished record's walk state is stored there and
  // picked up by the next call; the window may only have grown at the end.
  std::optional<RecordBoundary> find_next_record(std::string_view buf,
                                                 std::size_t search_from,
                                                 RecordProgress* progress = nullptr) const;

  // Offset of the next record opening tag at or after `from`, skipping
  // comments, CDATA and processing instructions. nullopt if none.
  std::optional<std::size_t> find_open_tag(std::string_view buf, std::size_t from) const;

  // First offset at or after `from` that must be retained when trimming:
  // a record opening tag, or the start of a construct the window cuts off.
  // Returns buf.size() when every byte from `from` is safe to discard.
  std::size_t safe_trim_point(std::string_view buf, std::size_t from) const;

  // True if `buf` ends exactly with a record closing tag or a self-closing
  // record tag. Used to validate resume positions.
  bool ends_with_record_close(std::string_view buf) const;

  // True if `buf` begins with a record opening tag.
  bool starts_with_record_open(std::string_view buf) const;

  const TagPattern& pattern() const noexcept { return pat_; }

  // Bytes stepped over by find_next_record since construction.
  std::uint64_t bytes_walked() const noexcept { return walked_; }

private:
  enum class Walk { Open, None, Incomplete };
  struct WalkResult { Walk kind; std::size_t pos; };

  WalkResult walk_to_open(std::string_view buf, std::size_t from) const;
  bool is_open_at(std::string_view buf, std::size_t pos, bool* need_more) const;
  bool is_close_at(std::string_view buf, std::size_t pos, std::size_t* gt, bool* need_more) const;

  TagPattern pat_;
  std::string close_name_;  // close_tag without the trailing '>'
  mutable std::uint64_t walked_{0};
};

}
