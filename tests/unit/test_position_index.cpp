#include "record_streamer/fingerprint.hpp"
#include "record_streamer/position_index.hpp"
#include "../fixtures.hpp"

#include <string>

int main(){
  const auto dir = fx::temp_dir("position-index");
  const std::string src = fx::write_file(dir / "feed.xml", fx::onix_doc(3)).string();
  auto fp = rs::compute_fingerprint(src);
  if (!fp) { std::cerr << "[ERR] fingerprint failed\n"; return 2; }

  {
    rs::PositionIndex idx(src, {"", 10, 4});
    fx::check(idx.path() == src + ".position_cache", "cache sits beside the source");
    fx::check(idx.wants(20) && !idx.wants(25), "samples on stride multiples");
    idx.sample(25, 999);
    fx::check(idx.size() == 0 && !idx.dirty(), "off-stride sample ignored");

    for (std::uint64_t n = 10; n <= 100; n += 10) idx.sample(n, n * 100);
    fx::check(idx.stride() == 20, "stride doubled past twice the cap");
    fx::check(idx.entries().count(20) && !idx.entries().count(10), "coarse stride keeps its multiples");

    auto e = idx.nearest_at_or_below(75);
    fx::check(e && e->record_number == 60 && e->byte_offset == 6000, "nearest entry at or below");
    fx::check(!idx.nearest_at_or_below(15), "nothing below the first entry");

    fx::check(idx.save(*fp) && !idx.dirty(), "save clears dirty");
    fx::check(idx.size() <= 4 && idx.stride() == 40, "save enforces the cap");
  }

  {
    rs::PositionIndex idx(src, {"", 10, 4});
    fx::check(idx.load(*fp), "reload for the same source");
    fx::check(idx.stride() == 40 && idx.size() == 2 && idx.entries().at(80) == 8000, "entries and stride restored");
    fx::check(!idx.wants(60) && idx.wants(120), "restored stride drives sampling");
  }

  {
    // Same bytes, newer modification time.
    const auto t = fx::fs::last_write_time(src);
    fx::fs::last_write_time(src, t + std::chrono::seconds(10));
    rs::PositionIndex idx(src, {"", 10, 4});
    fx::check(!idx.load(*fp) && idx.size() == 0 && !idx.last_error().empty(), "cache rejected after the source is touched");
    fx::fs::last_write_time(src, t);
    fx::check(idx.load(*fp) && idx.size() == 2, "cache accepted again at the recorded time");
  }

  {
    auto other = *fp;
    other.digest.assign(64, '0');
    rs::PositionIndex idx(src, {"", 10, 4});
    fx::check(!idx.load(other) && idx.size() == 0 && !idx.last_error().empty(), "cache for another source rejected");
  }

  {
    fx::write_file(src + ".position_cache", "{\"fingerprint\": 12");
    rs::PositionIndex idx(src, {"", 10, 4});
    fx::check(!idx.load(*fp) && idx.size() == 0, "unreadable cache rejected");
    fx::check(idx.remove_file() && !fx::fs::exists(idx.path()), "cache file removed");
  }

  std::error_code ec;
  fx::fs::remove_all(dir, ec);
  return fx::result();
}
