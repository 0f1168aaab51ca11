#include "record_streamer/record_streamer.hpp"
#include "../fixtures.hpp"

#include <string>
#include <vector>

using Numbers = std::vector<std::uint64_t>;

static Numbers range(std::uint64_t a, std::uint64_t b) {
  Numbers v;
  for (auto i = a; i <= b; ++i) v.push_back(i);
  return v;
}

int main(){
  const auto dir = fx::temp_dir("batch-window");

  {
    const std::string src = fx::write_file(dir / "twenty.xml", fx::onix_doc(20)).string();
    rs::ScanOptions o;
    o.chunk_bytes = 80;
    rs::RecordStreamer rs_(src, o);

    Numbers got;
    auto take = [&](const rs::RawRecord& r){ got.push_back(r.record_number); return true; };

    auto sum = rs_.scan_with_limits(take, 10, 5);
    fx::check(got == range(11, 15), "offset 10 limit 5 emits records 11-15");
    fx::check(sum.skipped_by_offset == 10 && sum.stop_reason == rs::StopReason::LimitReached, "offset skipped, limit stops");
    fx::check(sum.phase == rs::Phase::Interrupted && !fx::fs::exists(rs_.checkpoint_path()), "windowed pass writes no checkpoint");

    got.clear();
    rs_.scan_with_limits(take, 18, 0);
    fx::check(got == range(19, 20), "limit 0 runs to the end");

    got.clear();
    sum = rs_.scan_with_limits(take, 30, 0);
    fx::check(got.empty() && sum.skipped_by_offset == 20 && sum.phase == rs::Phase::Completed, "offset past the end emits nothing");

    got.clear();
    rs_.scan_with_limits(take, 0, 7);
    rs_.scan_with_limits(take, 7, 7);
    sum = rs_.scan_with_limits(take, 14, 7);
    fx::check(got == range(1, 20), "consecutive windows cover every record once");
    fx::check(sum.stop_reason == rs::StopReason::EndOfStream, "last window ends with the stream");
  }

  // Large offsets seek through the position index.
  {
    const std::string src = fx::write_file(dir / "sixty.xml", fx::onix_doc(60)).string();
    rs::ScanOptions o;
    o.chunk_bytes = 128;
    o.index_stride = 10;
    o.seek_threshold = 5;
    rs::RecordStreamer rs_(src, o);

    fx::check(rs_.count_records() == 60, "count_records counts every record");
    fx::check(fx::fs::exists(rs_.position_cache_path()) && rs_.stats().index_entries == 6, "counting fills the index");

    Numbers got;
    auto sum = rs_.scan_with_limits([&](const rs::RawRecord& r){ got.push_back(r.record_number); return true; }, 45, 3);
    fx::check(got == range(46, 48), "seeked window emits records 46-48");
    fx::check(sum.seeked_via_index && sum.first_record == 40 && sum.skipped_by_offset == 6, "scan starts at the indexed record 40");

    // An entry that points at the wrong byte is caught before seeking.
    std::string cache = fx::read_file(rs_.position_cache_path());
    const auto at = cache.find("\"40\":") + 5;
    cache.replace(at, cache.find_first_of(",}", at) - at, "5");
    fx::write_file(rs_.position_cache_path(), cache);
    got.clear();
    sum = rs_.scan_with_limits([&](const rs::RawRecord& r){ got.push_back(r.record_number); return true; }, 45, 3);
    fx::check(got == range(46, 48), "stale index still yields the right window");
    fx::check(!sum.seeked_via_index && sum.first_record == 1 && sum.has_warning(rs::ErrorKind::StaleIndex),
              "stale index reported and scan starts over");
    fx::check(rs_.stats().index_entries == 4, "index rebuilt up to record 48 by the fallback scan");
  }

  // A same-size edit past the fingerprinted head shifts record numbers
  // without moving the indexed offsets; the cache must not be trusted.
  {
    const std::size_t pad = 200;
    const fx::fs::path file = dir / "edited.xml";
    const std::string src = fx::write_file(file, fx::onix_doc(60, "", pad)).string();
    rs::ScanOptions o;
    o.chunk_bytes = 256;
    o.index_stride = 10;
    o.seek_threshold = 5;
    {
      rs::RecordStreamer rs_(src, o);
      fx::check(rs_.count_records() == 60 && rs_.stats().index_entries == 6, "index built for the original source");
    }

    // Record 30 grows by exactly the bytes of record 35, which is removed.
    const std::size_t grow = fx::product(35, "", pad).size();
    std::string edited = fx::doc_head();
    for (int i = 1; i <= 60; ++i) {
      if (i == 35) continue;
      edited += fx::product(i, "", i == 30 ? pad + grow : pad);
    }
    edited += fx::doc_tail();
    const std::string original = fx::read_file(file);
    fx::check(edited.size() == original.size() && edited.compare(0, 8192, original, 0, 8192) == 0,
              "edit keeps the size and the fingerprinted head");

    const auto before = fx::fs::last_write_time(file);
    fx::write_file(file, edited);
    fx::fs::last_write_time(file, before + std::chrono::seconds(5));

    rs::RecordStreamer rs_(src, o);
    std::vector<std::string> refs;
    Numbers got;
    auto sum = rs_.scan_with_limits([&](const rs::RawRecord& r){
      got.push_back(r.record_number);
      refs.push_back(fx::ref_of(r.bytes));
      return true;
    }, 45, 3);
    fx::check(!sum.seeked_via_index && sum.first_record == 1, "modified source is scanned from the start");
    fx::check(got == range(46, 48) && refs == std::vector<std::string>{"ref-47", "ref-48", "ref-49"},
              "records 46-48 of the edited source are emitted");
  }

  // A checkpointed window resumes and finishes the same window.
  {
    const std::string src = fx::write_file(dir / "resumed.xml", fx::onix_doc(20)).string();
    rs::ScanOptions o;
    o.chunk_bytes = 64;
    o.offset = 5;
    o.limit = 10;
    o.checkpoint_interval = 0;
    rs::RecordStreamer rs_(src, o);

    Numbers got;
    int budget = 3;
    auto sum = rs_.run([&](const rs::RawRecord& r){ got.push_back(r.record_number); return --budget > 0; });
    fx::check(got == range(6, 8) && sum.stop_reason == rs::StopReason::CallbackAbort, "first part of the window");

    got.clear();
    sum = rs_.run([&](const rs::RawRecord& r){ got.push_back(r.record_number); return true; });
    fx::check(sum.resumed && got == range(9, 15) && sum.stop_reason == rs::StopReason::LimitReached,
              "resumed run finishes the window at record 15");

    got.clear();
    sum = rs_.run([&](const rs::RawRecord& r){ got.push_back(r.record_number); return true; });
    fx::check(got.empty() && sum.stop_reason == rs::StopReason::LimitReached, "finished window emits nothing more");
  }

  std::error_code ec;
  fx::fs::remove_all(dir, ec);
  return fx::result();
}
