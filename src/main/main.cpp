#include "record_streamer/record_streamer.hpp"
#include "record_streamer/log.hpp"
#include "record_streamer/path_utils.hpp"
#include "record_streamer/summary_json.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct Cli {
  std::string file;
  std::string record = "Product";
  std::string checkpoint;                 // override for the checkpoint file
  std::string summary_json;               // write the run summary here
  std::uint64_t chunk_size = 512 * 1024;
  std::uint64_t interval = 1000;
  std::uint64_t offset = 0;
  std::uint64_t limit = 0;
  std::uint64_t stop_after = 0;           // stop after N emitted records (0: never)
  bool resume = false;
  bool auto_resume = true;
  bool continue_on_error = false;
  bool count = false;
  bool info = false;
  bool clear = false;
  bool print = false;
  rs::log::Level level = rs::log::Level::Info;
};

void usage(std::ostream& os) {
  os <<
    "Usage: record-streamer <file> [--record=NAME] [--chunk-size=BYTES]\n"
    "                       [--checkpoint-interval=N] [--offset=N] [--limit=N]\n"
    "                       [--resume] [--no-auto-resume] [--continue-on-error]\n"
    "                       [--checkpoint=PATH] [--stop-after=N] [--summary-json=PATH]\n"
    "                       [--count | --info | --clear] [--print] [--quiet | --verbose]\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, std::uint64_t* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--record=", &c.record)) continue;
    if (eat_u("--chunk-size=", &c.chunk_size)) continue;
    if (eat_u("--checkpoint-interval=", &c.interval)) continue;
    if (eat_u("--offset=", &c.offset)) continue;
    if (eat_u("--limit=", &c.limit)) continue;
    if (eat_u("--stop-after=", &c.stop_after)) continue;
    if (eat("--checkpoint=", &c.checkpoint)) continue;
    if (eat("--summary-json=", &c.summary_json)) continue;
    if (a == "--resume")            { c.resume = true; continue; }
    if (a == "--no-auto-resume")    { c.auto_resume = false; continue; }
    if (a == "--continue-on-error") { c.continue_on_error = true; continue; }
    if (a == "--count")             { c.count = true; continue; }
    if (a == "--info")              { c.info = true; continue; }
    if (a == "--clear")             { c.clear = true; continue; }
    if (a == "--print")             { c.print = true; continue; }
    if (a == "--quiet")             { c.level = rs::log::Level::Error; continue; }
    if (a == "--verbose")           { c.level = rs::log::Level::Debug; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "unknown option: " << a << "\n"; return false; }
    if (!c.file.empty()) { std::cerr << "only one file may be given\n"; return false; }
    c.file = a;
  }
  return !c.file.empty();
}

// Text of the first <RecordReference> element (any prefix), or empty.
std::string_view record_reference(std::string_view rec) {
  std::size_t at = 0;
  while ((at = rec.find("RecordReference", at)) != std::string_view::npos) {
    const std::size_t lt = rec.rfind('<', at);
    const bool opening = lt != std::string_view::npos && rec.substr(lt, at - lt).find_first_of("/ \t\r\n>") == std::string_view::npos;
    at += 15;
    if (!opening || at >= rec.size() || rec[at] != '>') continue;
    const std::size_t end = rec.find('<', at + 1);
    if (end == std::string_view::npos) return {};
    return rec.substr(at + 1, end - at - 1);
  }
  return {};
}

void print_checkpoint(const rs::Checkpoint& cp) {
  std::cout << "  byte_position: " << cp.byte_position << "\n"
            << "  record_count:  " << cp.record_count << "\n"
            << "  phase:         " << rs::to_string(cp.state.phase) << "\n"
            << "  created_at:    " << cp.created_at << "\n"
            << "  chunk_size:    " << cp.chunk_size << "\n"
            << "  fingerprint:   " << cp.fingerprint.digest.substr(0, 16) << "...\n";
}

int show_info(rs::RecordStreamer& rs_) {
  const auto s = rs_.stats();
  std::cout << "source:     " << s.path << " (" << s.size << " bytes)\n"
            << "chunk size: " << s.chunk_bytes << "\n"
            << "record tag: " << rs_.tag_pattern().open_tag << "\n"
            << "index:      " << s.position_cache_path << " (" << s.index_entries << " entries)\n"
            << "checkpoint: " << s.checkpoint_path << (s.has_checkpoint ? "" : " (none)") << "\n";
  if (s.checkpoint) print_checkpoint(*s.checkpoint);
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 1; }
  } catch (const std::exception& e) {
    std::cerr << "invalid numeric option: " << e.what() << "\n";
    return 1;
  }
  rs::log::set_level(cli.level);

  rs::ScanOptions opts;
  opts.record_name = cli.record;
  opts.chunk_bytes = static_cast<std::size_t>(cli.chunk_size ? cli.chunk_size : 1);
  opts.checkpoint_interval = cli.interval;
  opts.offset = cli.offset;
  opts.limit = cli.limit;
  opts.resume = cli.resume;
  opts.auto_resume = cli.auto_resume;
  opts.continue_on_error = cli.continue_on_error;
  opts.checkpoint_path = cli.checkpoint;

  try {
    rs::RecordStreamer streamer(cli.file, opts);

    if (cli.clear) {
      streamer.clear_checkpoint();
      std::cout << "cleared " << streamer.checkpoint_path() << "\n";
      return 0;
    }
    if (cli.info) return show_info(streamer);
    if (cli.count) {
      std::cout << streamer.count_records() << "\n";
      return 0;
    }

    std::uint64_t seen = 0;
    auto on_record = [&](const rs::RawRecord& r) {
      if (cli.print) {
        std::cout << "#" << r.record_number << " [" << r.start_offset << "," << r.end_offset << ") "
                  << (r.end_offset - r.start_offset) << " bytes";
        const auto ref = record_reference(r.bytes);
        if (!ref.empty()) std::cout << " " << ref;
        std::cout << "\n";
      }
      ++seen;
      return cli.stop_after == 0 || seen < cli.stop_after;
    };

    const rs::Summary sum = streamer.run(on_record);

    std::cerr << "[scan] " << rs::to_string(sum.phase) << " (" << rs::to_string(sum.stop_reason) << "): "
              << sum.emitted << " emitted, records " << sum.first_record << ".." << sum.last_record
              << ", byte " << sum.final_position << "/" << sum.source_size
              << (sum.resumed ? ", resumed" : "") << (sum.seeked_via_index ? ", seeked via index" : "")
              << "\n";

    if (!cli.summary_json.empty()) {
      std::string err;
      if (!rs::ensure_parent_dirs(cli.summary_json) ||
          !rs::write_file_atomic(cli.summary_json, rs::SummaryJsonWriter::to_json(sum, cli.file), &err)) {
        std::cerr << "[scan] summary write failed: " << cli.summary_json << " " << err << "\n";
        return 2;
      }
    }
    return sum.has_warning(rs::ErrorKind::IncompleteStreamAtEnd) ? 3 : 0;
  } catch (const rs::ScanError& e) {
    std::cerr << "[scan] " << rs::to_string(e.kind()) << ": " << e.what() << "\n";
    return 2;
  }
}
