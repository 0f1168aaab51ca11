#include "record_streamer/boundary_scanner.hpp"
#include "record_streamer/chunk_buffer.hpp"
#include "../fixtures.hpp"

#include <string>
#include <tuple>
#include <vector>

using Span = std::tuple<std::uint64_t, std::uint64_t, std::uint64_t>;

static std::vector<Span> expected_spans(const std::string& doc) {
  std::vector<Span> out;
  std::size_t p = 0;
  std::uint64_t n = 0;
  while ((p = doc.find("<Product>", p)) != std::string::npos) {
    const std::size_t e = doc.find("</Product>", p) + 10;
    out.emplace_back(++n, p, e);
    p = e;
  }
  return out;
}

static std::vector<Span> scan(const std::string& path, std::size_t chunk, rs::ScanSession* out = nullptr) {
  const rs::BoundaryScanner sc(rs::make_tag_pattern("Product"));
  rs::ChunkBuffer cb(path, {chunk, 3}, sc);
  rs::ScanSession s;
  std::vector<Span> spans;
  if (!cb.open(s, 0, 0)) return spans;
  rs::RawRecord r;
  while (cb.next(s, r)) spans.emplace_back(r.record_number, r.start_offset, r.end_offset);
  if (out) *out = s;
  return spans;
}

int main(){
  const auto dir = fx::temp_dir("chunk-buffer");
  const std::string doc = fx::onix_doc(25);
  const std::string path = fx::write_file(dir / "small.xml", doc).string();
  const auto want = expected_spans(doc);

  for (std::size_t chunk : {1u, 7u, 64u, 333u, 1u << 20}) {
    rs::ScanSession s;
    const auto got = scan(path, chunk, &s);
    fx::check(got == want, "chunk " + std::to_string(chunk) + ": same records as the whole document");
    fx::check(s.stream_offset == doc.size(), "chunk " + std::to_string(chunk) + ": read to end");
  }

  {
    rs::ScanSession s;
    (void)scan(path, 256, &s);
    fx::check(s.peak_buffer <= 256 * 3, "buffer stays within chunk * multiple");
    fx::check(s.degraded_events == 0, "no degraded mode for small records");
  }

  {
    // resume from the byte after record 10
    const rs::BoundaryScanner sc(rs::make_tag_pattern("Product"));
    rs::ChunkBuffer cb(path, {64, 3}, sc);
    rs::ScanSession s;
    const auto start = std::get<2>(want[9]);
    fx::check(cb.open(s, start, 10), "open at record boundary");
    rs::RawRecord r;
    fx::check(cb.next(s, r) && r.record_number == 11 && r.start_offset == std::get<1>(want[10]) &&
              fx::ref_of(r.bytes) == "ref-11", "first record after offset is record 11");
  }

  {
    std::string big = fx::doc_head();
    big += fx::product(1);
    big += fx::product(2, "", 4000);
    big += fx::product(3);
    big += fx::product(4, "", 4000);
    big += fx::doc_tail();
    const std::string bpath = fx::write_file(dir / "big.xml", big).string();

    const rs::BoundaryScanner sc(rs::make_tag_pattern("Product"));
    rs::ChunkBuffer cb(bpath, {256, 3}, sc);
    int degraded = 0, recovered = 0;
    cb.on_event([&](const rs::ChunkBuffer::Event& e){
      if (e.kind == rs::ChunkBuffer::EventKind::Degraded) ++degraded;
      if (e.kind == rs::ChunkBuffer::EventKind::Recovered) ++recovered;
    });
    rs::ScanSession s;
    cb.open(s, 0, 0);
    rs::RawRecord r;
    std::vector<std::string> refs;
    std::size_t big_len = 0;
    while (cb.next(s, r)) {
      refs.push_back(fx::ref_of(r.bytes));
      if (r.record_number == 2) big_len = r.bytes.size();
    }
    fx::check(refs == std::vector<std::string>{"ref-1", "ref-2", "ref-3", "ref-4"}, "oversized records delivered whole");
    fx::check(big_len == fx::product(2, "", 4000).size() - 1, "oversized record bytes intact");
    fx::check(degraded == 2 && s.degraded_events == 2, "one degraded event per oversized record");
    fx::check(recovered == 2, "window recovers after each oversized record");
    fx::check(s.peak_buffer > cb.max_buffer_bytes(), "degraded window exceeded its bound");
    fx::check(!cb.has_pending_record(s), "no pending record at end");
    fx::check(sc.bytes_walked() <= 2 * big.size(), "refills continue the walk instead of restarting it");
  }

  {
    const std::string trunc = fx::doc_head() + fx::product(1) + "<Product>\n  <RecordReference>ref-2";
    const std::string tpath = fx::write_file(dir / "trunc.xml", trunc).string();
    const rs::BoundaryScanner sc(rs::make_tag_pattern("Product"));
    rs::ChunkBuffer cb(tpath, {32, 3}, sc);
    rs::ScanSession s;
    cb.open(s, 0, 0);
    rs::RawRecord r;
    int n = 0;
    while (cb.next(s, r)) ++n;
    fx::check(n == 1 && cb.has_pending_record(s) && !cb.failed(), "unterminated record left pending");
  }

  {
    const rs::BoundaryScanner sc(rs::make_tag_pattern("Product"));
    rs::ChunkBuffer cb((dir / "missing.xml").string(), {}, sc);
    rs::ScanSession s;
    fx::check(!cb.open(s, 0, 0) && cb.failed() && cb.last_error() != 0, "missing source reported");
  }

  std::error_code ec;
  fx::fs::remove_all(dir, ec);
  return fx::result();
}
