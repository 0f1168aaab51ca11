#include "record_streamer/boundary_scanner.hpp"

#include <string_view>
#include <utility>

namespace rs {

namespace {

constexpr std::size_t npos = std::string_view::npos;

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// '>' that ends a start tag, skipping quoted attribute values.
std::size_t find_tag_end(std::string_view buf, std::size_t from) {
  char quote = 0;
  for (std::size_t i = from; i < buf.size(); ++i) {
    const char c = buf[i];
    if (quote) { if (c == quote) quote = 0; }
    else if (c == '"' || c == '\'') quote = c;
    else if (c == '>') return i;
  }
  return npos;
}

// '<' at `pos` opening a comment, CDATA section, processing instruction or
// declaration: 1 and `next` past its end, 0 if it is none of those,
// -1 if the window ends before that can be told or before the construct ends.
int skip_markup(std::string_view buf, std::size_t pos, std::size_t& next) {
  if (pos + 1 >= buf.size()) return -1;
  const char c = buf[pos + 1];
  if (c == '?') {
    auto e = buf.find("?>", pos + 2);
    if (e == npos) return -1;
    next = e + 2;
    return 1;
  }
  if (c != '!') return 0;

  std::string_view rest = buf.substr(pos);
  if (rest.size() < 4) return -1;
  if (rest.compare(0, 4, "<!--") == 0) {
    auto e = buf.find("-->", pos + 4);
    if (e == npos) return -1;
    next = e + 3;
    return 1;
  }
  if (rest[2] == '[') {
    static constexpr std::string_view cdata = "<![CDATA[";
    if (rest.size() < cdata.size()) return -1;
    if (rest.compare(0, cdata.size(), cdata) == 0) {
      auto e = buf.find("]]>", pos + cdata.size());
      if (e == npos) return -1;
      next = e + 3;
      return 1;
    }
  }
  auto e = buf.find('>', pos + 2);
  if (e == npos) return -1;
  next = e + 1;
  return 1;
}

// `buf` at `pos` starts with `lit`; sets need_more when the window is a
// proper prefix of it.
bool literal_at(std::string_view buf, std::size_t pos, std::string_view lit, bool* need_more) {
  const std::size_t avail = buf.size() - pos;
  if (avail < lit.size()) {
    if (buf.compare(pos, avail, lit.substr(0, avail)) == 0) *need_more = true;
    return false;
  }
  return buf.compare(pos, lit.size(), lit) == 0;
}

}

BoundaryScanner::BoundaryScanner(TagPattern pattern)
  : pat_(std::move(pattern)),
    close_name_(pat_.close_tag.substr(0, pat_.close_tag.size() - 1)) {}

bool BoundaryScanner::is_open_at(std::string_view buf, std::size_t pos, bool* need_more) const {
  if (!literal_at(buf, pos, pat_.open_tag, need_more)) return false;
  const std::size_t after = pos + pat_.open_tag.size();
  if (after >= buf.size()) { *need_more = true; return false; }
  const char c = buf[after];
  // exact name only: "<ProductIdentifier" is not "<Product"
  return is_ws(c) || c == '>' || c == '/';
}

bool BoundaryScanner::is_close_at(std::string_view buf, std::size_t pos,
                                  std::size_t* gt, bool* need_more) const {
  if (!literal_at(buf, pos, close_name_, need_more)) return false;
  std::size_t p = pos + close_name_.size();
  while (p < buf.size() && is_ws(buf[p])) ++p;
  if (p >= buf.size()) { *need_more = true; return false; }
  if (buf[p] != '>') return false;
  *gt = p;
  return true;
}

BoundaryScanner::WalkResult BoundaryScanner::walk_to_open(std::string_view buf, std::size_t from) const {
  std::size_t p = from;
  while ((p = buf.find('<', p)) != npos) {
    std::size_t next = 0;
    const int m = skip_markup(buf, p, next);
    if (m < 0) return {Walk::Incomplete, p};
    if (m > 0) { p = next; continue; }
    bool need_more = false;
    if (is_open_at(buf, p, &need_more)) return {Walk::Open, p};
    if (need_more) return {Walk::Incomplete, p};
    ++p;
  }
  return {Walk::None, buf.size()};
}

std::optional<std::size_t> BoundaryScanner::find_open_tag(std::string_view buf, std::size_t from) const {
  auto w = walk_to_open(buf, from);
  if (w.kind != Walk::Open) return std::nullopt;
  return w.pos;
}

std::optional<RecordBoundary> BoundaryScanner::find_next_record(std::string_view buf,
                                                                std::size_t search_from,
                                                                RecordProgress* progress) const {
  RecordProgress st;
  if (progress && progress->open && progress->start >= search_from && progress->resume <= buf.size())
    st = *progress;
  if (progress) *progress = RecordProgress{};

  if (!st.open) {
    if (search_from >= buf.size()) return std::nullopt;
    auto w = walk_to_open(buf, search_from);
    walked_ += w.pos - search_from;
    if (w.kind != Walk::Open) return std::nullopt;
    st.open = true;
    st.start = st.resume = w.pos;
  }

  const std::size_t start = st.start;
  std::size_t depth = st.depth;
  std::size_t p = st.resume;
  if (depth == 0) {
    const std::size_t head_end = find_tag_end(buf, start + pat_.open_tag.size());
    if (head_end == npos) {
      if (progress) *progress = RecordProgress{true, start, start, 0};
      return std::nullopt;
    }
    if (buf[head_end - 1] == '/') return RecordBoundary{start, head_end + 1};
    depth = 1;
    p = head_end + 1;
  }

  const std::size_t from = p;
  std::size_t stop = buf.size();
  for (;;) {
    p = buf.find('<', p);
    if (p == npos) break;

    std::size_t next = 0;
    const int m = skip_markup(buf, p, next);
    if (m < 0) { stop = p; break; }
    if (m > 0) { p = next; continue; }

    bool need_more = false;
    std::size_t gt = 0;
    if (is_close_at(buf, p, &gt, &need_more)) {
      if (--depth == 0) {
        walked_ += gt + 1 - from;
        return RecordBoundary{start, gt + 1};
      }
      p = gt + 1;
      continue;
    }
    if (need_more) { stop = p; break; }

    if (is_open_at(buf, p, &need_more)) {
      const std::size_t e = find_tag_end(buf, p + pat_.open_tag.size());
      if (e == npos) { stop = p; break; }
      if (buf[e - 1] != '/') ++depth;  // nested self-closing records leave depth alone
      p = e + 1;
      continue;
    }
    if (need_more) { stop = p; break; }
    ++p;
  }

  walked_ += stop - from;
  if (progress) *progress = RecordProgress{true, start, stop, depth};
  return std::nullopt;
}

std::size_t BoundaryScanner::safe_trim_point(std::string_view buf, std::size_t from) const {
  if (from >= buf.size()) return buf.size();
  auto w = walk_to_open(buf, from);
  return w.kind == Walk::None ? buf.size() : w.pos;
}

bool BoundaryScanner::ends_with_record_close(std::string_view buf) const {
  if (buf.empty() || buf.back() != '>') return false;
  const std::size_t lt = buf.rfind('<');
  if (lt == npos) return false;
  std::string_view tag = buf.substr(lt);

  bool need_more = false;
  std::size_t gt = 0;
  if (is_close_at(tag, 0, &gt, &need_more)) return gt == tag.size() - 1;
  if (is_open_at(tag, 0, &need_more)) {
    const std::size_t e = find_tag_end(tag, pat_.open_tag.size());
    return e == tag.size() - 1 && tag[e - 1] == '/';
  }
  return false;
}

bool BoundaryScanner::starts_with_record_open(std::string_view buf) const {
  bool need_more = false;
  return is_open_at(buf, 0, &need_more);
}

}
