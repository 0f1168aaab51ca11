#include "record_streamer/tag_resolver.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rs {

namespace {

bool is_name_char(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || c == '-' || c == '.' || u >= 0x80;
}

bool is_tag_delim(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '>' || c == '/';
}

bool icontains(std::string_view hay, std::string_view needle) {
  if (needle.empty()) return true;
  if (needle.size() > hay.size()) return false;
  for (std::size_t i = 0; i + needle.size() <= hay.size(); ++i) {
    std::size_t j = 0;
    while (j < needle.size() &&
           std::tolower(static_cast<unsigned char>(hay[i + j])) ==
           std::tolower(static_cast<unsigned char>(needle[j]))) ++j;
    if (j == needle.size()) return true;
  }
  return false;
}

struct XmlnsDecl {
  std::string prefix;  // empty for the default namespace
  std::string uri;
};

std::vector<XmlnsDecl> xmlns_decls(std::string_view head) {
  std::vector<XmlnsDecl> out;
  std::size_t pos = 0;
  while ((pos = head.find("xmlns", pos)) != std::string_view::npos) {
    std::size_t p = pos + 5;
    pos = p;
    std::string prefix;
    if (p < head.size() && head[p] == ':') {
      std::size_t s = ++p;
      while (p < head.size() && is_name_char(head[p])) ++p;
      prefix.assign(head.substr(s, p - s));
      if (prefix.empty()) continue;
    }
    while (p < head.size() && std::isspace(static_cast<unsigned char>(head[p]))) ++p;
    if (p >= head.size() || head[p] != '=') continue;
    ++p;
    while (p < head.size() && std::isspace(static_cast<unsigned char>(head[p]))) ++p;
    if (p >= head.size() || (head[p] != '"' && head[p] != '\'')) continue;
    const char q = head[p++];
    std::size_t e = head.find(q, p);
    if (e == std::string_view::npos) break;  // declaration cut off by the head window
    out.push_back(XmlnsDecl{std::move(prefix), std::string(head.substr(p, e - p))});
    pos = e + 1;
  }
  return out;
}

std::string uri_for(const std::vector<XmlnsDecl>& decls, std::string_view prefix) {
  for (const auto& d : decls) if (d.prefix == prefix) return d.uri;
  return {};
}

// Prefix of the first opening tag of the record element, if one is in the head.
// Returns false when no such tag is visible.
bool record_tag_prefix(std::string_view head, std::string_view local, std::string& prefix) {
  std::size_t pos = 0;
  while ((pos = head.find(local, pos)) != std::string_view::npos) {
    const std::size_t after = pos + local.size();
    const std::size_t at = pos;
    pos = after;
    if (after >= head.size() || !is_tag_delim(head[after])) continue;
    if (at == 0) continue;
    if (head[at - 1] == '<') { prefix.clear(); return true; }
    if (head[at - 1] != ':') continue;
    std::size_t s = at - 1;
    while (s > 0 && is_name_char(head[s - 1])) --s;
    if (s == at - 1 || s == 0 || head[s - 1] != '<') continue;
    prefix.assign(head.substr(s, at - 1 - s));
    return true;
  }
  return false;
}

// Prefix of the document (root) element.
std::string root_prefix(std::string_view head) {
  std::size_t pos = 0;
  while ((pos = head.find('<', pos)) != std::string_view::npos) {
    if (pos + 1 >= head.size()) return {};
    const char c = head[pos + 1];
    if (c == '?') {
      auto e = head.find("?>", pos + 2);
      if (e == std::string_view::npos) return {};
      pos = e + 2;
      continue;
    }
    if (c == '!') {
      if (head.substr(pos, 4) == "<!--") {
        auto e = head.find("-->", pos + 4);
        if (e == std::string_view::npos) return {};
        pos = e + 3;
      } else {
        auto e = head.find('>', pos + 2);
        if (e == std::string_view::npos) return {};
        pos = e + 1;
      }
      continue;
    }
    std::size_t p = pos + 1;
    while (p < head.size() && (is_name_char(head[p]) || head[p] == ':')) ++p;
    std::string_view qname = head.substr(pos + 1, p - pos - 1);
    auto colon = qname.find(':');
    return colon == std::string_view::npos ? std::string{} : std::string(qname.substr(0, colon));
  }
  return {};
}

}

TagPattern make_tag_pattern(std::string_view local_name, std::string_view prefix) {
  TagPattern t;
  t.local_name.assign(local_name);
  t.prefix.assign(prefix);
  std::string q = t.prefix.empty() ? t.local_name : t.prefix + ":" + t.local_name;
  t.open_tag  = "<" + q;
  t.close_tag = "</" + q + ">";
  return t;
}

TagResolver::TagResolver(Config cfg) : cfg_(std::move(cfg)) {}

TagPattern TagResolver::detect(std::string_view head) const {
  const auto decls = xmlns_decls(head);

  // (1) a record tag already visible in the head decides it outright
  std::string prefix;
  if (!record_tag_prefix(head, cfg_.local_name, prefix)) {
    // (2) records share the container's prefix
    prefix = root_prefix(head);
    // (3) a declared prefix bound to the expected vocabulary
    if (prefix.empty() && !cfg_.namespace_hint.empty()) {
      for (const auto& d : decls) {
        if (!d.prefix.empty() && icontains(d.uri, cfg_.namespace_hint)) { prefix = d.prefix; break; }
      }
    }
  }

  TagPattern t = make_tag_pattern(cfg_.local_name, prefix);
  t.namespace_uri = uri_for(decls, prefix);
  return t;
}

}
