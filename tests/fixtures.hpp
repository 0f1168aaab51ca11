#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

// Shared helpers for the test executables: a scratch directory, small ONIX
// style documents and a pass/fail tally.
namespace fx {

namespace fs = std::filesystem;

inline int& failures() { static int n = 0; return n; }

inline bool check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures();
  return ok;
}

inline int result() {
  if (failures()) std::cout << "\n" << failures() << " check(s) failed\n";
  return failures() == 0 ? 0 : 1;
}

// Empty directory under the system temp dir, unique per call.
inline fs::path temp_dir(const std::string& name) {
  static int seq = 0;
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path d = fs::temp_directory_path() /
               ("rs-" + name + "-" + std::to_string(ticks) + "-" + std::to_string(seq++));
  std::error_code ec;
  fs::remove_all(d, ec);
  fs::create_directories(d);
  return d;
}

inline fs::path write_file(const fs::path& p, std::string_view data) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  return p;
}

inline std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// One product record; `pad` adds a description of that many bytes.
inline std::string product(int n, const std::string& prefix = "", std::size_t pad = 0) {
  const std::string q = prefix.empty() ? "" : prefix + ":";
  const std::string id = std::to_string(n);
  std::string s;
  s += "<" + q + "Product>\n";
  s += "  <" + q + "RecordReference>ref-" + id + "</" + q + "RecordReference>\n";
  s += "  <" + q + "ProductIdentifier><" + q + "IDValue>97800000" + id + "</" + q + "IDValue></" + q + "ProductIdentifier>\n";
  if (pad) s += "  <" + q + "Description>" + std::string(pad, 'x') + "</" + q + "Description>\n";
  s += "</" + q + "Product>\n";
  return s;
}

inline std::string doc_head(const std::string& prefix = "") {
  const std::string q = prefix.empty() ? "" : prefix + ":";
  const std::string decl = prefix.empty() ? "xmlns" : "xmlns:" + prefix;
  return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
         "<" + q + "ONIXMessage " + decl + "=\"http://ns.editeur.org/onix/3.0/reference\" release=\"3.0\">\n"
         "<" + q + "Header><" + q + "Sender><" + q + "SenderName>Test</" + q + "SenderName></" + q +
         "Sender></" + q + "Header>\n";
}

inline std::string doc_tail(const std::string& prefix = "") {
  const std::string q = prefix.empty() ? "" : prefix + ":";
  return "</" + q + "ONIXMessage>\n";
}

// Full document with `n` products.
inline std::string onix_doc(int n, const std::string& prefix = "", std::size_t pad = 0) {
  std::string s = doc_head(prefix);
  for (int i = 1; i <= n; ++i) s += product(i, prefix, pad);
  s += doc_tail(prefix);
  return s;
}

// "ref-N" text inside a record, or empty.
inline std::string ref_of(std::string_view rec) {
  auto a = rec.find("ref-");
  if (a == std::string_view::npos) return {};
  auto b = rec.find('<', a);
  return std::string(rec.substr(a, b - a));
}

}
