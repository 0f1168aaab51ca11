#include "record_streamer/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace rs::log {

namespace {
std::atomic<Level> g_level{Level::Warn};
std::mutex g_mu;

void emit(Level l, std::string_view tag, std::string_view msg) {
  if (static_cast<int>(l) > static_cast<int>(g_level.load(std::memory_order_relaxed))) return;
  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << '[' << tag << "] ";
  if (l == Level::Warn) std::cerr << "warning: ";
  else if (l == Level::Error) std::cerr << "error: ";
  std::cerr << msg << '\n';
}
}

void set_level(Level l) noexcept { g_level.store(l, std::memory_order_relaxed); }

void error(std::string_view tag, std::string_view msg) { emit(Level::Error, tag, msg); }
void warn(std::string_view tag, std::string_view msg)  { emit(Level::Warn, tag, msg); }
void info(std::string_view tag, std::string_view msg)  { emit(Level::Info, tag, msg); }
void debug(std::string_view tag, std::string_view msg) { emit(Level::Debug, tag, msg); }

}
