// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================
#include "wbf/log.hpp"

#include <atomic>
#include <iostream>   // std::cerr: default sink
#include <mutex>

namespace wbf {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::mutex g_mutex;            // guards g_sink and the stderr write
LogSink g_sink;                // empty -> stderr

} // namespace

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  if      (s == "debug") out = LogLevel::Debug;
  else if (s == "info")  out = LogLevel::Info;
  else if (s == "warn")  out = LogLevel::Warn;
  else if (s == "error") out = LogLevel::Error;
  else return false;
  return true;
}

void set_log_level(LogLevel level) { g_level = static_cast<uint8_t>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& message) {
  if (static_cast<uint8_t>(level) < g_level.load()) return;   // below threshold

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_sink) {
    g_sink(level, message);
    return;
  }
  std::cerr << to_string(level) << ": " << message << "\n";
}

} // namespace wbf
