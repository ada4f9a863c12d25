#include "ridgeline/core/Log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace ridgeline::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sinkMutex;
std::vector<LogSink> g_sinks;

const char* levelTag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   break;
  }
  return "";
}

std::string wallClock() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t t = clock::to_time_t(now);

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
  return oss.str();
}

} // namespace

void setLogLevel(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }
LogLevel getLogLevel() { return g_level.load(std::memory_order_relaxed); }

void addLogSink(LogSink sink) {
  if (!sink.fn) return;
  std::lock_guard<std::mutex> lock(g_sinkMutex);
  g_sinks.push_back(sink);
}

void removeLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sinkMutex);
  auto same = [&sink](const LogSink& s) { return s.fn == sink.fn && s.user == sink.user; };
  g_sinks.erase(std::remove_if(g_sinks.begin(), g_sinks.end(), same), g_sinks.end());
}

void log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off) return;
  const LogLevel threshold = getLogLevel();
  if (threshold == LogLevel::Off || level < threshold) return;

  const std::string stamp = wallClock();

  // Sinks are called unlocked so they may log themselves.
  std::vector<LogSink> sinks;
  {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    std::cerr << '[' << stamp << "] ridgeline " << levelTag(level) << ": " << message << '\n';
    sinks = g_sinks;
  }
  for (const LogSink& s : sinks) s.fn(level, stamp, message, s.user);
}

} // namespace ridgeline::core
