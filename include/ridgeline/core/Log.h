#pragma once

#include <string_view>

namespace ridgeline::core {

// Debug carries per-ridge composer detail, Info the CLI status lines, Warn
// the over-tuned generator knobs and unreadable settings files.
enum class LogLevel {
  Debug = 0,
  Info  = 1,
  Warn  = 2,
  Error = 3,
  Off   = 4
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Receives every message that passes the level filter, after it has been
// written to stderr. The views only live for the duration of the call.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Registers a sink for the lifetime of the object.
class ScopedLogSink {
public:
  explicit ScopedLogSink(LogSink sink) : sink_(sink) { addLogSink(sink_); }
  ~ScopedLogSink() { removeLogSink(sink_); }

  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
  LogSink sink_;
};

// "[HH:MM:SS.mmm] ridgeline warn: message" on stderr, then the sinks.
void log(LogLevel level, std::string_view message);

} // namespace ridgeline::core

#define RIDGELINE_LOG_DEBUG(msg) ::ridgeline::core::log(::ridgeline::core::LogLevel::Debug, (msg))
#define RIDGELINE_LOG_INFO(msg)  ::ridgeline::core::log(::ridgeline::core::LogLevel::Info,  (msg))
#define RIDGELINE_LOG_WARN(msg)  ::ridgeline::core::log(::ridgeline::core::LogLevel::Warn,  (msg))
#define RIDGELINE_LOG_ERROR(msg) ::ridgeline::core::log(::ridgeline::core::LogLevel::Error, (msg))
