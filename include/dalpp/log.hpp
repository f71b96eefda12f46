// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::LogSink -- per-database log output.
//
// Design:
//   - No global logger: each Database carries its own sink (Options::log)
//   - C-style callback + context pointer, printf-style formatting
//   - Bounded message buffer, no allocation on the logging path
//   - Default sink writes warnings and errors to stderr

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>

namespace dalpp {

enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kOff = 4,
};

inline const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kOff:   return "OFF";
  }
  return "?";
}

using LogCallback = void (*)(void* ctx, LogLevel level, const char* message);

inline void StderrLogCallback(void* /*ctx*/, LogLevel level,
                              const char* message) {
  std::fprintf(stderr, "[dalpp] %s: %s\n", LogLevelName(level), message);
}

// ---------------------------------------------------------------------------
// LogSink
// ---------------------------------------------------------------------------

struct LogSink {
  static constexpr uint32_t kMaxLineLen = 512;

  LogLevel min_level = LogLevel::kWarn;
  LogCallback callback = &StderrLogCallback;
  void* ctx = nullptr;

  bool Enabled(LogLevel level) const {
    return callback != nullptr && level != LogLevel::kOff &&
           level >= min_level;
  }

  void Write(LogLevel level, const char* fmt, ...) const {
    if (!Enabled(level) || fmt == nullptr) { return; }
    char line[kMaxLineLen];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(line, sizeof(line), fmt, ap);
    va_end(ap);
    callback(ctx, level, line);
  }

  static LogSink Silent() {
    LogSink sink;
    sink.min_level = LogLevel::kOff;
    return sink;
  }
};

}  // namespace dalpp

