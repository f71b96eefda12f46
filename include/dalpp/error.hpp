// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer + engine cause
//   - Compatible with -fno-exceptions
//   - Engine failures keep the native code and text as a chained cause

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dalpp {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kParse = -12,
  kNoType = -13,
  kNoAccessor = -14,
  kTypeConflict = -15,
  kNoVariant = -16,
  kClosed = -17,
  kInactive = -18,
  kReadOnly = -19,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:           return "ok";
    case ErrorCode::kError:        return "error";
    case ErrorCode::kNotOpen:      return "not open";
    case ErrorCode::kBusy:         return "busy";
    case ErrorCode::kNotFound:     return "not found";
    case ErrorCode::kConstraint:   return "constraint";
    case ErrorCode::kMismatch:     return "mismatch";
    case ErrorCode::kMisuse:       return "misuse";
    case ErrorCode::kRange:        return "range";
    case ErrorCode::kNullParam:    return "null param";
    case ErrorCode::kIoError:      return "io error";
    case ErrorCode::kFull:         return "full";
    case ErrorCode::kParse:        return "parse";
    case ErrorCode::kNoType:       return "no type";
    case ErrorCode::kNoAccessor:   return "no accessor";
    case ErrorCode::kTypeConflict: return "type conflict";
    case ErrorCode::kNoVariant:    return "no variant";
    case ErrorCode::kClosed:       return "closed";
    case ErrorCode::kInactive:     return "inactive";
    case ErrorCode::kReadOnly:     return "read only";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  // Underlying engine failure, if any. native_code is 0 when absent.
  int32_t native_code = 0;
  char cause[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  bool HasCause() const { return native_code != 0 || cause[0] != '\0'; }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void SetCause(int32_t native, const char* native_message) {
    native_code = native;
    if (native_message != nullptr) {
      std::strncpy(cause, native_message, kMaxMessageLen - 1);
      cause[kMaxMessageLen - 1] = '\0';
    } else {
      cause[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
    native_code = 0;
    cause[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error Format(ErrorCode c, const char* fmt, ...) {
    Error e;
    e.code = c;
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(e.message, kMaxMessageLen, fmt, ap);
    va_end(ap);
    return e;
  }

  /// Error carrying an engine failure as its cause.
  static Error Wrap(ErrorCode c, const char* msg, int32_t native,
                    const char* native_message) {
    Error e;
    e.Set(c, msg);
    e.SetCause(native, native_message);
    return e;
  }
};

// Copy `err` to `out_error` if the caller asked for it. Returns err.ok().
inline bool Report(const Error& err, Error* out_error) {
  if (out_error != nullptr) { *out_error = err; }
  return err.ok();
}

}  // namespace dalpp
