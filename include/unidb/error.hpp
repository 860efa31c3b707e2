// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Closed set of kinds; every native driver failure maps to exactly one
//   - Error struct: code + fixed-size message buffer
//   - Compatible with -fno-exceptions

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace unidb {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kConnectionFailure = -1,
  kQueryFailure = -2,
  kConfigurationInvalid = -3,
  kUnsupportedBackend = -4,
  kAlreadyClosed = -5,
  kTimeout = -6,
  kConstraintViolation = -7,
  kInvalidParameter = -8,
  kNotImplemented = -9,
  kSerializationFailure = -10,
  kIoFailure = -11,
};

/// Stable name of an error kind, e.g. "ConstraintViolation".
inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:                   return "Ok";
    case ErrorCode::kConnectionFailure:    return "ConnectionFailure";
    case ErrorCode::kQueryFailure:         return "QueryFailure";
    case ErrorCode::kConfigurationInvalid: return "ConfigurationInvalid";
    case ErrorCode::kUnsupportedBackend:   return "UnsupportedBackend";
    case ErrorCode::kAlreadyClosed:        return "AlreadyClosed";
    case ErrorCode::kTimeout:              return "Timeout";
    case ErrorCode::kConstraintViolation:  return "ConstraintViolation";
    case ErrorCode::kInvalidParameter:     return "InvalidParameter";
    case ErrorCode::kNotImplemented:       return "NotImplemented";
    case ErrorCode::kSerializationFailure: return "SerializationFailure";
    case ErrorCode::kIoFailure:            return "IoFailure";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  const char* name() const { return ErrorCodeName(code); }

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

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
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
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(e.message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    }
    return e;
  }
};

}  // namespace unidb
