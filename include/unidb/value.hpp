// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Value -- one typed cell.
//
// Design:
//   - ColumnType is the closed set of columnar types
//   - Value is a small tagged struct (no variant), copyable
//   - Used for bound parameters, UPDATE assignments and row access

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace unidb {

// ---------------------------------------------------------------------------
// ColumnType
// ---------------------------------------------------------------------------

enum class ColumnType : uint8_t {
  kNull = 0,  // null-only column
  kInt64,
  kFloat64,
  kText,      // UTF-8
  kBool,
  kDate,      // days since 1970-01-01
  kTimestamp, // microseconds since the Unix epoch, UTC
  kBinary,
};

inline const char* ColumnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::kNull:      return "null";
    case ColumnType::kInt64:     return "int64";
    case ColumnType::kFloat64:   return "float64";
    case ColumnType::kText:      return "text";
    case ColumnType::kBool:      return "bool";
    case ColumnType::kDate:      return "date";
    case ColumnType::kTimestamp: return "timestamp";
    case ColumnType::kBinary:    return "binary";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

struct Value {
  ColumnType type = ColumnType::kNull;
  int64_t i = 0;       // kInt64, kBool (0/1), kDate, kTimestamp
  double f = 0.0;      // kFloat64
  std::string bytes;   // kText, kBinary

  bool IsNull() const { return type == ColumnType::kNull; }

  static Value Null() { return Value{}; }

  static Value Int64(int64_t v) {
    Value out;
    out.type = ColumnType::kInt64;
    out.i = v;
    return out;
  }

  static Value Float64(double v) {
    Value out;
    out.type = ColumnType::kFloat64;
    out.f = v;
    return out;
  }

  static Value Text(std::string v) {
    Value out;
    out.type = ColumnType::kText;
    out.bytes = std::move(v);
    return out;
  }

  static Value Bool(bool v) {
    Value out;
    out.type = ColumnType::kBool;
    out.i = v ? 1 : 0;
    return out;
  }

  static Value Date(int32_t days) {
    Value out;
    out.type = ColumnType::kDate;
    out.i = days;
    return out;
  }

  static Value Timestamp(int64_t micros) {
    Value out;
    out.type = ColumnType::kTimestamp;
    out.i = micros;
    return out;
  }

  static Value Binary(std::string v) {
    Value out;
    out.type = ColumnType::kBinary;
    out.bytes = std::move(v);
    return out;
  }

  bool operator==(const Value& o) const {
    if (type != o.type) { return false; }
    switch (type) {
      case ColumnType::kNull:    return true;
      case ColumnType::kFloat64: return f == o.f;
      case ColumnType::kText:
      case ColumnType::kBinary:  return bytes == o.bytes;
      default:                   return i == o.i;
    }
  }
  bool operator!=(const Value& o) const { return !(*this == o); }
};

}  // namespace unidb
