// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::ColumnBatch -- backend-neutral columnar result.
//
// Design:
//   - Column: one name, one ColumnType, contiguous typed storage + validity
//   - ColumnBatch: ordered columns, all of the same row count
//   - AssembleBatch(): turns row-major driver cells into columns, converting
//     each cell to the column's mapped type
//   - Move-friendly value types, no virtual dispatch

#pragma once

#include <cassert>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "unidb/datetime.hpp"
#include "unidb/error.hpp"
#include "unidb/value.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Column
// ---------------------------------------------------------------------------

class Column {
 public:
  Column() = default;
  Column(std::string name, ColumnType type)
      : name_(std::move(name)), type_(type) {}

  /// Build a column from values; every non-null value must have `type`.
  static Error FromValues(std::string name, ColumnType type,
                          const std::vector<Value>& values, Column* out) {
    Column column(std::move(name), type);
    column.Reserve(values.size());
    for (const Value& v : values) {
      Error err = column.Append(v);
      if (!err.ok()) { return err; }
    }
    *out = std::move(column);
    return Error::Ok();
  }

  const std::string& name() const { return name_; }
  ColumnType type() const { return type_; }
  size_t size() const { return valid_.size(); }

  void Reserve(size_t n) {
    valid_.reserve(n);
    switch (type_) {
      case ColumnType::kFloat64: doubles_.reserve(n); break;
      case ColumnType::kText:
      case ColumnType::kBinary:  bytes_.reserve(n); break;
      case ColumnType::kNull:    break;
      default:                   ints_.reserve(n); break;
    }
  }

  // --- Append ---

  Error Append(const Value& v) {
    if (v.IsNull()) {
      AppendNull();
      return Error::Ok();
    }
    if (v.type != type_) {
      return Error::Format(ErrorCode::kInvalidParameter,
                           "column '%s' is %s, value is %s", name_.c_str(),
                           ColumnTypeName(type_), ColumnTypeName(v.type));
    }
    switch (type_) {
      case ColumnType::kFloat64: doubles_.push_back(v.f); break;
      case ColumnType::kText:
      case ColumnType::kBinary:  bytes_.push_back(v.bytes); break;
      default:                   ints_.push_back(v.i); break;
    }
    valid_.push_back(1);
    return Error::Ok();
  }

  void AppendNull() {
    switch (type_) {
      case ColumnType::kFloat64: doubles_.push_back(0.0); break;
      case ColumnType::kText:
      case ColumnType::kBinary:  bytes_.emplace_back(); break;
      case ColumnType::kNull:    break;
      default:                   ints_.push_back(0); break;
    }
    valid_.push_back(0);
  }

  // --- Access ---

  bool IsNull(size_t row) const { return valid_[row] == 0; }

  int64_t GetInt64(size_t row, int64_t null_value = 0) const {
    return IsNull(row) ? null_value : ints_[row];
  }

  double GetDouble(size_t row, double null_value = 0.0) const {
    return IsNull(row) ? null_value : doubles_[row];
  }

  /// Text or binary payload; empty for null.
  const std::string& GetText(size_t row) const { return bytes_[row]; }

  bool GetBool(size_t row, bool null_value = false) const {
    return IsNull(row) ? null_value : ints_[row] != 0;
  }

  int32_t GetDate(size_t row, int32_t null_value = 0) const {
    return IsNull(row) ? null_value : static_cast<int32_t>(ints_[row]);
  }

  int64_t GetTimestamp(size_t row, int64_t null_value = 0) const {
    return IsNull(row) ? null_value : ints_[row];
  }

  Value GetValue(size_t row) const {
    if (IsNull(row)) { return Value::Null(); }
    Value v;
    v.type = type_;
    switch (type_) {
      case ColumnType::kFloat64: v.f = doubles_[row]; break;
      case ColumnType::kText:
      case ColumnType::kBinary:  v.bytes = bytes_[row]; break;
      case ColumnType::kNull:    break;
      default:                   v.i = ints_[row]; break;
    }
    return v;
  }

 private:
  std::string name_;
  ColumnType type_ = ColumnType::kNull;
  std::vector<int64_t> ints_;
  std::vector<double> doubles_;
  std::vector<std::string> bytes_;
  std::vector<uint8_t> valid_;
};

// ---------------------------------------------------------------------------
// ColumnBatch
// ---------------------------------------------------------------------------

class ColumnBatch {
 public:
  ColumnBatch() = default;

  // Move
  ColumnBatch(ColumnBatch&&) noexcept = default;
  ColumnBatch& operator=(ColumnBatch&&) noexcept = default;

  // Copy only on request
  ColumnBatch(const ColumnBatch&) = default;
  ColumnBatch& operator=(const ColumnBatch&) = default;

  /// Append a column. Its row count must match the columns already present.
  Error AddColumn(Column column) {
    if (!columns_.empty() && column.size() != NumRows()) {
      return Error::Format(ErrorCode::kInvalidParameter,
                           "column '%s' has %zu rows, batch has %zu",
                           column.name().c_str(), column.size(), NumRows());
    }
    columns_.push_back(std::move(column));
    return Error::Ok();
  }

  size_t NumColumns() const { return columns_.size(); }
  size_t NumRows() const { return columns_.empty() ? 0 : columns_[0].size(); }
  bool Empty() const { return columns_.empty(); }

  const Column& column(size_t index) const { return columns_[index]; }

  int32_t ColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i].name() == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const Column* Find(const std::string& name) const {
    int32_t idx = ColumnIndex(name);
    return (idx >= 0) ? &columns_[static_cast<size_t>(idx)] : nullptr;
  }

  std::vector<std::string> ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const Column& c : columns_) { names.push_back(c.name()); }
    return names;
  }

  void Clear() { columns_.clear(); }

 private:
  std::vector<Column> columns_;
};

// ---------------------------------------------------------------------------
// Cell conversion
// ---------------------------------------------------------------------------

/// Shortest "%.Ng" rendering that reads back to the same double.
inline std::string FormatDouble(double v) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  if (std::strtod(buf, nullptr) != v) {
    std::snprintf(buf, sizeof(buf), "%.17g", v);
  }
  return buf;
}

inline std::string ValueToText(const Value& v) {
  switch (v.type) {
    case ColumnType::kNull:      return std::string();
    case ColumnType::kInt64:     return std::to_string(v.i);
    case ColumnType::kFloat64:   return FormatDouble(v.f);
    case ColumnType::kText:
    case ColumnType::kBinary:    return v.bytes;
    case ColumnType::kBool:      return v.i != 0 ? "true" : "false";
    case ColumnType::kDate:      return FormatDate(static_cast<int32_t>(v.i));
    case ColumnType::kTimestamp: return FormatTimestamp(v.i);
  }
  return std::string();
}

namespace detail {

inline bool ParseInt64Text(const std::string& s, int64_t* out) {
  if (s.empty()) { return false; }
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size()) { return false; }
  *out = static_cast<int64_t>(v);
  return true;
}

inline bool ParseDoubleText(const std::string& s, double* out) {
  if (s.empty()) { return false; }
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) { return false; }
  *out = v;
  return true;
}

inline bool ParseBoolText(const std::string& s, bool* out) {
  std::string lower;
  for (char c : s) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "1" || lower == "true" || lower == "t" || lower == "yes") {
    *out = true;
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "f" || lower == "no") {
    *out = false;
    return true;
  }
  return false;
}

inline bool IsZeroDate(const std::string& s) {
  return s.compare(0, 10, "0000-00-00") == 0;
}

// Julian day number of 1970-01-01T00:00:00Z.
constexpr double kUnixEpochJulianDay = 2440587.5;

}  // namespace detail

/// Convert a driver cell to `target`. Returns false when the cell has no
/// faithful representation in that type.
inline bool ConvertValue(const Value& in, ColumnType target, Value* out) {
  if (in.IsNull()) {
    *out = Value::Null();
    return true;
  }
  if (in.type == target) {
    *out = in;
    return true;
  }

  switch (target) {
    case ColumnType::kNull:
      return false;

    case ColumnType::kText:
      *out = Value::Text(ValueToText(in));
      return true;

    case ColumnType::kBinary:
      if (in.type != ColumnType::kText) { return false; }
      *out = Value::Binary(in.bytes);
      return true;

    case ColumnType::kInt64: {
      if (in.type == ColumnType::kBool) {
        *out = Value::Int64(in.i);
        return true;
      }
      if (in.type == ColumnType::kFloat64) {
        if (std::floor(in.f) != in.f || std::fabs(in.f) > 9.2e18) { return false; }
        *out = Value::Int64(static_cast<int64_t>(in.f));
        return true;
      }
      int64_t v = 0;
      if (in.type != ColumnType::kText || !detail::ParseInt64Text(in.bytes, &v)) {
        return false;
      }
      *out = Value::Int64(v);
      return true;
    }

    case ColumnType::kFloat64: {
      if (in.type == ColumnType::kInt64) {
        *out = Value::Float64(static_cast<double>(in.i));
        return true;
      }
      double v = 0.0;
      if (in.type != ColumnType::kText || !detail::ParseDoubleText(in.bytes, &v)) {
        return false;
      }
      *out = Value::Float64(v);
      return true;
    }

    case ColumnType::kBool: {
      if (in.type == ColumnType::kInt64) {
        *out = Value::Bool(in.i != 0);
        return true;
      }
      if (in.type == ColumnType::kFloat64) {
        *out = Value::Bool(in.f != 0.0);
        return true;
      }
      bool v = false;
      if (in.type != ColumnType::kText || !detail::ParseBoolText(in.bytes, &v)) {
        return false;
      }
      *out = Value::Bool(v);
      return true;
    }

    case ColumnType::kDate: {
      if (in.type == ColumnType::kInt64) {  // Unix seconds
        const int64_t days = FloorDiv(in.i, 86400);
        if (!DateInRange(days)) { return false; }
        *out = Value::Date(static_cast<int32_t>(days));
        return true;
      }
      if (in.type == ColumnType::kTimestamp) {
        const int64_t days = FloorDiv(in.i, kMicrosPerDay);
        if (!DateInRange(days)) { return false; }
        *out = Value::Date(static_cast<int32_t>(days));
        return true;
      }
      if (in.type != ColumnType::kText) { return false; }
      if (detail::IsZeroDate(in.bytes)) {
        *out = Value::Null();
        return true;
      }
      int32_t days = 0;
      if (ParseDate(in.bytes.data(), in.bytes.size(), &days)) {
        *out = Value::Date(days);
        return true;
      }
      int64_t micros = 0;
      if (!ParseTimestamp(in.bytes.data(), in.bytes.size(), &micros)) {
        return false;
      }
      const int64_t ts_days = FloorDiv(micros, kMicrosPerDay);
      if (!DateInRange(ts_days)) { return false; }
      *out = Value::Date(static_cast<int32_t>(ts_days));
      return true;
    }

    case ColumnType::kTimestamp: {
      if (in.type == ColumnType::kInt64) {  // Unix seconds
        if (!DateInRange(FloorDiv(in.i, 86400))) { return false; }
        *out = Value::Timestamp(in.i * kMicrosPerSecond);
        return true;
      }
      if (in.type == ColumnType::kFloat64) {  // Julian day number
        const double days = in.f - detail::kUnixEpochJulianDay;
        if (!(std::fabs(days) < 1e7) ||
            !DateInRange(static_cast<int64_t>(std::floor(days)))) {
          return false;
        }
        *out = Value::Timestamp(static_cast<int64_t>(std::llround(days * 86400.0 * 1e6)));
        return true;
      }
      if (in.type == ColumnType::kDate) {
        *out = Value::Timestamp(in.i * kMicrosPerDay);
        return true;
      }
      if (in.type != ColumnType::kText) { return false; }
      if (detail::IsZeroDate(in.bytes)) {
        *out = Value::Null();
        return true;
      }
      int64_t micros = 0;
      if (!ParseTimestamp(in.bytes.data(), in.bytes.size(), &micros)) {
        return false;
      }
      *out = Value::Timestamp(micros);
      return true;
    }
  }
  return false;
}

/// Pick a column type for cells with no declared type: integers stay
/// integers, integer/real mixes widen to float, anything else is text.
inline ColumnType InferColumnType(const std::vector<Value>& cells,
                                  size_t num_cols, size_t col) {
  ColumnType inferred = ColumnType::kNull;
  for (size_t i = col; i < cells.size(); i += num_cols) {
    ColumnType t = cells[i].type;
    if (t == ColumnType::kNull || t == inferred) { continue; }
    if (inferred == ColumnType::kNull) {
      inferred = t;
    } else if ((inferred == ColumnType::kInt64 && t == ColumnType::kFloat64) ||
               (inferred == ColumnType::kFloat64 && t == ColumnType::kInt64)) {
      inferred = ColumnType::kFloat64;
    } else {
      return ColumnType::kText;
    }
  }
  return inferred;
}

// ---------------------------------------------------------------------------
// AssembleBatch
// ---------------------------------------------------------------------------

enum class CellPolicy : uint8_t {
  kStrict,        // unconvertible cell -> SerializationFailure
  kDemoteToText,  // unconvertible cell -> whole column becomes text
};

/// Build a batch from row-major `cells` (num rows * names.size()).
inline Error AssembleBatch(const std::vector<std::string>& names,
                           const std::vector<ColumnType>& types,
                           const std::vector<Value>& cells, CellPolicy policy,
                           ColumnBatch* out) {
  assert(names.size() == types.size());
  const size_t num_cols = names.size();
  const size_t num_rows = (num_cols == 0) ? 0 : cells.size() / num_cols;
  assert(num_rows * num_cols == cells.size());

  ColumnBatch batch;
  for (size_t c = 0; c < num_cols; ++c) {
    ColumnType type = types[c];
    Column column(names[c], type);
    column.Reserve(num_rows);

    bool demoted = false;
    for (size_t r = 0; r < num_rows; ++r) {
      Value converted;
      if (ConvertValue(cells[r * num_cols + c], type, &converted)) {
        column.Append(converted);
        continue;
      }
      if (policy == CellPolicy::kStrict) {
        return Error::Format(ErrorCode::kSerializationFailure,
                             "column '%s' row %zu: value does not convert to %s",
                             names[c].c_str(), r, ColumnTypeName(type));
      }
      demoted = true;
      break;
    }

    if (demoted) {
      column = Column(names[c], ColumnType::kText);
      column.Reserve(num_rows);
      for (size_t r = 0; r < num_rows; ++r) {
        const Value& cell = cells[r * num_cols + c];
        if (cell.IsNull()) {
          column.AppendNull();
        } else {
          column.Append(Value::Text(ValueToText(cell)));
        }
      }
    }

    Error err = batch.AddColumn(std::move(column));
    assert(err.ok());
    (void)err;
  }

  *out = std::move(batch);
  return Error::Ok();
}

}  // namespace unidb
