// Copyright (c) 2024 liudegui. MIT License.
//
// unidb type mapping -- native column types <-> ColumnType.
//
// Design:
//   - MapNativeType(): total function per backend; unknown types map to text
//   - RenderLiteral(): dialect-correct SQL literal for a Value
//   - CheckBindable(): rejects values no backend binder can carry
//
// DECIMAL/NUMERIC/MONEY map to Float64 and lose precision beyond 53 bits.

#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/datetime.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/value.hpp"

namespace unidb {

namespace detail {

inline std::string UpperTrim(const std::string& in) {
  size_t b = 0;
  size_t e = in.size();
  while (b < e && std::isspace(static_cast<unsigned char>(in[b]))) { ++b; }
  while (e > b && std::isspace(static_cast<unsigned char>(in[e - 1]))) { --e; }
  std::string out;
  out.reserve(e - b);
  for (size_t i = b; i < e; ++i) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(in[i]))));
  }
  return out;
}

inline bool Contains(const std::string& s, const char* needle) {
  return s.find(needle) != std::string::npos;
}

/// Split "DECIMAL(10,2) UNSIGNED" into base "DECIMAL" and first size 10.
inline std::string BaseTypeName(const std::string& upper, uint32_t* size) {
  std::string base;
  size_t i = 0;
  while (i < upper.size() && upper[i] != '(') {
    base.push_back(upper[i]);
    ++i;
  }
  if (i < upper.size() && size != nullptr) {
    *size = static_cast<uint32_t>(std::strtoul(upper.c_str() + i + 1, nullptr, 10));
  }
  for (const char* deco : {" UNSIGNED", " SIGNED", " ZEROFILL", " IDENTITY"}) {
    size_t pos = base.find(deco);
    if (pos != std::string::npos) { base.erase(pos); }
  }
  while (!base.empty() && base.back() == ' ') { base.pop_back(); }
  return base;
}

// SQLite column affinity, applied to the declared type.
inline ColumnType MapSqliteType(const std::string& base) {
  if (base.empty() || base == "NULL") { return ColumnType::kNull; }
  if (Contains(base, "DATETIME") || Contains(base, "TIMESTAMP")) {
    return ColumnType::kTimestamp;
  }
  if (Contains(base, "DATE")) { return ColumnType::kDate; }
  if (Contains(base, "BOOL")) { return ColumnType::kBool; }
  if (Contains(base, "INT")) { return ColumnType::kInt64; }
  if (Contains(base, "CHAR") || Contains(base, "CLOB") || Contains(base, "TEXT")) {
    return ColumnType::kText;
  }
  if (Contains(base, "BLOB")) { return ColumnType::kBinary; }
  if (Contains(base, "REAL") || Contains(base, "FLOA") || Contains(base, "DOUB") ||
      Contains(base, "NUMERIC") || Contains(base, "DECIMAL")) {
    return ColumnType::kFloat64;
  }
  return ColumnType::kText;
}

inline bool EndsWithBlob(const std::string& base) {
  return base.size() >= 4 && base.compare(base.size() - 4, 4, "BLOB") == 0;
}

inline ColumnType MapMariaType(const std::string& base, uint32_t size,
                               uint32_t length, bool is_unsigned) {
  // BIGINT UNSIGNED reaches 2^64-1; decimal text keeps it exact.
  if (base == "BIGINT" && is_unsigned) { return ColumnType::kText; }
  if (base == "TINYINT" && (size == 1 || length == 1)) { return ColumnType::kBool; }
  if (base == "BIT") {
    return (size <= 1 && length <= 1) ? ColumnType::kBool : ColumnType::kInt64;
  }
  if (base == "BOOL" || base == "BOOLEAN") { return ColumnType::kBool; }
  if (base == "TINYINT" || base == "SMALLINT" || base == "MEDIUMINT" ||
      base == "INT" || base == "INTEGER" || base == "BIGINT" || base == "YEAR" ||
      base == "LONG" || base == "LONGLONG" || base == "SHORT" || base == "INT24") {
    return ColumnType::kInt64;
  }
  if (base == "FLOAT" || base == "DOUBLE" || base == "REAL" ||
      base == "DECIMAL" || base == "NUMERIC" || base == "NEWDECIMAL" ||
      base == "DOUBLE PRECISION") {
    return ColumnType::kFloat64;
  }
  if (base == "DATE" || base == "NEWDATE") { return ColumnType::kDate; }
  if (base == "DATETIME" || base == "TIMESTAMP") { return ColumnType::kTimestamp; }
  if (base == "BINARY" || base == "VARBINARY" || EndsWithBlob(base) ||
      base == "GEOMETRY") {
    return ColumnType::kBinary;
  }
  if (base == "NULL") { return ColumnType::kNull; }
  // CHAR, VARCHAR, TEXT family, ENUM, SET, JSON, TIME, UUID, INET6 ...
  return ColumnType::kText;
}

inline ColumnType MapMssqlType(const std::string& base) {
  if (base == "BIT") { return ColumnType::kBool; }
  if (base == "TINYINT" || base == "SMALLINT" || base == "INT" ||
      base == "BIGINT") {
    return ColumnType::kInt64;
  }
  if (base == "REAL" || base == "FLOAT" || base == "DECIMAL" ||
      base == "NUMERIC" || base == "MONEY" || base == "SMALLMONEY") {
    return ColumnType::kFloat64;
  }
  if (base == "DATE") { return ColumnType::kDate; }
  if (base == "DATETIME" || base == "DATETIME2" || base == "SMALLDATETIME" ||
      base == "DATETIMEOFFSET") {
    return ColumnType::kTimestamp;
  }
  // TIMESTAMP is rowversion on SQL Server.
  if (base == "BINARY" || base == "VARBINARY" || base == "IMAGE" ||
      base == "TIMESTAMP" || base == "ROWVERSION") {
    return ColumnType::kBinary;
  }
  // CHAR, NCHAR, VARCHAR, NVARCHAR, TEXT, NTEXT, XML, UNIQUEIDENTIFIER,
  // TIME, SQL_VARIANT ...
  return ColumnType::kText;
}

}  // namespace detail

/// Map a native type name as reported by the driver to a ColumnType.
/// `length` is the driver's display length where it disambiguates
/// (MariaDB TINYINT(1) / BIT(1)).
inline ColumnType MapNativeType(Backend backend, const std::string& type_name,
                                uint32_t length = 0) {
  std::string upper = detail::UpperTrim(type_name);
  uint32_t size = 0;
  std::string base = detail::BaseTypeName(upper, &size);
  switch (backend) {
    case Backend::kSqlite: return detail::MapSqliteType(base);
    case Backend::kMaria:
      return detail::MapMariaType(base, size, length,
                                  detail::Contains(upper, "UNSIGNED"));
    case Backend::kMssql:  return detail::MapMssqlType(base);
  }
  return ColumnType::kText;
}

// ---------------------------------------------------------------------------
// Values -> SQL
// ---------------------------------------------------------------------------

/// Reject values that no binder or literal can represent on `dialect`.
inline Error CheckBindable(const Value& value, const Dialect& dialect) {
  switch (value.type) {
    case ColumnType::kFloat64:
      if (!std::isfinite(value.f)) {
        return Error::Format(ErrorCode::kInvalidParameter,
                             "non-finite float is not representable on %s",
                             dialect.name);
      }
      break;
    case ColumnType::kDate:
      if (!DateInRange(value.i)) {
        return Error::Make(ErrorCode::kInvalidParameter,
                           "date outside years 0001..9999");
      }
      break;
    case ColumnType::kTimestamp:
      if (!TimestampInRange(value.i)) {
        return Error::Make(ErrorCode::kInvalidParameter,
                           "timestamp outside years 0001..9999");
      }
      break;
    default:
      break;
  }
  return Error::Ok();
}

namespace detail {

inline void AppendQuotedText(const std::string& text, const Dialect& dialect,
                             std::string* out) {
  if (dialect.backend == Backend::kMssql) { out->push_back('N'); }
  out->push_back('\'');
  for (char c : text) {
    if (c == '\'') {
      out->push_back('\'');
    } else if (c == '\\' && dialect.backend == Backend::kMaria) {
      out->push_back('\\');
    }
    out->push_back(c);
  }
  out->push_back('\'');
}

inline void AppendHex(const std::string& bytes, const Dialect& dialect,
                      std::string* out) {
  static const char kHex[] = "0123456789ABCDEF";
  const bool mssql = dialect.backend == Backend::kMssql;
  out->append(mssql ? "0x" : "X'");
  for (unsigned char c : bytes) {
    out->push_back(kHex[c >> 4]);
    out->push_back(kHex[c & 0x0F]);
  }
  if (!mssql) { out->push_back('\''); }
}

}  // namespace detail

/// Render `value` as a literal for `dialect`.
inline Error RenderLiteral(const Value& value, const Dialect& dialect,
                           std::string* out) {
  Error err = CheckBindable(value, dialect);
  if (!err.ok()) { return err; }

  out->clear();
  switch (value.type) {
    case ColumnType::kNull:
      out->append("NULL");
      break;
    case ColumnType::kInt64:
      out->append(std::to_string(value.i));
      break;
    case ColumnType::kFloat64:
      out->append(FormatDouble(value.f));
      break;
    case ColumnType::kText:
      if (value.bytes.find('\0') != std::string::npos) {
        return Error::Make(ErrorCode::kInvalidParameter,
                           "text literal contains a NUL byte");
      }
      detail::AppendQuotedText(value.bytes, dialect, out);
      break;
    case ColumnType::kBool:
      out->append(BoolLiteral(value.i != 0, dialect));
      break;
    case ColumnType::kDate:
      out->push_back('\'');
      out->append(FormatDate(static_cast<int32_t>(value.i)));
      out->push_back('\'');
      break;
    case ColumnType::kTimestamp:
      out->push_back('\'');
      out->append(FormatTimestamp(
          value.i, dialect.backend == Backend::kMssql ? 'T' : ' '));
      out->push_back('\'');
      break;
    case ColumnType::kBinary:
      detail::AppendHex(value.bytes, dialect, out);
      break;
  }
  return Error::Ok();
}

}  // namespace unidb
