// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MariaQuery -- buffered text-protocol result for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_RES* (mysql_store_result) with RAII
//   - Move-only (no copy)
//   - Collect() turns the result into names, mapped types and raw cells
//   - Field metadata helpers shared with MariaStatement

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <mysql.h>

#include "unidb/config.hpp"
#include "unidb/error.hpp"
#include "unidb/native_errors.hpp"
#include "unidb/type_map.hpp"
#include "unidb/value.hpp"

namespace unidb {

// charsetnr of binary strings and blobs.
constexpr unsigned int kMariaBinaryCharset = 63;

inline Error MariaError(MYSQL* conn) {
  unsigned int code = mysql_errno(conn);
  return Error::Format(MapMariaErrno(code), "%s (mysql %u, sqlstate %s)",
                       mysql_error(conn), code, mysql_sqlstate(conn));
}

inline Error MariaStmtError(MYSQL_STMT* stmt) {
  unsigned int code = mysql_stmt_errno(stmt);
  return Error::Format(MapMariaErrno(code), "%s (mysql %u, sqlstate %s)",
                       mysql_stmt_error(stmt), code, mysql_stmt_sqlstate(stmt));
}

/// Native type name of a result field, as understood by MapNativeType().
inline const char* MariaFieldTypeName(const MYSQL_FIELD& field) {
  const bool binary = field.charsetnr == kMariaBinaryCharset;
  switch (field.type) {
    case MYSQL_TYPE_TINY:        return "TINYINT";
    case MYSQL_TYPE_SHORT:       return "SMALLINT";
    case MYSQL_TYPE_INT24:       return "MEDIUMINT";
    case MYSQL_TYPE_LONG:        return "INT";
    case MYSQL_TYPE_LONGLONG:
      return (field.flags & UNSIGNED_FLAG) ? "BIGINT UNSIGNED" : "BIGINT";
    case MYSQL_TYPE_YEAR:        return "YEAR";
    case MYSQL_TYPE_FLOAT:       return "FLOAT";
    case MYSQL_TYPE_DOUBLE:      return "DOUBLE";
    case MYSQL_TYPE_DECIMAL:
    case MYSQL_TYPE_NEWDECIMAL:  return "DECIMAL";
    case MYSQL_TYPE_BIT:         return "BIT";
    case MYSQL_TYPE_DATE:
    case MYSQL_TYPE_NEWDATE:     return "DATE";
    case MYSQL_TYPE_DATETIME:    return "DATETIME";
    case MYSQL_TYPE_TIMESTAMP:   return "TIMESTAMP";
    case MYSQL_TYPE_TIME:        return "TIME";
    case MYSQL_TYPE_NULL:        return "NULL";
    case MYSQL_TYPE_GEOMETRY:    return "GEOMETRY";
    case MYSQL_TYPE_ENUM:        return "ENUM";
    case MYSQL_TYPE_SET:         return "SET";
    case MYSQL_TYPE_JSON:        return "JSON";
    case MYSQL_TYPE_TINY_BLOB:
    case MYSQL_TYPE_MEDIUM_BLOB:
    case MYSQL_TYPE_LONG_BLOB:
    case MYSQL_TYPE_BLOB:        return binary ? "BLOB" : "TEXT";
    case MYSQL_TYPE_VAR_STRING:
    case MYSQL_TYPE_VARCHAR:     return binary ? "VARBINARY" : "VARCHAR";
    case MYSQL_TYPE_STRING:      return binary ? "BINARY" : "CHAR";
    default:                     return "UNKNOWN";
  }
}

inline ColumnType MariaFieldType(const MYSQL_FIELD& field) {
  return MapNativeType(Backend::kMaria, MariaFieldTypeName(field),
                       static_cast<uint32_t>(field.length));
}

/// Raw cell from the wire: BIT values arrive as big-endian bytes, binary
/// strings as bytes, everything else as text for AssembleBatch to convert.
inline Value MariaCell(const MYSQL_FIELD& field, const char* data,
                       unsigned long length) {
  if (data == nullptr) { return Value::Null(); }
  if (field.type == MYSQL_TYPE_BIT) {
    int64_t v = 0;
    for (unsigned long i = 0; i < length; ++i) {
      v = (v << 8) | static_cast<unsigned char>(data[i]);
    }
    return Value::Int64(v);
  }
  std::string bytes(data, length);
  if (MariaFieldType(field) == ColumnType::kBinary) {
    return Value::Binary(std::move(bytes));
  }
  return Value::Text(std::move(bytes));
}

// ---------------------------------------------------------------------------
// MariaQuery
// ---------------------------------------------------------------------------

class MariaQuery {
 public:
  MariaQuery() = default;
  explicit MariaQuery(MYSQL_RES* res) : res_(res) {}

  ~MariaQuery() { Finalize(); }

  // Move
  MariaQuery(MariaQuery&& other) noexcept : res_(other.res_) {
    other.res_ = nullptr;
  }

  MariaQuery& operator=(MariaQuery&& other) noexcept {
    if (this != &other) {
      Finalize();
      res_ = other.res_;
      other.res_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaQuery(const MariaQuery&) = delete;
  MariaQuery& operator=(const MariaQuery&) = delete;

  int32_t NumFields() const {
    return (res_ != nullptr) ? static_cast<int32_t>(mysql_num_fields(res_)) : 0;
  }

  /// Read every row. Cells are row-major.
  void Collect(std::vector<std::string>* names, std::vector<ColumnType>* types,
               std::vector<Value>* cells) {
    const unsigned int n = mysql_num_fields(res_);
    MYSQL_FIELD* fields = mysql_fetch_fields(res_);
    for (unsigned int i = 0; i < n; ++i) {
      names->emplace_back(fields[i].name != nullptr ? fields[i].name : "");
      types->push_back(MariaFieldType(fields[i]));
    }
    cells->reserve(static_cast<size_t>(mysql_num_rows(res_)) * n);

    MYSQL_ROW row = nullptr;
    while ((row = mysql_fetch_row(res_)) != nullptr) {
      unsigned long* lengths = mysql_fetch_lengths(res_);
      for (unsigned int i = 0; i < n; ++i) {
        cells->push_back(MariaCell(fields[i], row[i], lengths[i]));
      }
    }
  }

  void Finalize() {
    if (res_ != nullptr) {
      mysql_free_result(res_);
      res_ = nullptr;
    }
  }

  bool Valid() const { return res_ != nullptr; }

 private:
  MYSQL_RES* res_ = nullptr;
};

}  // namespace unidb
