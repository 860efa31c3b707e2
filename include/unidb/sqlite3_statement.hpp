// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding from unidb::Value
//   - Step() + ReadRow() collect cells in native storage classes; the
//     handle assembles them into a ColumnBatch

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "unidb/datetime.hpp"
#include "unidb/error.hpp"
#include "unidb/value.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// SQLite result code -> ErrorCode
// ---------------------------------------------------------------------------

inline ErrorCode MapSqliteResult(int32_t rc) {
  switch (rc & 0xFF) {
    case SQLITE_CONSTRAINT:
      return ErrorCode::kConstraintViolation;
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
    case SQLITE_AUTH:
    case SQLITE_PERM:
      return ErrorCode::kConnectionFailure;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CORRUPT:
    case SQLITE_READONLY:
    case SQLITE_NOMEM:
      return ErrorCode::kIoFailure;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_INTERRUPT:
      return ErrorCode::kTimeout;
    case SQLITE_RANGE:
    case SQLITE_MISMATCH:
    case SQLITE_TOOBIG:
      return ErrorCode::kInvalidParameter;
    default:
      // SQLITE_ERROR (syntax, missing table/column), SQLITE_MISUSE, ...
      return ErrorCode::kQueryFailure;
  }
}

inline Error SqliteError(sqlite3* db, int32_t rc) {
  int32_t code = (db != nullptr) ? sqlite3_extended_errcode(db) : rc;
  if ((code & 0xFF) != (rc & 0xFF)) { code = rc; }
  const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  return Error::Format(MapSqliteResult(code), "%s (sqlite %d)", msg, code);
}

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  /// Compile the first statement of `sql`; `*tail` points past it. A
  /// chunk holding only whitespace or comments yields an invalid statement
  /// and Ok.
  static Error Prepare(sqlite3* db, const char* sql, const char** tail,
                       Sqlite3Statement* out) {
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db, sql, -1, &stmt, tail);
    if (rc != SQLITE_OK) { return SqliteError(db, rc); }
    *out = Sqlite3Statement(db, stmt);
    return Error::Ok();
  }

  // --- Bind (1-based index) ---

  int32_t ParamCount() const {
    return (stmt_ != nullptr) ? sqlite3_bind_parameter_count(stmt_) : 0;
  }

  Error Bind(int32_t param, const Value& value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kQueryFailure, "Statement not initialized");
    }
    int32_t rc = SQLITE_OK;
    switch (value.type) {
      case ColumnType::kNull:
        rc = sqlite3_bind_null(stmt_, param);
        break;
      case ColumnType::kInt64:
      case ColumnType::kBool:
        rc = sqlite3_bind_int64(stmt_, param, value.i);
        break;
      case ColumnType::kFloat64:
        rc = sqlite3_bind_double(stmt_, param, value.f);
        break;
      case ColumnType::kText:
        rc = sqlite3_bind_text(stmt_, param, value.bytes.data(),
                               static_cast<int>(value.bytes.size()),
                               SQLITE_TRANSIENT);
        break;
      case ColumnType::kBinary:
        rc = sqlite3_bind_blob(stmt_, param, value.bytes.data(),
                               static_cast<int>(value.bytes.size()),
                               SQLITE_TRANSIENT);
        break;
      case ColumnType::kDate:
        rc = BindText(param, FormatDate(static_cast<int32_t>(value.i)));
        break;
      case ColumnType::kTimestamp:
        rc = BindText(param, FormatTimestamp(value.i));
        break;
    }
    if (rc != SQLITE_OK) { return SqliteError(db_, rc); }
    return Error::Ok();
  }

  // --- Step ---

  /// Advance one row. Sets *row to true when a row is available.
  Error Step(bool* row) {
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      *row = true;
      return Error::Ok();
    }
    *row = false;
    if (rc == SQLITE_DONE) { return Error::Ok(); }
    return SqliteError(db_, rc);
  }

  // --- Columns ---

  int32_t NumFields() const {
    return (stmt_ != nullptr) ? sqlite3_column_count(stmt_) : 0;
  }

  const char* FieldName(int32_t col) const {
    const char* name = sqlite3_column_name(stmt_, col);
    return (name != nullptr) ? name : "";
  }

  /// Declared column type, or "" for expressions.
  const char* FieldDeclType(int32_t col) const {
    const char* decl = sqlite3_column_decltype(stmt_, col);
    return (decl != nullptr) ? decl : "";
  }

  /// Append the current row's cells in their storage classes.
  void ReadRow(std::vector<Value>* cells) const {
    const int32_t n = NumFields();
    for (int32_t col = 0; col < n; ++col) {
      switch (sqlite3_column_type(stmt_, col)) {
        case SQLITE_INTEGER:
          cells->push_back(Value::Int64(sqlite3_column_int64(stmt_, col)));
          break;
        case SQLITE_FLOAT:
          cells->push_back(Value::Float64(sqlite3_column_double(stmt_, col)));
          break;
        case SQLITE_TEXT: {
          const char* text =
              reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
          int32_t len = sqlite3_column_bytes(stmt_, col);
          cells->push_back(Value::Text(std::string(text, static_cast<size_t>(len))));
          break;
        }
        case SQLITE_BLOB: {
          const char* blob =
              static_cast<const char*>(sqlite3_column_blob(stmt_, col));
          int32_t len = sqlite3_column_bytes(stmt_, col);
          cells->push_back(Value::Binary(
              (blob != nullptr) ? std::string(blob, static_cast<size_t>(len))
                                : std::string()));
          break;
        }
        default:
          cells->push_back(Value::Null());
          break;
      }
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

 private:
  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

  int32_t BindText(int32_t param, const std::string& text) {
    return sqlite3_bind_text(stmt_, param, text.data(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT);
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace unidb
