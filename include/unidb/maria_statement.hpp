// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MariaStatement -- prepared statement for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - Bind() maps unidb::Value to MYSQL_BIND; storage lives in the
//     statement until it is finalized
//   - Results are bound as strings and grown on MYSQL_DATA_TRUNCATED

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <mysql.h>

#include "unidb/datetime.hpp"
#include "unidb/error.hpp"
#include "unidb/maria_query.hpp"
#include "unidb/value.hpp"

namespace unidb {

// my_bool on MariaDB Connector/C, bool on MySQL 8.
using MariaFlag = decltype(MYSQL_BIND::is_null_value);

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;

  ~MariaStatement() { Finalize(); }

  // Move
  MariaStatement(MariaStatement&& other) noexcept
      : stmt_(other.stmt_),
        binds_(std::move(other.binds_)),
        ints_(std::move(other.ints_)),
        doubles_(std::move(other.doubles_)),
        times_(std::move(other.times_)),
        lengths_(std::move(other.lengths_)) {
    other.stmt_ = nullptr;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      binds_ = std::move(other.binds_);
      ints_ = std::move(other.ints_);
      doubles_ = std::move(other.doubles_);
      times_ = std::move(other.times_);
      lengths_ = std::move(other.lengths_);
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  static Error Prepare(MYSQL* conn, const std::string& sql,
                       MariaStatement* out) {
    MYSQL_STMT* stmt = mysql_stmt_init(conn);
    if (stmt == nullptr) { return MariaError(conn); }
    if (mysql_stmt_prepare(stmt, sql.data(),
                           static_cast<unsigned long>(sql.size())) != 0) {
      Error err = MariaStmtError(stmt);
      mysql_stmt_close(stmt);
      return err;
    }
    MariaStatement s;
    s.stmt_ = stmt;
    *out = std::move(s);
    return Error::Ok();
  }

  uint32_t ParamCount() const {
    return static_cast<uint32_t>(mysql_stmt_param_count(stmt_));
  }

  // --- Bind ---

  /// Bind all parameters in order. Values must outlive Execute().
  Error BindAll(const std::vector<Value>& params) {
    const size_t n = params.size();
    if (n != ParamCount()) {
      return Error::Format(ErrorCode::kInvalidParameter,
                           "statement expects %u parameters, %zu given",
                           ParamCount(), n);
    }
    if (n == 0) { return Error::Ok(); }

    binds_.assign(n, MYSQL_BIND{});
    ints_.assign(n, 0);
    doubles_.assign(n, 0.0);
    times_.assign(n, MYSQL_TIME{});
    lengths_.assign(n, 0);

    for (size_t i = 0; i < n; ++i) {
      const Value& v = params[i];
      MYSQL_BIND& b = binds_[i];
      std::memset(&b, 0, sizeof(MYSQL_BIND));
      switch (v.type) {
        case ColumnType::kNull:
          b.buffer_type = MYSQL_TYPE_NULL;
          break;
        case ColumnType::kInt64:
          ints_[i] = v.i;
          b.buffer_type = MYSQL_TYPE_LONGLONG;
          b.buffer = &ints_[i];
          break;
        case ColumnType::kBool:
          ints_[i] = v.i != 0 ? 1 : 0;
          b.buffer_type = MYSQL_TYPE_LONGLONG;
          b.buffer = &ints_[i];
          break;
        case ColumnType::kFloat64:
          doubles_[i] = v.f;
          b.buffer_type = MYSQL_TYPE_DOUBLE;
          b.buffer = &doubles_[i];
          break;
        case ColumnType::kText:
        case ColumnType::kBinary:
          lengths_[i] = static_cast<unsigned long>(v.bytes.size());
          b.buffer_type = (v.type == ColumnType::kText) ? MYSQL_TYPE_STRING
                                                        : MYSQL_TYPE_BLOB;
          b.buffer = const_cast<char*>(v.bytes.data());
          b.buffer_length = lengths_[i];
          b.length = &lengths_[i];
          break;
        case ColumnType::kDate:
          FillTime(v.i * kMicrosPerDay, MYSQL_TIMESTAMP_DATE, &times_[i]);
          b.buffer_type = MYSQL_TYPE_DATE;
          b.buffer = &times_[i];
          break;
        case ColumnType::kTimestamp:
          FillTime(v.i, MYSQL_TIMESTAMP_DATETIME, &times_[i]);
          b.buffer_type = MYSQL_TYPE_DATETIME;
          b.buffer = &times_[i];
          break;
      }
    }

    if (mysql_stmt_bind_param(stmt_, binds_.data()) != 0) {
      return MariaStmtError(stmt_);
    }
    return Error::Ok();
  }

  // --- Execute ---

  Error Execute() {
    if (mysql_stmt_execute(stmt_) != 0) { return MariaStmtError(stmt_); }
    return Error::Ok();
  }

  uint64_t AffectedRows() const {
    return static_cast<uint64_t>(mysql_stmt_affected_rows(stmt_));
  }

  /// Fetch every row of the executed statement. No-op for statements
  /// without a result set.
  Error FetchAll(std::vector<std::string>* names,
                 std::vector<ColumnType>* types, std::vector<Value>* cells) {
    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_);
    if (meta == nullptr) {
      return (mysql_stmt_errno(stmt_) != 0) ? MariaStmtError(stmt_)
                                            : Error::Ok();
    }
    MariaQuery meta_guard(meta);
    const unsigned int n = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);
    for (unsigned int i = 0; i < n; ++i) {
      names->emplace_back(fields[i].name != nullptr ? fields[i].name : "");
      types->push_back(MariaFieldType(fields[i]));
    }

    if (mysql_stmt_store_result(stmt_) != 0) { return MariaStmtError(stmt_); }

    constexpr unsigned long kInitialBuffer = 256;
    std::vector<MYSQL_BIND> out(n);
    std::vector<std::string> buffers(n, std::string(kInitialBuffer, '\0'));
    std::vector<unsigned long> lengths(n, 0);
    std::unique_ptr<MariaFlag[]> nulls(new MariaFlag[n]());
    std::unique_ptr<MariaFlag[]> errors(new MariaFlag[n]());
    for (unsigned int i = 0; i < n; ++i) {
      std::memset(&out[i], 0, sizeof(MYSQL_BIND));
      out[i].buffer_type = MYSQL_TYPE_STRING;
      out[i].buffer = &buffers[i][0];
      out[i].buffer_length = kInitialBuffer;
      out[i].length = &lengths[i];
      out[i].is_null = &nulls[i];
      out[i].error = &errors[i];
    }
    if (mysql_stmt_bind_result(stmt_, out.data()) != 0) {
      return MariaStmtError(stmt_);
    }

    while (true) {
      int rc = mysql_stmt_fetch(stmt_);
      if (rc == MYSQL_NO_DATA) { break; }
      if (rc == 1) { return MariaStmtError(stmt_); }
      for (unsigned int i = 0; i < n; ++i) {
        if (nulls[i]) {
          cells->push_back(Value::Null());
          continue;
        }
        if (lengths[i] > out[i].buffer_length) {
          // MYSQL_DATA_TRUNCATED: fetch the whole value.
          std::string full(lengths[i], '\0');
          MYSQL_BIND col;
          std::memset(&col, 0, sizeof(MYSQL_BIND));
          col.buffer_type = MYSQL_TYPE_STRING;
          col.buffer = &full[0];
          col.buffer_length = lengths[i];
          if (mysql_stmt_fetch_column(stmt_, &col, i, 0) != 0) {
            return MariaStmtError(stmt_);
          }
          cells->push_back(MariaCell(fields[i], full.data(), lengths[i]));
        } else {
          cells->push_back(MariaCell(fields[i], buffers[i].data(), lengths[i]));
        }
      }
    }
    mysql_stmt_free_result(stmt_);
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
    binds_.clear();
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  static void FillTime(int64_t micros, enum_mysql_timestamp_type kind,
                       MYSQL_TIME* t) {
    std::memset(t, 0, sizeof(MYSQL_TIME));
    int64_t days = FloorDiv(micros, kMicrosPerDay);
    int64_t rem = micros - days * kMicrosPerDay;
    int64_t y = 0;
    uint32_t m = 0;
    uint32_t d = 0;
    CivilFromDays(days, &y, &m, &d);
    t->year = static_cast<unsigned int>(y);
    t->month = m;
    t->day = d;
    t->time_type = kind;
    if (kind == MYSQL_TIMESTAMP_DATETIME) {
      int64_t secs = rem / kMicrosPerSecond;
      t->hour = static_cast<unsigned int>(secs / 3600);
      t->minute = static_cast<unsigned int>((secs / 60) % 60);
      t->second = static_cast<unsigned int>(secs % 60);
      t->second_part = static_cast<unsigned long>(rem % kMicrosPerSecond);
    }
  }

  MYSQL_STMT* stmt_ = nullptr;
  std::vector<MYSQL_BIND> binds_;
  std::vector<long long> ints_;
  std::vector<double> doubles_;
  std::vector<MYSQL_TIME> times_;
  std::vector<unsigned long> lengths_;
};

}  // namespace unidb
