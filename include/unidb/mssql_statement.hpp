// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MssqlStatement -- ODBC statement handle for SQL Server.
//
// Design:
//   - Wraps SQLHSTMT with RAII
//   - Move-only (no copy)
//   - SQLBindParameter for every Value type; buffers live in the statement
//     until it is freed
//   - Results read column by column with SQLGetData, in chunks, as text or
//     bytes; SQL_DESC_TYPE_NAME drives the column type
//   - SQL text, column names and text values cross the driver as UTF-16
//     (the W entry points and SQL_C_WCHAR), never through the locale

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqlucode.h>

#include "unidb/config.hpp"
#include "unidb/datetime.hpp"
#include "unidb/error.hpp"
#include "unidb/native_errors.hpp"
#include "unidb/type_map.hpp"
#include "unidb/utf16.hpp"
#include "unidb/value.hpp"

namespace unidb {

static_assert(sizeof(SQLWCHAR) == sizeof(char16_t), "SQLWCHAR must be UTF-16");

/// UTF-8 -> NUL-terminated SQLWCHAR buffer.
inline Error ToSqlWide(const std::string& in, const char* what,
                       std::vector<SQLWCHAR>* out) {
  std::u16string wide;
  if (!Utf8ToUtf16(in, &wide)) {
    return Error::Format(ErrorCode::kInvalidParameter, "%s is not valid UTF-8",
                         what);
  }
  out->assign(wide.begin(), wide.end());
  out->push_back(0);
  return Error::Ok();
}

inline std::string FromSqlWide(const SQLWCHAR* data, size_t units) {
  std::u16string wide(data, data + units);
  return Utf16ToUtf8(wide);
}

/// First diagnostic record of an ODBC handle as a unidb::Error.
inline Error OdbcError(SQLSMALLINT handle_type, SQLHANDLE handle,
                       const char* what) {
  SQLCHAR state[6] = {};
  SQLINTEGER native = 0;
  SQLCHAR msg[SQL_MAX_MESSAGE_LENGTH] = {};
  SQLSMALLINT len = 0;
  SQLRETURN rc = SQLGetDiagRec(handle_type, handle, 1, state, &native, msg,
                               sizeof(msg), &len);
  if (!SQL_SUCCEEDED(rc)) {
    return Error::Format(ErrorCode::kQueryFailure, "%s failed", what);
  }
  const char* sqlstate = reinterpret_cast<const char*>(state);
  return Error::Format(MapOdbcSqlState(sqlstate), "%s (sqlstate %s, native %d)",
                       reinterpret_cast<const char*>(msg), sqlstate,
                       static_cast<int>(native));
}

// ---------------------------------------------------------------------------
// MssqlStatement
// ---------------------------------------------------------------------------

class MssqlStatement {
 public:
  MssqlStatement() = default;

  ~MssqlStatement() { Finalize(); }

  // Move
  MssqlStatement(MssqlStatement&& other) noexcept
      : stmt_(other.stmt_),
        ints_(std::move(other.ints_)),
        doubles_(std::move(other.doubles_)),
        bits_(std::move(other.bits_)),
        dates_(std::move(other.dates_)),
        stamps_(std::move(other.stamps_)),
        wide_(std::move(other.wide_)),
        indicators_(std::move(other.indicators_)),
        no_data_(other.no_data_) {
    other.stmt_ = SQL_NULL_HSTMT;
  }

  MssqlStatement& operator=(MssqlStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      ints_ = std::move(other.ints_);
      doubles_ = std::move(other.doubles_);
      bits_ = std::move(other.bits_);
      dates_ = std::move(other.dates_);
      stamps_ = std::move(other.stamps_);
      wide_ = std::move(other.wide_);
      indicators_ = std::move(other.indicators_);
      no_data_ = other.no_data_;
      other.stmt_ = SQL_NULL_HSTMT;
    }
    return *this;
  }

  // No copy
  MssqlStatement(const MssqlStatement&) = delete;
  MssqlStatement& operator=(const MssqlStatement&) = delete;

  static Error Allocate(SQLHDBC dbc, int32_t timeout_sec, MssqlStatement* out) {
    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt))) {
      return OdbcError(SQL_HANDLE_DBC, dbc, "SQLAllocHandle(STMT)");
    }
    MssqlStatement s;
    s.stmt_ = stmt;
    if (timeout_sec > 0) {
      SQLSetStmtAttr(stmt, SQL_ATTR_QUERY_TIMEOUT,
                     reinterpret_cast<SQLPOINTER>(static_cast<uintptr_t>(timeout_sec)),
                     SQL_IS_UINTEGER);
    }
    *out = std::move(s);
    return Error::Ok();
  }

  // --- Execute ---

  /// Execute `sql`, binding `params` to its ? placeholders in order.
  Error Execute(const std::string& sql, const std::vector<Value>& params) {
    std::vector<SQLWCHAR> text;
    Error err = ToSqlWide(sql, "SQL text", &text);
    if (!err.ok()) { return err; }
    SQLRETURN rc;
    if (params.empty()) {
      rc = SQLExecDirectW(stmt_, text.data(), SQL_NTS);
    } else {
      rc = SQLPrepareW(stmt_, text.data(), SQL_NTS);
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLPrepare"); }
      err = BindAll(params);
      if (!err.ok()) { return err; }
      rc = SQLExecute(stmt_);
    }
    // UPDATE/DELETE matching nothing report SQL_NO_DATA.
    if (!SQL_SUCCEEDED(rc) && rc != SQL_NO_DATA) { return Diag("SQLExecute"); }
    no_data_ = (rc == SQL_NO_DATA);
    return Error::Ok();
  }

  /// Walk every result of the executed batch. Keeps the last result set
  /// and sums row counts of the statements without one.
  Error Collect(std::vector<std::string>* names, std::vector<ColumnType>* types,
                std::vector<Value>* cells, uint64_t* affected,
                bool* has_result) {
    *affected = 0;
    *has_result = false;
    if (no_data_) { return Error::Ok(); }
    while (true) {
      SQLSMALLINT num_cols = 0;
      if (!SQL_SUCCEEDED(SQLNumResultCols(stmt_, &num_cols))) {
        return Diag("SQLNumResultCols");
      }
      if (num_cols > 0) {
        names->clear();
        types->clear();
        cells->clear();
        Error err = ReadResult(num_cols, names, types, cells);
        if (!err.ok()) { return err; }
        *has_result = true;
      } else {
        SQLLEN count = 0;
        if (SQL_SUCCEEDED(SQLRowCount(stmt_, &count)) && count > 0) {
          *affected += static_cast<uint64_t>(count);
        }
      }

      SQLRETURN rc = SQLMoreResults(stmt_);
      if (rc == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLMoreResults"); }
    }
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != SQL_NULL_HSTMT) {
      SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
      stmt_ = SQL_NULL_HSTMT;
    }
  }

  bool Valid() const { return stmt_ != SQL_NULL_HSTMT; }

 private:
  // VARBINARY beyond this many bytes, NVARCHAR beyond this many UTF-16
  // units, need the LONG variants.
  static constexpr SQLULEN kMaxInlineSize = 8000;
  static constexpr SQLULEN kMaxInlineChars = 4000;

  Error Diag(const char* what) const {
    return OdbcError(SQL_HANDLE_STMT, stmt_, what);
  }

  Error BindAll(const std::vector<Value>& params) {
    const size_t n = params.size();
    ints_.assign(n, 0);
    doubles_.assign(n, 0.0);
    bits_.assign(n, 0);
    dates_.assign(n, SQL_DATE_STRUCT{});
    stamps_.assign(n, SQL_TIMESTAMP_STRUCT{});
    wide_.assign(n, std::vector<SQLWCHAR>());
    indicators_.assign(n, 0);

    for (size_t i = 0; i < n; ++i) {
      const Value& v = params[i];
      const SQLUSMALLINT index = static_cast<SQLUSMALLINT>(i + 1);
      SQLLEN* ind = &indicators_[i];
      SQLRETURN rc = SQL_SUCCESS;
      switch (v.type) {
        case ColumnType::kNull:
          *ind = SQL_NULL_DATA;
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_CHAR,
                                SQL_VARCHAR, 1, 0, nullptr, 0, ind);
          break;
        case ColumnType::kInt64:
          ints_[i] = static_cast<SQLBIGINT>(v.i);
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_SBIGINT,
                                SQL_BIGINT, 0, 0, &ints_[i], 0, ind);
          break;
        case ColumnType::kFloat64:
          doubles_[i] = v.f;
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_DOUBLE,
                                SQL_DOUBLE, 0, 0, &doubles_[i], 0, ind);
          break;
        case ColumnType::kBool:
          bits_[i] = (v.i != 0) ? 1 : 0;
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_BIT,
                                SQL_BIT, 1, 0, &bits_[i], 0, ind);
          break;
        case ColumnType::kText: {
          std::vector<SQLWCHAR>& wide = wide_[i];
          Error err = ToSqlWide(v.bytes, "text parameter", &wide);
          if (!err.ok()) { return err; }
          const SQLULEN units = wide.size() - 1;
          const SQLULEN size = units == 0 ? 1 : units;
          const SQLLEN bytes = static_cast<SQLLEN>(units * sizeof(SQLWCHAR));
          *ind = bytes;
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_WCHAR,
                                size > kMaxInlineChars ? SQL_WLONGVARCHAR
                                                       : SQL_WVARCHAR,
                                size, 0, wide.data(), bytes, ind);
          break;
        }
        case ColumnType::kBinary: {
          const SQLULEN size = v.bytes.empty() ? 1 : v.bytes.size();
          *ind = static_cast<SQLLEN>(v.bytes.size());
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_BINARY,
                                size > kMaxInlineSize ? SQL_LONGVARBINARY
                                                      : SQL_VARBINARY,
                                size, 0, const_cast<char*>(v.bytes.data()),
                                static_cast<SQLLEN>(v.bytes.size()), ind);
          break;
        }
        case ColumnType::kDate: {
          int64_t y = 0;
          uint32_t m = 0;
          uint32_t d = 0;
          CivilFromDays(v.i, &y, &m, &d);
          dates_[i].year = static_cast<SQLSMALLINT>(y);
          dates_[i].month = static_cast<SQLUSMALLINT>(m);
          dates_[i].day = static_cast<SQLUSMALLINT>(d);
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT, SQL_C_TYPE_DATE,
                                SQL_TYPE_DATE, 10, 0, &dates_[i], 0, ind);
          break;
        }
        case ColumnType::kTimestamp: {
          const int64_t days = FloorDiv(v.i, kMicrosPerDay);
          const int64_t rem = v.i - days * kMicrosPerDay;
          const int64_t secs = rem / kMicrosPerSecond;
          int64_t y = 0;
          uint32_t m = 0;
          uint32_t d = 0;
          CivilFromDays(days, &y, &m, &d);
          SQL_TIMESTAMP_STRUCT& ts = stamps_[i];
          ts.year = static_cast<SQLSMALLINT>(y);
          ts.month = static_cast<SQLUSMALLINT>(m);
          ts.day = static_cast<SQLUSMALLINT>(d);
          ts.hour = static_cast<SQLUSMALLINT>(secs / 3600);
          ts.minute = static_cast<SQLUSMALLINT>((secs / 60) % 60);
          ts.second = static_cast<SQLUSMALLINT>(secs % 60);
          ts.fraction = static_cast<SQLUINTEGER>((rem % kMicrosPerSecond) * 1000);
          rc = SQLBindParameter(stmt_, index, SQL_PARAM_INPUT,
                                SQL_C_TYPE_TIMESTAMP, SQL_TYPE_TIMESTAMP, 27,
                                7, &ts, 0, ind);
          break;
        }
      }
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLBindParameter"); }
    }
    return Error::Ok();
  }

  Error ReadResult(SQLSMALLINT num_cols, std::vector<std::string>* names,
                   std::vector<ColumnType>* types, std::vector<Value>* cells) {
    std::vector<bool> binary(static_cast<size_t>(num_cols), false);
    for (SQLUSMALLINT col = 1; col <= static_cast<SQLUSMALLINT>(num_cols); ++col) {
      SQLWCHAR name[256] = {};
      SQLSMALLINT name_len = 0;
      SQLSMALLINT sql_type = 0;
      SQLULEN col_size = 0;
      SQLSMALLINT digits = 0;
      SQLSMALLINT nullable = 0;
      if (!SQL_SUCCEEDED(SQLDescribeColW(stmt_, col, name, 256, &name_len,
                                         &sql_type, &col_size, &digits,
                                         &nullable))) {
        return Diag("SQLDescribeCol");
      }
      char type_name[128] = {};
      SQLSMALLINT type_len = 0;
      SQLColAttribute(stmt_, col, SQL_DESC_TYPE_NAME, type_name,
                      sizeof(type_name), &type_len, nullptr);

      const size_t units = name_len < 0 ? 0 : std::min<size_t>(name_len, 255);
      names->push_back(FromSqlWide(name, units));
      ColumnType type = MapNativeType(Backend::kMssql, type_name);
      types->push_back(type);
      binary[col - 1] = (type == ColumnType::kBinary) ||
                        sql_type == SQL_BINARY || sql_type == SQL_VARBINARY ||
                        sql_type == SQL_LONGVARBINARY;
    }

    while (true) {
      SQLRETURN rc = SQLFetch(stmt_);
      if (rc == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLFetch"); }
      for (SQLUSMALLINT col = 1; col <= static_cast<SQLUSMALLINT>(num_cols); ++col) {
        Value cell;
        Error err = ReadCell(col, binary[col - 1], &cell);
        if (!err.ok()) { return err; }
        cells->push_back(std::move(cell));
      }
    }
    return Error::Ok();
  }

  Error ReadCell(SQLUSMALLINT col, bool binary, Value* out) {
    return binary ? ReadBytes(col, out) : ReadText(col, out);
  }

  Error ReadBytes(SQLUSMALLINT col, Value* out) {
    char buf[4096];
    std::string data;
    while (true) {
      SQLLEN ind = 0;
      SQLRETURN rc = SQLGetData(stmt_, col, SQL_C_BINARY, buf, sizeof(buf), &ind);
      if (rc == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLGetData"); }
      if (ind == SQL_NULL_DATA) {
        *out = Value::Null();
        return Error::Ok();
      }
      size_t got = (ind == SQL_NO_TOTAL || ind > static_cast<SQLLEN>(sizeof(buf)))
                       ? sizeof(buf)
                       : static_cast<size_t>(ind);
      data.append(buf, got);
      if (rc == SQL_SUCCESS) { break; }
    }
    *out = Value::Binary(std::move(data));
    return Error::Ok();
  }

  // Chunks may split a surrogate pair, so units are gathered before the
  // UTF-8 conversion.
  Error ReadText(SQLUSMALLINT col, Value* out) {
    SQLWCHAR buf[2048];
    const size_t chunk_units = sizeof(buf) / sizeof(SQLWCHAR) - 1;
    std::vector<SQLWCHAR> data;
    while (true) {
      SQLLEN ind = 0;
      SQLRETURN rc = SQLGetData(stmt_, col, SQL_C_WCHAR, buf, sizeof(buf), &ind);
      if (rc == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(rc)) { return Diag("SQLGetData"); }
      if (ind == SQL_NULL_DATA) {
        *out = Value::Null();
        return Error::Ok();
      }
      size_t got = chunk_units;
      if (ind != SQL_NO_TOTAL &&
          static_cast<size_t>(ind) / sizeof(SQLWCHAR) < chunk_units) {
        got = static_cast<size_t>(ind) / sizeof(SQLWCHAR);
      }
      data.insert(data.end(), buf, buf + got);
      if (rc == SQL_SUCCESS) { break; }
    }
    *out = Value::Text(FromSqlWide(data.data(), data.size()));
    return Error::Ok();
  }

  SQLHSTMT stmt_ = SQL_NULL_HSTMT;
  std::vector<SQLBIGINT> ints_;
  std::vector<double> doubles_;
  std::vector<unsigned char> bits_;
  std::vector<SQL_DATE_STRUCT> dates_;
  std::vector<SQL_TIMESTAMP_STRUCT> stamps_;
  std::vector<std::vector<SQLWCHAR>> wide_;
  std::vector<SQLLEN> indicators_;
  bool no_data_ = false;
};

}  // namespace unidb
