// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MssqlHandle -- one SQL Server connection over ODBC with RAII.
//
// Design:
//   - Owns its SQLHENV (ODBC 3) and SQLHDBC
//   - Move-only (no copy)
//   - SQLDriverConnect with a connection string built from MssqlParams;
//     integrated authentication uses Trusted_Connection=yes
//   - Login and query timeouts from the descriptor's timeout
//   - Unconvertible columns fall back to text, like MariaHandle

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <sql.h>
#include <sqlext.h>

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/mssql_statement.hpp"
#include "unidb/type_map.hpp"
#include "unidb/value.hpp"

namespace unidb {

struct MssqlParams {
  std::string driver = "ODBC Driver 18 for SQL Server";
  std::string server;
  uint16_t port = 1433;
  std::string database;
  std::string user;
  std::string password;
  bool integrated = false;
  /// Extra ODBC keywords (Encrypt, TrustServerCertificate, ...).
  std::map<std::string, std::string> keywords;
  int32_t timeout_sec = 0;
  uint32_t pool_size = 1;
};

/// Quote an ODBC connection-string value when it contains ; { } or
/// surrounding spaces. Braces close with '}' doubled.
inline std::string OdbcValue(const std::string& value) {
  bool plain = value.find_first_of(";{}") == std::string::npos &&
               (value.empty() || (value.front() != ' ' && value.back() != ' '));
  if (plain) { return value; }
  std::string out = "{";
  for (char c : value) {
    out.push_back(c);
    if (c == '}') { out.push_back('}'); }
  }
  out.push_back('}');
  return out;
}

inline std::string MssqlConnectionString(const MssqlParams& p) {
  std::string s;
  s += "Driver={" + p.driver + "};";
  s += "Server=" + OdbcValue(p.server + "," + std::to_string(p.port)) + ";";
  s += "Database=" + OdbcValue(p.database) + ";";
  if (p.integrated) {
    s += "Trusted_Connection=yes;";
  } else {
    s += "UID=" + OdbcValue(p.user) + ";";
    s += "PWD=" + OdbcValue(p.password) + ";";
  }
  for (const auto& kv : p.keywords) {
    s += kv.first + "=" + OdbcValue(kv.second) + ";";
  }
  return s;
}

// ---------------------------------------------------------------------------
// MssqlHandle
// ---------------------------------------------------------------------------

class MssqlHandle {
 public:
  MssqlHandle() = default;

  ~MssqlHandle() { Close(); }

  // Move
  MssqlHandle(MssqlHandle&& other) noexcept
      : env_(other.env_), dbc_(other.dbc_), connected_(other.connected_),
        timeout_sec_(other.timeout_sec_) {
    other.env_ = SQL_NULL_HENV;
    other.dbc_ = SQL_NULL_HDBC;
    other.connected_ = false;
  }

  MssqlHandle& operator=(MssqlHandle&& other) noexcept {
    if (this != &other) {
      Close();
      env_ = other.env_;
      dbc_ = other.dbc_;
      connected_ = other.connected_;
      timeout_sec_ = other.timeout_sec_;
      other.env_ = SQL_NULL_HENV;
      other.dbc_ = SQL_NULL_HDBC;
      other.connected_ = false;
    }
    return *this;
  }

  // No copy
  MssqlHandle(const MssqlHandle&) = delete;
  MssqlHandle& operator=(const MssqlHandle&) = delete;

  // --- Open / Close ---

  Error Open(const MssqlParams& params) {
    Close();
    timeout_sec_ = params.timeout_sec;

    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_))) {
      env_ = SQL_NULL_HENV;
      return Error::Make(ErrorCode::kConnectionFailure,
                         "SQLAllocHandle(ENV) failed");
    }
    SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                  reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);

    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_))) {
      Error err = OdbcError(SQL_HANDLE_ENV, env_, "SQLAllocHandle(DBC)");
      Close();
      return Error::Format(ErrorCode::kConnectionFailure, "%s", err.message);
    }
    if (params.timeout_sec > 0) {
      SQLPOINTER secs = reinterpret_cast<SQLPOINTER>(
          static_cast<uintptr_t>(params.timeout_sec));
      SQLSetConnectAttr(dbc_, SQL_ATTR_LOGIN_TIMEOUT, secs, SQL_IS_UINTEGER);
      SQLSetConnectAttr(dbc_, SQL_ATTR_CONNECTION_TIMEOUT, secs,
                        SQL_IS_UINTEGER);
    }

    std::string conn_str = MssqlConnectionString(params);
    SQLCHAR out_str[1024] = {};
    SQLSMALLINT out_len = 0;
    SQLRETURN rc = SQLDriverConnect(
        dbc_, nullptr, reinterpret_cast<SQLCHAR*>(&conn_str[0]),
        static_cast<SQLSMALLINT>(conn_str.size()), out_str, sizeof(out_str),
        &out_len, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(rc)) {
      Error err = OdbcError(SQL_HANDLE_DBC, dbc_, "SQLDriverConnect");
      Close();
      if (err.code != ErrorCode::kConnectionFailure) {
        err = Error::Format(ErrorCode::kConnectionFailure, "%s", err.message);
      }
      return err;
    }
    connected_ = true;
    return Error::Ok();
  }

  void Close() {
    if (dbc_ != SQL_NULL_HDBC) {
      if (connected_) { SQLDisconnect(dbc_); }
      SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
      dbc_ = SQL_NULL_HDBC;
    }
    if (env_ != SQL_NULL_HENV) {
      SQLFreeHandle(SQL_HANDLE_ENV, env_);
      env_ = SQL_NULL_HENV;
    }
    connected_ = false;
  }

  bool IsOpen() const { return connected_; }

  bool IsUsable() const {
    if (!connected_) { return false; }
    SQLUINTEGER dead = SQL_CD_TRUE;
    SQLRETURN rc = SQLGetConnectAttr(dbc_, SQL_ATTR_CONNECTION_DEAD, &dead,
                                     SQL_IS_UINTEGER, nullptr);
    return SQL_SUCCEEDED(rc) && dead == SQL_CD_FALSE;
  }

  Error Ping() {
    ColumnBatch unused;
    return Query("SELECT 1", std::vector<Value>{}, &unused);
  }

  // --- Execute ---

  Error Query(const std::string& sql, const std::vector<Value>& params,
              ColumnBatch* out) {
    std::vector<std::string> names;
    std::vector<ColumnType> types;
    std::vector<Value> cells;
    uint64_t affected = 0;
    bool has_result = false;
    Error err = Run(sql, params, &names, &types, &cells, &affected, &has_result);
    if (!err.ok()) { return err; }
    if (!has_result) {
      out->Clear();
      return Error::Ok();
    }
    return AssembleBatch(names, types, cells, CellPolicy::kDemoteToText, out);
  }

  Error Exec(const std::string& sql, const std::vector<Value>& params,
             uint64_t* affected) {
    std::vector<std::string> names;
    std::vector<ColumnType> types;
    std::vector<Value> cells;
    bool has_result = false;
    return Run(sql, params, &names, &types, &cells, affected, &has_result);
  }

  SQLHDBC Handle() const { return dbc_; }

 private:
  Error Run(const std::string& sql, const std::vector<Value>& params,
            std::vector<std::string>* names, std::vector<ColumnType>* types,
            std::vector<Value>* cells, uint64_t* affected, bool* has_result) {
    if (!connected_) {
      return Error::Make(ErrorCode::kConnectionFailure, "Database not open");
    }
    for (const Value& v : params) {
      Error err = CheckBindable(v, DialectFor(Backend::kMssql));
      if (!err.ok()) { return err; }
    }
    MssqlStatement stmt;
    Error err = MssqlStatement::Allocate(dbc_, timeout_sec_, &stmt);
    if (err.ok()) { err = stmt.Execute(sql, params); }
    if (err.ok()) { err = stmt.Collect(names, types, cells, affected, has_result); }
    return err;
  }

  SQLHENV env_ = SQL_NULL_HENV;
  SQLHDBC dbc_ = SQL_NULL_HDBC;
  bool connected_ = false;
  int32_t timeout_sec_ = 0;
};

}  // namespace unidb
