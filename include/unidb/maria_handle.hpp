// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MariaHandle -- one MariaDB/MySQL connection with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Connect/read/write timeouts from the descriptor's timeout
//   - CLIENT_FOUND_ROWS: UPDATE reports matched rows, like the other backends
//   - Text protocol (multi-statement) for SQL without parameters,
//     prepared statements otherwise
//   - A column holding a value that does not fit its mapped type is
//     returned as text, never as an error
//
// Integrated authentication connects as the OS user without a password
// (unix_socket / auth_gssapi plugins on the server side).

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include <mysql.h>

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/maria_query.hpp"
#include "unidb/maria_statement.hpp"
#include "unidb/type_map.hpp"
#include "unidb/value.hpp"

namespace unidb {

struct MariaParams {
  std::string host;
  uint16_t port = 3306;
  std::string database;
  std::string user;
  std::string password;
  bool has_password = false;
  std::string unix_socket;
  std::string charset = "utf8mb4";
  int32_t timeout_sec = 0;
  uint32_t pool_size = 1;
};

// ---------------------------------------------------------------------------
// MariaHandle
// ---------------------------------------------------------------------------

class MariaHandle {
 public:
  MariaHandle() = default;

  ~MariaHandle() { Close(); }

  // Move
  MariaHandle(MariaHandle&& other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  MariaHandle& operator=(MariaHandle&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  // No copy
  MariaHandle(const MariaHandle&) = delete;
  MariaHandle& operator=(const MariaHandle&) = delete;

  // --- Open / Close ---

  Error Open(const MariaParams& params) {
    Close();
    static const int kLibraryInit = mysql_library_init(0, nullptr, nullptr);
    if (kLibraryInit != 0) {
      return Error::Make(ErrorCode::kConnectionFailure,
                         "mysql_library_init failed");
    }

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kConnectionFailure, "mysql_init failed");
    }

    if (params.timeout_sec > 0) {
      unsigned int secs = static_cast<unsigned int>(params.timeout_sec);
      mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &secs);
      mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &secs);
      mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &secs);
    }
    mysql_options(conn_, MYSQL_SET_CHARSET_NAME, params.charset.c_str());

    const char* socket =
        params.unix_socket.empty() ? nullptr : params.unix_socket.c_str();
    const char* password = params.has_password ? params.password.c_str() : nullptr;
    const unsigned long flags = CLIENT_MULTI_STATEMENTS | CLIENT_FOUND_ROWS;
    if (mysql_real_connect(conn_, params.host.c_str(), params.user.c_str(),
                           password, params.database.c_str(), params.port,
                           socket, flags) == nullptr) {
      Error err = MariaError(conn_);
      if (err.code != ErrorCode::kConnectionFailure) {
        err = Error::Format(ErrorCode::kConnectionFailure, "%s", err.message);
      }
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const { return conn_ != nullptr; }

  bool IsUsable() const { return conn_ != nullptr && mysql_ping(conn_) == 0; }

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

  MYSQL* Handle() const { return conn_; }

 private:
  // Runs every statement; result-set metadata and cells of the last
  // statement that produced one are kept.
  Error Run(const std::string& sql, const std::vector<Value>& params,
            std::vector<std::string>* names, std::vector<ColumnType>* types,
            std::vector<Value>* cells, uint64_t* affected, bool* has_result) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kConnectionFailure, "Database not open");
    }
    *affected = 0;
    if (!params.empty()) {
      for (const Value& v : params) {
        Error err = CheckBindable(v, DialectFor(Backend::kMaria));
        if (!err.ok()) { return err; }
      }
      MariaStatement stmt;
      Error err = MariaStatement::Prepare(conn_, sql, &stmt);
      if (err.ok()) { err = stmt.BindAll(params); }
      if (err.ok()) { err = stmt.Execute(); }
      if (err.ok()) { err = stmt.FetchAll(names, types, cells); }
      if (!err.ok()) { return err; }
      *has_result = !names->empty();
      if (!*has_result) { *affected = stmt.AffectedRows(); }
      return Error::Ok();
    }

    if (mysql_real_query(conn_, sql.data(),
                         static_cast<unsigned long>(sql.size())) != 0) {
      return MariaError(conn_);
    }
    while (true) {
      MariaQuery res(mysql_store_result(conn_));
      if (res.Valid()) {
        names->clear();
        types->clear();
        cells->clear();
        res.Collect(names, types, cells);
        *has_result = true;
      } else if (mysql_field_count(conn_) != 0) {
        return MariaError(conn_);
      } else {
        *affected += static_cast<uint64_t>(mysql_affected_rows(conn_));
      }

      int status = mysql_next_result(conn_);
      if (status == -1) { break; }
      if (status > 0) { return MariaError(conn_); }
    }
    return Error::Ok();
  }

  MYSQL* conn_ = nullptr;
};

}  // namespace unidb
