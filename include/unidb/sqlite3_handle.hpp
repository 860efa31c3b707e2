// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Sqlite3Handle -- one SQLite3 connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Busy timeout plus a progress-handler deadline bound each operation
//   - Multi-statement SQL runs statement by statement; parameters are
//     consumed in order by each statement's placeholders
//   - Cells are assembled leniently: SQLite is dynamically typed, so a
//     column whose values do not fit its declared type becomes text

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/log.hpp"
#include "unidb/sqlite3_statement.hpp"
#include "unidb/type_map.hpp"
#include "unidb/value.hpp"

namespace unidb {

struct Sqlite3Params {
  std::string path;
  int32_t timeout_sec = 0;      // 0 = no deadline
  uint32_t pool_size = 1;
  std::string journal_mode;     // empty = engine default
  bool foreign_keys = true;
};

// ---------------------------------------------------------------------------
// Sqlite3Handle
// ---------------------------------------------------------------------------

class Sqlite3Handle {
 public:
  Sqlite3Handle() = default;

  ~Sqlite3Handle() { Close(); }

  // Move
  Sqlite3Handle(Sqlite3Handle&& other) noexcept
      : db_(other.db_), timeout_sec_(other.timeout_sec_) {
    other.db_ = nullptr;
  }

  Sqlite3Handle& operator=(Sqlite3Handle&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      timeout_sec_ = other.timeout_sec_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Handle(const Sqlite3Handle&) = delete;
  Sqlite3Handle& operator=(const Sqlite3Handle&) = delete;

  // --- Open / Close ---

  Error Open(const Sqlite3Params& params) {
    Close();
    const int32_t flags =
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
    int32_t rc = sqlite3_open_v2(params.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::Format(
          ErrorCode::kConnectionFailure, "cannot open '%s': %s",
          params.path.c_str(),
          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
      Close();
      return err;
    }
    sqlite3_extended_result_codes(db_, 1);

    timeout_sec_ = params.timeout_sec;
    if (timeout_sec_ > 0) {
      sqlite3_busy_timeout(db_, timeout_sec_ * 1000);
    }

    Error err;
    if (!params.journal_mode.empty()) {
      err = RunPragma("PRAGMA journal_mode=" + params.journal_mode);
    }
    if (err.ok()) {
      err = RunPragma(params.foreign_keys ? "PRAGMA foreign_keys=ON"
                                          : "PRAGMA foreign_keys=OFF");
    }
    if (!err.ok()) {
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  /// An embedded connection stays usable for as long as it is open.
  bool IsUsable() const { return db_ != nullptr; }

  Error Ping() {
    ColumnBatch unused;
    return Query("SELECT 1", std::vector<Value>{}, &unused);
  }

  // --- Execute ---

  /// Run `sql`; the batch holds the result of the last statement that
  /// produced columns.
  Error Query(const std::string& sql, const std::vector<Value>& params,
              ColumnBatch* out) {
    ColumnBatch batch;
    Error err = Run(sql, params, &batch);
    if (!err.ok()) { return err; }
    *out = std::move(batch);
    return Error::Ok();
  }

  /// Run `sql` and report rows changed by INSERT/UPDATE/DELETE.
  Error Exec(const std::string& sql, const std::vector<Value>& params,
             uint64_t* affected) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kConnectionFailure, "Database not open");
    }
    const int32_t before = sqlite3_total_changes(db_);
    Error err = Run(sql, params, nullptr);
    if (!err.ok()) { return err; }
    *affected = static_cast<uint64_t>(sqlite3_total_changes(db_) - before);
    return Error::Ok();
  }

  sqlite3* Handle() const { return db_; }

 private:
  using Clock = std::chrono::steady_clock;

  static int ProgressCallback(void* ctx) {
    const auto* deadline = static_cast<const Clock::time_point*>(ctx);
    return (Clock::now() > *deadline) ? 1 : 0;
  }

  Error RunPragma(const std::string& sql) {
    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) { return Error::Ok(); }
    Error err = Error::Format(MapSqliteResult(rc), "%s: %s", sql.c_str(),
                              errmsg ? errmsg : sqlite3_errmsg(db_));
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return err;
  }

  Error Run(const std::string& sql, const std::vector<Value>& params,
            ColumnBatch* out) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kConnectionFailure, "Database not open");
    }

    Clock::time_point deadline;
    if (timeout_sec_ > 0) {
      deadline = Clock::now() + std::chrono::seconds(timeout_sec_);
      sqlite3_progress_handler(db_, 1000, &Sqlite3Handle::ProgressCallback,
                               &deadline);
    }
    Error err = RunStatements(sql, params, out);
    if (timeout_sec_ > 0) {
      sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }
    if (err.code == ErrorCode::kTimeout) {
      Log().debug("sqlite operation gave up after {} s: {}", timeout_sec_,
                  err.message);
    }
    return err;
  }

  Error RunStatements(const std::string& sql, const std::vector<Value>& params,
                      ColumnBatch* out) {
    size_t next_param = 0;
    const char* cursor = sql.c_str();
    while (cursor != nullptr && *cursor != '\0') {
      Sqlite3Statement stmt;
      const char* tail = nullptr;
      Error err = Sqlite3Statement::Prepare(db_, cursor, &tail, &stmt);
      if (!err.ok()) { return err; }
      cursor = tail;
      if (!stmt.Valid()) { continue; }  // whitespace or comment

      const int32_t count = stmt.ParamCount();
      if (next_param + static_cast<size_t>(count) > params.size()) {
        return Error::Format(ErrorCode::kInvalidParameter,
                             "statement expects %d more parameters, %zu given",
                             count, params.size() - next_param);
      }
      for (int32_t i = 1; i <= count; ++i) {
        const Value& v = params[next_param++];
        err = CheckBindable(v, DialectFor(Backend::kSqlite));
        if (err.ok()) { err = stmt.Bind(i, v); }
        if (!err.ok()) { return err; }
      }

      err = Drain(&stmt, out);
      if (!err.ok()) { return err; }
    }

    if (next_param != params.size()) {
      return Error::Format(ErrorCode::kInvalidParameter,
                           "%zu parameters given, %zu used", params.size(),
                           next_param);
    }
    return Error::Ok();
  }

  Error Drain(Sqlite3Statement* stmt, ColumnBatch* out) {
    const int32_t num_fields = stmt->NumFields();
    std::vector<Value> cells;
    bool row = false;
    Error err = stmt->Step(&row);
    while (err.ok() && row) {
      if (out != nullptr) { stmt->ReadRow(&cells); }
      err = stmt->Step(&row);
    }
    if (!err.ok() || out == nullptr || num_fields == 0) { return err; }

    std::vector<std::string> names;
    std::vector<ColumnType> types;
    names.reserve(static_cast<size_t>(num_fields));
    types.reserve(static_cast<size_t>(num_fields));
    for (int32_t col = 0; col < num_fields; ++col) {
      names.emplace_back(stmt->FieldName(col));
      std::string decl = stmt->FieldDeclType(col);
      ColumnType type = decl.empty()
          ? InferColumnType(cells, static_cast<size_t>(num_fields),
                            static_cast<size_t>(col))
          : MapNativeType(Backend::kSqlite, decl);
      types.push_back(type);
    }
    return AssembleBatch(names, types, cells, CellPolicy::kDemoteToText, out);
  }

  sqlite3* db_ = nullptr;
  int32_t timeout_sec_ = 0;
};

}  // namespace unidb
