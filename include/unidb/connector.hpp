// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Connector / unidb::CrudConnector -- the connector contract.
//
// Design:
//   - Connector: basic execution (Tier 1), one implementation per backend
//   - CrudConnector: INSERT/SELECT/UPDATE/DELETE (Tier 2) built on Tier 1
//     through the query builder
//   - Open -> Closed only; every call after Close() fails with
//     AlreadyClosed before any driver access
//   - Errors returned as unidb::Error, results through out-pointers
//
// Usage:
//   std::unique_ptr<unidb::CrudConnector> conn;
//   unidb::Error err = unidb::Connect(unidb::ConnectionDescriptor::SqliteInMemory(), &conn);
//   unidb::ColumnBatch batch;
//   err = conn->Execute("SELECT 1 AS one", &batch);

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/log.hpp"
#include "unidb/query_builder.hpp"
#include "unidb/value.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// OperationOutcome
// ---------------------------------------------------------------------------

/// Result of a mutating operation. `message` is informational when
/// `succeeded` is true; failures travel as Error, never through here.
struct OperationOutcome {
  uint64_t rows_affected = 0;
  // Insert only: rows sent to the driver, the failing statement included.
  uint64_t rows_attempted = 0;
  bool succeeded = true;
  std::optional<std::string> message;

  static OperationOutcome Success(uint64_t rows) {
    OperationOutcome o;
    o.rows_affected = rows;
    return o;
  }

  /// Rows applied before a later statement of a sequence failed.
  static OperationOutcome Partial(uint64_t rows, std::string msg) {
    OperationOutcome o;
    o.rows_affected = rows;
    o.succeeded = false;
    o.message = std::move(msg);
    return o;
  }
};

// ---------------------------------------------------------------------------
// Connector -- Tier 1
// ---------------------------------------------------------------------------

class Connector {
 public:
  virtual ~Connector() = default;

  Connector(const Connector&) = delete;
  Connector& operator=(const Connector&) = delete;

  /// Run SQL and collect its result set (empty batch for statements
  /// without one).
  Error Execute(const std::string& sql, ColumnBatch* out) {
    return Execute(sql, std::vector<Value>{}, out);
  }

  virtual Error Execute(const std::string& sql,
                        const std::vector<Value>& params,
                        ColumnBatch* out) = 0;

  /// Run a mutating statement and report affected rows.
  virtual Error ExecuteMutation(const std::string& sql,
                                const std::vector<Value>& params,
                                OperationOutcome* out) = 0;

  /// Liveness check. Never fails; false when closed or unreachable.
  virtual bool IsAlive() = 0;

  /// Release every pooled handle. Closing twice succeeds.
  virtual Error Close() = 0;

  virtual bool IsClosed() const = 0;

  virtual Backend backend() const = 0;

  const Dialect& dialect() const { return DialectFor(backend()); }
  const char* name() const { return BackendName(backend()); }

 protected:
  Connector() = default;
};

// ---------------------------------------------------------------------------
// CrudConnector -- Tier 2
// ---------------------------------------------------------------------------

class CrudConnector : public Connector {
 public:
  /// Insert every row of the batch. On failure returns the error and fills
  /// `out` with rows_affected = rows applied by earlier statements (not
  /// rolled back) and rows_attempted = those plus the failing statement's.
  Error Insert(const InsertRequest& req, OperationOutcome* out) {
    *out = OperationOutcome::Success(0);
    if (IsClosed()) { return ClosedError(); }

    std::vector<SqlStatement> statements;
    Error err = BuildInsert(req, dialect(), &statements);
    if (!err.ok()) { return err; }

    uint64_t applied = 0;
    uint64_t attempted = 0;
    for (size_t i = 0; i < statements.size(); ++i) {
      OperationOutcome step;
      Log().debug("insert [{}/{}]: {}", i + 1, statements.size(),
                  statements[i].sql);
      attempted += statements[i].rows;
      err = ExecuteMutation(statements[i].sql, statements[i].params, &step);
      if (!err.ok()) {
        if (applied > 0) {
          Log().warn("insert into {} stopped after {} of {} rows: {}",
                     req.table, applied, req.batch.NumRows(), err.message);
        }
        *out = OperationOutcome::Partial(
            applied, "insert stopped after " + std::to_string(applied) +
                         " of " + std::to_string(attempted) +
                         " attempted rows: " + err.message);
        out->rows_attempted = attempted;
        return err;
      }
      applied += step.rows_affected;
    }
    *out = OperationOutcome::Success(applied);
    out->rows_attempted = attempted;
    return Error::Ok();
  }

  Error Select(const SelectRequest& req, ColumnBatch* out) {
    if (IsClosed()) { return ClosedError(); }
    std::string sql = BuildSelect(req, dialect());
    Log().debug("select: {}", sql);
    return Execute(sql, out);
  }

  Error Update(const UpdateRequest& req, OperationOutcome* out) {
    if (IsClosed()) { return ClosedError(); }
    std::string sql;
    Error err = BuildUpdate(req, dialect(), &sql);
    if (!err.ok()) { return err; }
    Log().debug("update: {}", sql);
    return ExecuteMutation(sql, std::vector<Value>{}, out);
  }

  Error Delete(const DeleteRequest& req, OperationOutcome* out) {
    if (IsClosed()) { return ClosedError(); }
    std::string sql = BuildDelete(req, dialect());
    Log().debug("delete: {}", sql);
    return ExecuteMutation(sql, std::vector<Value>{}, out);
  }

 protected:
  CrudConnector() = default;

  Error ClosedError() const {
    return Error::Format(ErrorCode::kAlreadyClosed, "%s connector is closed",
                         name());
  }
};

}  // namespace unidb
