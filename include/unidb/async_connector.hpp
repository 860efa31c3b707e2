// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::AsyncConnector -- future-returning facade over a CrudConnector.
//
// Design:
//   - Every call runs on its own std::async task and returns a future
//   - The connector's handle pool bounds how many run against the database
//   - Abandoning a future does not cancel its task; the task completes and
//     returns its handle to the pool
//   - Arguments are copied into the task

#pragma once

#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "unidb/column_batch.hpp"
#include "unidb/connector.hpp"
#include "unidb/error.hpp"
#include "unidb/query_builder.hpp"
#include "unidb/value.hpp"

namespace unidb {

struct BatchResult {
  Error error;
  ColumnBatch batch;
};

struct OutcomeResult {
  Error error;
  OperationOutcome outcome;
};

class AsyncConnector {
 public:
  explicit AsyncConnector(std::shared_ptr<CrudConnector> conn)
      : conn_(std::move(conn)) {}

  std::future<BatchResult> Execute(std::string sql,
                                   std::vector<Value> params = {}) {
    auto conn = conn_;
    return std::async(std::launch::async,
                      [conn, sql = std::move(sql), params = std::move(params)]() {
                        BatchResult r;
                        r.error = conn->Execute(sql, params, &r.batch);
                        return r;
                      });
  }

  std::future<OutcomeResult> ExecuteMutation(std::string sql,
                                             std::vector<Value> params = {}) {
    auto conn = conn_;
    return std::async(std::launch::async,
                      [conn, sql = std::move(sql), params = std::move(params)]() {
                        OutcomeResult r;
                        r.error = conn->ExecuteMutation(sql, params, &r.outcome);
                        return r;
                      });
  }

  std::future<OutcomeResult> Insert(InsertRequest req) {
    auto conn = conn_;
    return std::async(std::launch::async, [conn, req = std::move(req)]() {
      OutcomeResult r;
      r.error = conn->Insert(req, &r.outcome);
      return r;
    });
  }

  std::future<BatchResult> Select(SelectRequest req) {
    auto conn = conn_;
    return std::async(std::launch::async, [conn, req = std::move(req)]() {
      BatchResult r;
      r.error = conn->Select(req, &r.batch);
      return r;
    });
  }

  std::future<OutcomeResult> Update(UpdateRequest req) {
    auto conn = conn_;
    return std::async(std::launch::async, [conn, req = std::move(req)]() {
      OutcomeResult r;
      r.error = conn->Update(req, &r.outcome);
      return r;
    });
  }

  std::future<OutcomeResult> Delete(DeleteRequest req) {
    auto conn = conn_;
    return std::async(std::launch::async, [conn, req = std::move(req)]() {
      OutcomeResult r;
      r.error = conn->Delete(req, &r.outcome);
      return r;
    });
  }

  std::future<bool> IsAlive() {
    auto conn = conn_;
    return std::async(std::launch::async, [conn]() { return conn->IsAlive(); });
  }

  std::future<Error> Close() {
    auto conn = conn_;
    return std::async(std::launch::async, [conn]() { return conn->Close(); });
  }

  CrudConnector& connector() { return *conn_; }

 private:
  std::shared_ptr<CrudConnector> conn_;
};

}  // namespace unidb
