// Copyright (c) 2024 liudegui. MIT License.
// Tests for the BasicConnector<Backend> lifecycle, using a recording
// backend that counts every native call.

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "unidb/basic_connector.hpp"

using namespace unidb;

namespace {

struct Recorder {
  std::atomic<int> opens{0};
  std::atomic<int> pings{0};
  std::atomic<int> queries{0};
  std::atomic<int> execs{0};
  ErrorCode next_failure = ErrorCode::kOk;
  bool refuse_open = false;
  std::string last_sql;

  int NativeCalls() const { return opens + pings + queries + execs; }
  void Reset() {
    opens = 0;
    pings = 0;
    queries = 0;
    execs = 0;
    next_failure = ErrorCode::kOk;
    refuse_open = false;
    last_sql.clear();
  }
};

Recorder g_recorder;

struct RecordingParams {
  uint32_t pool_size = 2;
  int32_t timeout_sec = 1;
};

class RecordingHandle {
 public:
  Error Open(const RecordingParams&) {
    ++g_recorder.opens;
    if (g_recorder.refuse_open) {
      return Error::Make(ErrorCode::kConnectionFailure, "refused");
    }
    return Error::Ok();
  }
  bool IsUsable() const { return true; }

  Error Ping() {
    ++g_recorder.pings;
    return TakeFailure();
  }

  Error Query(const std::string& sql, const std::vector<Value>&,
              ColumnBatch* out) {
    ++g_recorder.queries;
    g_recorder.last_sql = sql;
    Error err = TakeFailure();
    if (!err.ok()) { return err; }
    Column column("one", ColumnType::kInt64);
    column.Append(Value::Int64(1));
    out->Clear();
    return out->AddColumn(std::move(column));
  }

  Error Exec(const std::string& sql, const std::vector<Value>& params,
             uint64_t* affected) {
    ++g_recorder.execs;
    g_recorder.last_sql = sql;
    Error err = TakeFailure();
    if (!err.ok()) { return err; }
    *affected = params.empty() ? 1 : params.size();
    return Error::Ok();
  }

 private:
  static Error TakeFailure() {
    ErrorCode code = g_recorder.next_failure;
    g_recorder.next_failure = ErrorCode::kOk;
    return (code == ErrorCode::kOk) ? Error::Ok()
                                    : Error::Make(code, "injected failure");
  }
};

struct RecordingBackend {
  using Handle = RecordingHandle;
  using Params = RecordingParams;
  static constexpr Backend kTag = Backend::kMaria;

  static Error MakeParams(const ConnectionDescriptor& d, Params* out) {
    out->timeout_sec = d.timeout_sec.value_or(1);
    return Error::Ok();
  }
  static std::string Describe(const Params&) { return "recording"; }
  static bool ShouldDiscard(const Params&, const Error& err) {
    return IsConnectionLevelError(err);
  }
};

using RecordingConnector = BasicConnector<RecordingBackend>;

std::unique_ptr<CrudConnector> OpenRecording() {
  g_recorder.Reset();
  std::unique_ptr<CrudConnector> conn;
  REQUIRE(RecordingConnector::Create(ConnectionDescriptor(), &conn).ok());
  REQUIRE(conn != nullptr);
  return conn;
}

}  // namespace

TEST_CASE("Connector: create opens and pings one handle", "[connector_state]") {
  auto conn = OpenRecording();
  REQUIRE(g_recorder.opens == 1);
  REQUIRE(g_recorder.pings == 1);
  REQUIRE_FALSE(conn->IsClosed());
  REQUIRE(conn->backend() == Backend::kMaria);
  REQUIRE(std::string(conn->name()) == "mariadb");
}

TEST_CASE("Connector: create fails fast with ConnectionFailure", "[connector_state]") {
  g_recorder.Reset();
  g_recorder.refuse_open = true;
  std::unique_ptr<CrudConnector> conn;
  REQUIRE(RecordingConnector::Create(ConnectionDescriptor(), &conn).code ==
          ErrorCode::kConnectionFailure);
  REQUIRE(conn == nullptr);

  g_recorder.Reset();
  g_recorder.next_failure = ErrorCode::kQueryFailure;
  REQUIRE(RecordingConnector::Create(ConnectionDescriptor(), &conn).code ==
          ErrorCode::kConnectionFailure);
}

TEST_CASE("Connector: close twice never errors", "[connector_state]") {
  auto conn = OpenRecording();
  REQUIRE(conn->Close().ok());
  REQUIRE(conn->IsClosed());
  REQUIRE(conn->Close().ok());
  REQUIRE(conn->IsClosed());
}

TEST_CASE("Connector: every call after close is AlreadyClosed without driver calls",
          "[connector_state]") {
  auto conn = OpenRecording();
  REQUIRE(conn->Close().ok());
  const int before = g_recorder.NativeCalls();

  ColumnBatch batch;
  OperationOutcome outcome;
  REQUIRE(conn->Execute("SELECT 1", &batch).code == ErrorCode::kAlreadyClosed);
  REQUIRE(conn->Execute("SELECT ?", {Value::Int64(1)}, &batch).code ==
          ErrorCode::kAlreadyClosed);
  REQUIRE(conn->ExecuteMutation("DELETE FROM t", {}, &outcome).code ==
          ErrorCode::kAlreadyClosed);

  InsertRequest ins;
  ins.table = "t";
  Column c("a", ColumnType::kInt64);
  c.Append(Value::Int64(1));
  REQUIRE(ins.batch.AddColumn(c).ok());
  REQUIRE(conn->Insert(ins, &outcome).code == ErrorCode::kAlreadyClosed);

  SelectRequest sel;
  sel.table = "t";
  REQUIRE(conn->Select(sel, &batch).code == ErrorCode::kAlreadyClosed);

  UpdateRequest upd;
  upd.table = "t";
  upd.values["a"] = Value::Int64(2);
  REQUIRE(conn->Update(upd, &outcome).code == ErrorCode::kAlreadyClosed);

  DeleteRequest del;
  del.table = "t";
  REQUIRE(conn->Delete(del, &outcome).code == ErrorCode::kAlreadyClosed);

  REQUIRE_FALSE(conn->IsAlive());
  REQUIRE(g_recorder.NativeCalls() == before);
}

TEST_CASE("Connector: operations reach the handle", "[connector_state]") {
  auto conn = OpenRecording();

  ColumnBatch batch;
  REQUIRE(conn->Execute("SELECT 1 AS one", &batch).ok());
  REQUIRE(batch.NumRows() == 1);
  REQUIRE(g_recorder.last_sql == "SELECT 1 AS one");

  OperationOutcome outcome;
  DeleteRequest del;
  del.table = "t";
  del.predicate = "a = 1";
  REQUIRE(conn->Delete(del, &outcome).ok());
  REQUIRE(outcome.succeeded);
  REQUIRE(outcome.rows_affected == 1);
  REQUIRE(g_recorder.last_sql == "DELETE FROM `t` WHERE a = 1");

  REQUIRE(conn->IsAlive());
}

TEST_CASE("Connector: query errors keep the handle, connection errors drop it",
          "[connector_state]") {
  auto conn = OpenRecording();
  auto* typed = static_cast<RecordingConnector*>(conn.get());
  REQUIRE(typed->pool().OpenCount() == 1);

  ColumnBatch batch;
  g_recorder.next_failure = ErrorCode::kQueryFailure;
  REQUIRE(conn->Execute("SELECT broken", &batch).code == ErrorCode::kQueryFailure);
  REQUIRE(typed->pool().OpenCount() == 1);

  g_recorder.next_failure = ErrorCode::kConnectionFailure;
  REQUIRE(conn->Execute("SELECT 1", &batch).code == ErrorCode::kConnectionFailure);
  REQUIRE(typed->pool().OpenCount() == 0);

  REQUIRE(conn->Execute("SELECT 1", &batch).ok());
  REQUIRE(g_recorder.opens == 2);
}

TEST_CASE("Connector: insert stops at the first failing statement",
          "[connector_state]") {
  auto conn = OpenRecording();

  InsertRequest ins;
  ins.table = "t";
  Column c("a", ColumnType::kInt64);
  for (int64_t i = 0; i < 3; ++i) { c.Append(Value::Int64(i)); }
  REQUIRE(ins.batch.AddColumn(c).ok());

  OperationOutcome outcome;
  REQUIRE(conn->Insert(ins, &outcome).ok());
  REQUIRE(outcome.succeeded);
  REQUIRE(outcome.rows_affected == 3);  // one multi-row statement
  REQUIRE(outcome.rows_attempted == 3);

  g_recorder.next_failure = ErrorCode::kConstraintViolation;
  REQUIRE(conn->Insert(ins, &outcome).code == ErrorCode::kConstraintViolation);
  REQUIRE_FALSE(outcome.succeeded);
  REQUIRE(outcome.rows_affected == 0);
  REQUIRE(outcome.rows_attempted == 3);
  REQUIRE(outcome.message.has_value());
  REQUIRE(outcome.message->find("0 of 3 attempted rows") != std::string::npos);
}
