// Copyright (c) 2024 liudegui. MIT License.
// Tests for unidb::AsyncConnector over an in-memory SQLite connector.

#include <catch2/catch_test_macros.hpp>
#include <future>
#include <memory>
#include <vector>

#include "unidb/async_connector.hpp"
#include "unidb/factory.hpp"

using namespace unidb;

namespace {

AsyncConnector OpenAsync() {
  std::unique_ptr<CrudConnector> conn;
  REQUIRE(Connect(ConnectionDescriptor::SqliteInMemory(), &conn).ok());
  return AsyncConnector(std::shared_ptr<CrudConnector>(std::move(conn)));
}

}  // namespace

TEST_CASE("AsyncConnector: CRUD through futures", "[async_connector]") {
  AsyncConnector conn = OpenAsync();
  BatchResult created = conn.Execute("CREATE TABLE t(id INTEGER, tag TEXT)").get();
  REQUIRE(created.error.ok());

  InsertRequest ins;
  ins.table = "t";
  Column id;
  Column tag;
  REQUIRE(Column::FromValues("id", ColumnType::kInt64,
                             {Value::Int64(1), Value::Int64(2)}, &id).ok());
  REQUIRE(Column::FromValues("tag", ColumnType::kText,
                             {Value::Text("a"), Value::Text("b")}, &tag).ok());
  REQUIRE(ins.batch.AddColumn(id).ok());
  REQUIRE(ins.batch.AddColumn(tag).ok());

  OutcomeResult inserted = conn.Insert(ins).get();
  REQUIRE(inserted.error.ok());
  REQUIRE(inserted.outcome.rows_affected == 2);

  UpdateRequest upd;
  upd.table = "t";
  upd.values["tag"] = Value::Text("z");
  upd.predicate = "id = 2";
  OutcomeResult updated = conn.Update(upd).get();
  REQUIRE(updated.error.ok());
  REQUIRE(updated.outcome.rows_affected == 1);

  SelectRequest sel;
  sel.table = "t";
  sel.predicate = "tag = 'z'";
  BatchResult selected = conn.Select(sel).get();
  REQUIRE(selected.error.ok());
  REQUIRE(selected.batch.NumRows() == 1);
  REQUIRE(selected.batch.column(0).GetInt64(0) == 2);

  DeleteRequest del;
  del.table = "t";
  OutcomeResult deleted = conn.Delete(del).get();
  REQUIRE(deleted.error.ok());
  REQUIRE(deleted.outcome.rows_affected == 2);
}

TEST_CASE("AsyncConnector: many calls in flight", "[async_connector]") {
  AsyncConnector conn = OpenAsync();
  REQUIRE(conn.Execute("CREATE TABLE n(v INTEGER)").get().error.ok());

  std::vector<std::future<OutcomeResult>> pending;
  for (int64_t i = 0; i < 16; ++i) {
    pending.push_back(conn.ExecuteMutation("INSERT INTO n VALUES(?)", {Value::Int64(i)}));
  }
  for (auto& f : pending) {
    OutcomeResult r = f.get();
    REQUIRE(r.error.ok());
    REQUIRE(r.outcome.rows_affected == 1);
  }

  BatchResult count = conn.Execute("SELECT count(*) FROM n").get();
  REQUIRE(count.error.ok());
  REQUIRE(count.batch.column(0).GetInt64(0) == 16);
}

TEST_CASE("AsyncConnector: close and liveness", "[async_connector]") {
  AsyncConnector conn = OpenAsync();
  REQUIRE(conn.IsAlive().get());
  REQUIRE(conn.Close().get().ok());
  REQUIRE(conn.Close().get().ok());
  REQUIRE_FALSE(conn.IsAlive().get());
  REQUIRE(conn.Execute("SELECT 1").get().error.code == ErrorCode::kAlreadyClosed);
  REQUIRE(conn.connector().IsClosed());
}
