// Copyright (c) 2024 liudegui. MIT License.
//
// unidb quickstart -- connector CRUD against a SQLite database.
//
// Usage:
//   ./unidb_quickstart [uri]      (default: sqlite://:memory:)

#include <cstdio>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "unidb/unidb.hpp"

static void PrintBatch(const unidb::ColumnBatch& batch) {
  for (size_t c = 0; c < batch.NumColumns(); ++c) {
    std::printf("%s%-14s", c == 0 ? "  " : " ", batch.column(c).name().c_str());
  }
  std::printf("\n");
  for (size_t r = 0; r < batch.NumRows(); ++r) {
    for (size_t c = 0; c < batch.NumColumns(); ++c) {
      const unidb::Column& col = batch.column(c);
      std::string text = col.IsNull(r) ? "null" : unidb::ValueToText(col.GetValue(r));
      std::printf("%s%-14s", c == 0 ? "  " : " ", text.c_str());
    }
    std::printf("\n");
  }
}

static unidb::Error TextColumn(const char* name,
                               std::initializer_list<const char*> values,
                               unidb::Column* out) {
  *out = unidb::Column(name, unidb::ColumnType::kText);
  for (const char* v : values) {
    unidb::Error err = out->Append(unidb::Value::Text(v));
    if (!err.ok()) { return err; }
  }
  return unidb::Error::Ok();
}

int main(int argc, char** argv) {
  unidb::ConnectionDescriptor descriptor = unidb::ConnectionDescriptor::SqliteInMemory();
  if (argc > 1) {
    unidb::Error err = unidb::FromUri(argv[1], &descriptor);
    if (!err.ok()) {
      std::fprintf(stderr, "Bad URI: %s\n", err.message);
      return 1;
    }
  }

  std::unique_ptr<unidb::CrudConnector> conn;
  unidb::Error err = unidb::Connect(descriptor, &conn);
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s (%s)\n", err.message, err.name());
    return 1;
  }
  std::printf("Connected to %s\n", conn->name());

  unidb::ColumnBatch batch;
  err = conn->Execute(
      "CREATE TABLE employees(id INTEGER PRIMARY KEY, name VARCHAR(64) NOT NULL, "
      "department VARCHAR(32), salary DOUBLE PRECISION)",
      &batch);
  if (!err.ok()) {
    std::fprintf(stderr, "Create table failed: %s\n", err.message);
    return 1;
  }

  // Insert
  unidb::InsertRequest ins;
  ins.table = "employees";
  unidb::Column id;
  unidb::Column name;
  unidb::Column department;
  unidb::Column salary;
  err = unidb::Column::FromValues(
      "id", unidb::ColumnType::kInt64,
      {unidb::Value::Int64(1), unidb::Value::Int64(2), unidb::Value::Int64(3),
       unidb::Value::Int64(4)},
      &id);
  if (err.ok()) {
    err = TextColumn("name",
                     {"Alice Johnson", "Bob Smith", "Charlie Brown", "Diana Prince"},
                     &name);
  }
  if (err.ok()) {
    err = TextColumn("department",
                     {"Engineering", "Sales", "Engineering", "Marketing"},
                     &department);
  }
  if (err.ok()) {
    err = unidb::Column::FromValues(
        "salary", unidb::ColumnType::kFloat64,
        {unidb::Value::Float64(95000.0), unidb::Value::Float64(75000.0),
         unidb::Value::Float64(85000.0), unidb::Value::Float64(80000.0)},
        &salary);
  }
  if (err.ok()) { err = ins.batch.AddColumn(std::move(id)); }
  if (err.ok()) { err = ins.batch.AddColumn(std::move(name)); }
  if (err.ok()) { err = ins.batch.AddColumn(std::move(department)); }
  if (err.ok()) { err = ins.batch.AddColumn(std::move(salary)); }
  if (!err.ok()) {
    std::fprintf(stderr, "Build batch failed: %s\n", err.message);
    return 1;
  }

  unidb::OperationOutcome outcome;
  err = conn->Insert(ins, &outcome);
  if (!err.ok()) {
    std::fprintf(stderr, "Insert failed: %s\n", err.message);
    return 1;
  }
  std::printf("Inserted %llu rows\n",
              static_cast<unsigned long long>(outcome.rows_affected));

  // Select
  unidb::SelectRequest sel;
  sel.table = "employees";
  sel.predicate = "department = 'Engineering'";
  if (conn->Select(sel, &batch).ok()) {
    std::printf("\n--- Engineering ---\n");
    PrintBatch(batch);
  }

  if (conn->Execute("SELECT department, AVG(salary) AS avg_salary FROM employees "
                    "GROUP BY department ORDER BY avg_salary DESC",
                    &batch).ok()) {
    std::printf("\n--- Average salary ---\n");
    PrintBatch(batch);
  }

  // Update
  unidb::UpdateRequest upd;
  upd.table = "employees";
  upd.values["salary"] = unidb::Value::Float64(104500.0);
  upd.predicate = "id = 1";
  if (conn->Update(upd, &outcome).ok()) {
    std::printf("\nUpdated %llu row(s)\n",
                static_cast<unsigned long long>(outcome.rows_affected));
  }

  // Delete
  unidb::DeleteRequest del;
  del.table = "employees";
  del.predicate = "department = 'Sales'";
  if (conn->Delete(del, &outcome).ok()) {
    std::printf("Deleted %llu row(s)\n",
                static_cast<unsigned long long>(outcome.rows_affected));
  }

  sel.predicate.reset();
  sel.limit = 10;
  if (conn->Select(sel, &batch).ok()) {
    std::printf("\n--- Remaining ---\n");
    PrintBatch(batch);
  }

  err = conn->Close();
  std::printf("\nClosed: %s\n", err.ok() && conn->IsClosed() ? "true" : "false");
  return 0;
}
