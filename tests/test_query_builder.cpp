// Copyright (c) 2024 liudegui. MIT License.
// Tests for dialect constants and the INSERT/SELECT/UPDATE/DELETE builders.

#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <string>
#include <vector>

#include "unidb/dialect.hpp"
#include "unidb/query_builder.hpp"

using namespace unidb;

namespace {

ColumnBatch MakeBatch(size_t rows, size_t cols) {
  ColumnBatch batch;
  for (size_t c = 0; c < cols; ++c) {
    Column column("c" + std::to_string(c), ColumnType::kInt64);
    for (size_t r = 0; r < rows; ++r) {
      REQUIRE(column.Append(Value::Int64(static_cast<int64_t>(r * cols + c))).ok());
    }
    REQUIRE(batch.AddColumn(std::move(column)).ok());
  }
  return batch;
}

size_t CountOf(const std::string& text, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + 1)) {
    ++n;
  }
  return n;
}

}  // namespace

TEST_CASE("Dialect: constants", "[dialect]") {
  const Dialect& maria = DialectFor(Backend::kMaria);
  const Dialect& mssql = DialectFor(Backend::kMssql);
  const Dialect& lite = DialectFor(Backend::kSqlite);
  REQUIRE(maria.pagination == Pagination::kSuffixLimit);
  REQUIRE(mssql.pagination == Pagination::kPrefixTop);
  REQUIRE(lite.pagination == Pagination::kSuffixLimit);
  REQUIRE(std::string(BoolLiteral(true, maria)) == "TRUE");
  REQUIRE(std::string(BoolLiteral(true, mssql)) == "1");
  REQUIRE(std::string(BoolLiteral(false, lite)) == "0");
  REQUIRE_FALSE(mssql.multi_row_insert);
}

TEST_CASE("Dialect: identifiers and placeholders", "[dialect]") {
  REQUIRE(QuoteIdentifier("users", DialectFor(Backend::kMaria)) == "`users`");
  REQUIRE(QuoteIdentifier("dbo.users", DialectFor(Backend::kMssql)) == "[dbo].[users]");
  REQUIRE(QuoteIdentifier("we\"ird", DialectFor(Backend::kSqlite)) == "\"we\"\"ird\"");
  REQUIRE(QuoteIdentifier("a]b", DialectFor(Backend::kMssql)) == "[a]]b]");

  REQUIRE(PlaceholderFor(3, DialectFor(Backend::kMaria)) == "?");
  REQUIRE(PlaceholderFor(3, DialectFor(Backend::kMssql)) == "?");
  REQUIRE(PlaceholderFor(3, DialectFor(Backend::kSqlite)) == ":p3");
}

TEST_CASE("BuildSelect: pagination per dialect", "[query_builder]") {
  SelectRequest req;
  req.table = "t";
  req.limit = 1;

  std::string mssql = BuildSelect(req, DialectFor(Backend::kMssql));
  REQUIRE(mssql.rfind("SELECT TOP 1 ", 0) == 0);
  REQUIRE(CountOf(mssql, "LIMIT") == 0);

  std::string maria = BuildSelect(req, DialectFor(Backend::kMaria));
  REQUIRE(maria == "SELECT * FROM `t` LIMIT 1");

  std::string lite = BuildSelect(req, DialectFor(Backend::kSqlite));
  REQUIRE(CountOf(lite, "LIMIT 1") == 1);
  REQUIRE(CountOf(lite, "TOP") == 0);
}

TEST_CASE("BuildSelect: columns and predicate", "[query_builder]") {
  SelectRequest req;
  req.table = "orders";
  req.columns = std::vector<std::string>{"id", "total"};
  req.predicate = "total > 10";
  REQUIRE(BuildSelect(req, DialectFor(Backend::kMssql)) ==
          "SELECT [id], [total] FROM [orders] WHERE total > 10");

  req.predicate = std::string();
  REQUIRE(BuildSelect(req, DialectFor(Backend::kSqlite)) ==
          "SELECT \"id\", \"total\" FROM \"orders\"");
}

TEST_CASE("BuildInsert: multi-row and per-row dialects", "[query_builder]") {
  InsertRequest req;
  req.table = "t";
  req.batch = MakeBatch(3, 2);

  std::vector<SqlStatement> stmts;
  REQUIRE(BuildInsert(req, DialectFor(Backend::kSqlite), &stmts).ok());
  REQUIRE(stmts.size() == 1);
  REQUIRE(stmts[0].sql ==
          "INSERT INTO \"t\" (\"c0\", \"c1\") VALUES (:p1, :p2), (:p3, :p4), (:p5, :p6)");
  REQUIRE(stmts[0].params.size() == 6);
  REQUIRE(stmts[0].params[5] == Value::Int64(5));
  REQUIRE(stmts[0].rows == 3);

  REQUIRE(BuildInsert(req, DialectFor(Backend::kMssql), &stmts).ok());
  REQUIRE(stmts.size() == 3);
  REQUIRE(stmts[2].sql == "INSERT INTO [t] ([c0], [c1]) VALUES (?, ?)");
  REQUIRE(stmts[2].params[0] == Value::Int64(4));
}

TEST_CASE("BuildInsert: chunks by parameter limit", "[query_builder]") {
  InsertRequest req;
  req.table = "t";
  req.batch = MakeBatch(1000, 2);  // 2000 params > 999

  std::vector<SqlStatement> stmts;
  REQUIRE(BuildInsert(req, DialectFor(Backend::kSqlite), &stmts).ok());
  REQUIRE(stmts.size() == 3);  // 499 + 499 + 2 rows
  uint64_t rows = 0;
  for (const SqlStatement& s : stmts) {
    REQUIRE(s.params.size() <= 999);
    rows += s.rows;
  }
  REQUIRE(rows == 1000);
}

TEST_CASE("BuildInsert: edge cases", "[query_builder]") {
  std::vector<SqlStatement> stmts;
  InsertRequest empty;
  empty.table = "t";
  REQUIRE(BuildInsert(empty, DialectFor(Backend::kMaria), &stmts).ok());
  REQUIRE(stmts.empty());

  InsertRequest no_table;
  no_table.batch = MakeBatch(1, 1);
  REQUIRE(BuildInsert(no_table, DialectFor(Backend::kMaria), &stmts).code ==
          ErrorCode::kInvalidParameter);

  InsertRequest bad_value;
  bad_value.table = "t";
  Column f("f", ColumnType::kFloat64);
  REQUIRE(f.Append(Value::Float64(std::numeric_limits<double>::infinity())).ok());
  REQUIRE(bad_value.batch.AddColumn(f).ok());
  REQUIRE(BuildInsert(bad_value, DialectFor(Backend::kMaria), &stmts).code ==
          ErrorCode::kInvalidParameter);
}

TEST_CASE("BuildUpdate and BuildDelete", "[query_builder]") {
  UpdateRequest upd;
  upd.table = "users";
  upd.values["active"] = Value::Bool(true);
  upd.values["name"] = Value::Text("Ann");
  upd.predicate = "id = 3";

  std::string sql;
  REQUIRE(BuildUpdate(upd, DialectFor(Backend::kMaria), &sql).ok());
  REQUIRE(sql == "UPDATE `users` SET `active` = TRUE, `name` = 'Ann' WHERE id = 3");
  REQUIRE(BuildUpdate(upd, DialectFor(Backend::kMssql), &sql).ok());
  REQUIRE(sql == "UPDATE [users] SET [active] = 1, [name] = N'Ann' WHERE id = 3");

  UpdateRequest none;
  none.table = "users";
  REQUIRE(BuildUpdate(none, DialectFor(Backend::kSqlite), &sql).code ==
          ErrorCode::kInvalidParameter);

  DeleteRequest del;
  del.table = "users";
  REQUIRE(BuildDelete(del, DialectFor(Backend::kSqlite)) == "DELETE FROM \"users\"");
  del.predicate = "id < 0";
  REQUIRE(BuildDelete(del, DialectFor(Backend::kMaria)) ==
          "DELETE FROM `users` WHERE id < 0");
}
