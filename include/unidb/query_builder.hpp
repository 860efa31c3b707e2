// Copyright (c) 2024 liudegui. MIT License.
//
// unidb query builder -- CRUD requests to dialect SQL.
//
// Design:
//   - Pure functions: request + Dialect in, SQL text out
//   - INSERT binds values through placeholders; UPDATE renders literals
//   - Predicates are inserted verbatim after WHERE; callers own their safety
//   - Identifiers always quoted with the dialect rule
//
// A DeleteRequest without predicate deletes every row of the table.

#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "unidb/column_batch.hpp"
#include "unidb/dialect.hpp"
#include "unidb/error.hpp"
#include "unidb/type_map.hpp"
#include "unidb/value.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

struct InsertRequest {
  std::string table;
  ColumnBatch batch;
};

struct SelectRequest {
  std::string table;
  std::optional<std::vector<std::string>> columns;  // none -> *
  std::optional<std::string> predicate;
  std::optional<uint64_t> limit;
};

struct UpdateRequest {
  std::string table;
  std::map<std::string, Value> values;  // sorted -> deterministic SQL
  std::optional<std::string> predicate;
};

struct DeleteRequest {
  std::string table;
  std::optional<std::string> predicate;
};

/// One statement with its ordered parameters.
struct SqlStatement {
  std::string sql;
  std::vector<Value> params;
  uint64_t rows = 0;  // INSERT rows carried by this statement
};

namespace detail {

inline void AppendWhere(const std::optional<std::string>& predicate,
                        std::string* sql) {
  if (predicate.has_value() && !predicate->empty()) {
    sql->append(" WHERE ");
    sql->append(*predicate);
  }
}

}  // namespace detail

// ---------------------------------------------------------------------------
// INSERT
// ---------------------------------------------------------------------------

/// Build INSERT statements for every row of the batch. Dialects with
/// multi-row support get one statement per chunk of at most max_params
/// parameters; the others get one statement per row.
inline Error BuildInsert(const InsertRequest& req, const Dialect& dialect,
                         std::vector<SqlStatement>* out) {
  out->clear();
  const ColumnBatch& batch = req.batch;
  const size_t num_cols = batch.NumColumns();
  const size_t num_rows = batch.NumRows();
  if (num_cols == 0 || num_rows == 0) { return Error::Ok(); }

  if (req.table.empty()) {
    return Error::Make(ErrorCode::kInvalidParameter, "insert without table");
  }
  if (num_cols > dialect.max_params) {
    return Error::Format(ErrorCode::kInvalidParameter,
                         "%zu columns exceed %u parameters on %s", num_cols,
                         dialect.max_params, dialect.name);
  }

  std::string head = "INSERT INTO " + QuoteIdentifier(req.table, dialect) + " (";
  for (size_t c = 0; c < num_cols; ++c) {
    const std::string& name = batch.column(c).name();
    if (name.empty()) {
      return Error::Format(ErrorCode::kInvalidParameter,
                           "column %zu has no name", c);
    }
    if (c > 0) { head.append(", "); }
    head.append(QuoteIdentifier(name, dialect));
  }
  head.append(") VALUES ");

  size_t rows_per_stmt = 1;
  if (dialect.multi_row_insert) {
    rows_per_stmt = std::max<size_t>(1, dialect.max_params / num_cols);
  }

  for (size_t first = 0; first < num_rows; first += rows_per_stmt) {
    const size_t last = std::min(num_rows, first + rows_per_stmt);
    SqlStatement stmt;
    stmt.sql = head;
    stmt.params.reserve((last - first) * num_cols);
    stmt.rows = last - first;

    uint32_t index = 1;
    for (size_t r = first; r < last; ++r) {
      if (r > first) { stmt.sql.append(", "); }
      stmt.sql.push_back('(');
      for (size_t c = 0; c < num_cols; ++c) {
        Value v = batch.column(c).GetValue(r);
        Error err = CheckBindable(v, dialect);
        if (!err.ok()) {
          return Error::Format(ErrorCode::kInvalidParameter,
                               "row %zu column '%s': %s", r,
                               batch.column(c).name().c_str(), err.message);
        }
        if (c > 0) { stmt.sql.append(", "); }
        stmt.sql.append(PlaceholderFor(index++, dialect));
        stmt.params.push_back(std::move(v));
      }
      stmt.sql.push_back(')');
    }
    out->push_back(std::move(stmt));
  }
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// SELECT
// ---------------------------------------------------------------------------

inline std::string BuildSelect(const SelectRequest& req,
                               const Dialect& dialect) {
  std::string sql = "SELECT ";
  const bool limited = req.limit.has_value();
  if (limited && dialect.pagination == Pagination::kPrefixTop) {
    sql.append("TOP ");
    sql.append(std::to_string(*req.limit));
    sql.push_back(' ');
  }

  if (!req.columns.has_value() || req.columns->empty()) {
    sql.push_back('*');
  } else {
    for (size_t i = 0; i < req.columns->size(); ++i) {
      if (i > 0) { sql.append(", "); }
      sql.append(QuoteIdentifier((*req.columns)[i], dialect));
    }
  }

  sql.append(" FROM ");
  sql.append(QuoteIdentifier(req.table, dialect));
  detail::AppendWhere(req.predicate, &sql);

  if (limited && dialect.pagination == Pagination::kSuffixLimit) {
    sql.append(" LIMIT ");
    sql.append(std::to_string(*req.limit));
  }
  return sql;
}

// ---------------------------------------------------------------------------
// UPDATE / DELETE
// ---------------------------------------------------------------------------

inline Error BuildUpdate(const UpdateRequest& req, const Dialect& dialect,
                         std::string* out) {
  if (req.values.empty()) {
    return Error::Make(ErrorCode::kInvalidParameter,
                       "update without assignments");
  }
  std::string sql = "UPDATE " + QuoteIdentifier(req.table, dialect) + " SET ";
  bool first = true;
  std::string literal;
  for (const auto& kv : req.values) {
    Error err = RenderLiteral(kv.second, dialect, &literal);
    if (!err.ok()) {
      return Error::Format(ErrorCode::kInvalidParameter, "column '%s': %s",
                           kv.first.c_str(), err.message);
    }
    if (!first) { sql.append(", "); }
    first = false;
    sql.append(QuoteIdentifier(kv.first, dialect));
    sql.append(" = ");
    sql.append(literal);
  }
  detail::AppendWhere(req.predicate, &sql);
  *out = std::move(sql);
  return Error::Ok();
}

inline std::string BuildDelete(const DeleteRequest& req,
                               const Dialect& dialect) {
  std::string sql = "DELETE FROM " + QuoteIdentifier(req.table, dialect);
  detail::AppendWhere(req.predicate, &sql);
  return sql;
}

}  // namespace unidb
