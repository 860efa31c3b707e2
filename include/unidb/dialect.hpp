// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Dialect -- per-backend SQL surface conventions.
//
// Design:
//   - One immutable Dialect per backend, created on first use
//   - Pagination, boolean literals, identifier quoting, placeholder style
//   - Read-only; never rebuilt per call

#pragma once

#include <cstdint>
#include <string>

#include "unidb/config.hpp"

namespace unidb {

enum class Pagination : uint8_t {
  kPrefixTop,    // SELECT TOP n ...
  kSuffixLimit,  // ... LIMIT n
};

enum class Placeholder : uint8_t {
  kPositional,  // ?
  kNamed,       // :p1, :p2, ...
};

struct Dialect {
  Backend backend;
  const char* name;
  Pagination pagination;
  const char* true_literal;
  const char* false_literal;
  char quote_open;
  char quote_close;
  Placeholder placeholder;
  const char* named_prefix;   // only for kNamed
  bool multi_row_insert;      // INSERT ... VALUES (..), (..) in one statement
  uint32_t max_params;        // bound parameters per statement
};

inline const Dialect& DialectFor(Backend backend) {
  static const Dialect kMaria = {
      Backend::kMaria, "mariadb", Pagination::kSuffixLimit, "TRUE", "FALSE",
      '`', '`', Placeholder::kPositional, "", true, 65535};
  static const Dialect kMssql = {
      Backend::kMssql, "mssql", Pagination::kPrefixTop, "1", "0",
      '[', ']', Placeholder::kPositional, "", false, 2100};
  static const Dialect kSqlite = {
      Backend::kSqlite, "sqlite", Pagination::kSuffixLimit, "1", "0",
      '"', '"', Placeholder::kNamed, ":p", true, 999};
  switch (backend) {
    case Backend::kMaria: return kMaria;
    case Backend::kMssql: return kMssql;
    case Backend::kSqlite: return kSqlite;
  }
  return kSqlite;
}

/// Quote an identifier; dotted names are quoted per part and embedded
/// closing quote characters are doubled.
inline std::string QuoteIdentifier(const std::string& ident,
                                   const Dialect& dialect) {
  std::string out;
  out.reserve(ident.size() + 4);
  out.push_back(dialect.quote_open);
  for (char c : ident) {
    if (c == '.') {
      out.push_back(dialect.quote_close);
      out.push_back('.');
      out.push_back(dialect.quote_open);
      continue;
    }
    if (c == dialect.quote_close) { out.push_back(c); }
    out.push_back(c);
  }
  out.push_back(dialect.quote_close);
  return out;
}

/// Placeholder for the 1-based parameter `index`.
inline std::string PlaceholderFor(uint32_t index, const Dialect& dialect) {
  if (dialect.placeholder == Placeholder::kNamed) {
    return dialect.named_prefix + std::to_string(index);
  }
  return "?";
}

inline const char* BoolLiteral(bool value, const Dialect& dialect) {
  return value ? dialect.true_literal : dialect.false_literal;
}

}  // namespace unidb
