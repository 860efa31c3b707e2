// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::Sqlite3Backend -- backend traits for the embedded engine.
//
// Design:
//   - Aggregates the SQLite3 handle and its parameters into one traits
//     struct, used as template parameter for BasicConnector<Backend>
//   - An in-memory database pins the pool to one handle so every operation sees the
//     same private database; that handle is never discarded
//   - File databases default to WAL journaling

#pragma once

#include <cctype>
#include <string>

#include "unidb/basic_connector.hpp"
#include "unidb/config.hpp"
#include "unidb/error.hpp"
#include "unidb/options.hpp"
#include "unidb/sqlite3_handle.hpp"

namespace unidb {

/// True for paths whose database lives only as long as its connection.
inline bool IsMemoryDatabase(const std::string& path) {
  return path == kInMemoryPath || path.rfind("file::memory:", 0) == 0 ||
         path.find("mode=memory") != std::string::npos;
}

// ---------------------------------------------------------------------------
// Sqlite3Backend -- traits for BasicConnector<Backend>
// ---------------------------------------------------------------------------

struct Sqlite3Backend {
  using Handle = Sqlite3Handle;
  using Params = Sqlite3Params;
  static constexpr Backend kTag = Backend::kSqlite;

  static Error MakeParams(const ConnectionDescriptor& d, Params* out) {
    Params p;
    p.path = d.path.value_or(kInMemoryPath);
    p.timeout_sec = TimeoutOf(d);

    Error err = PoolSizeOf(d, &p.pool_size);
    if (!err.ok()) { return err; }
    if (IsMemoryDatabase(p.path)) { p.pool_size = 1; }

    err = ExtraBool(d, "foreign_keys", true, &p.foreign_keys);
    if (!err.ok()) { return err; }

    std::string mode = ExtraString(d, "journal_mode",
                                   IsMemoryDatabase(p.path) ? "" : "WAL");
    for (char& c : mode) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (!mode.empty() && mode != "DELETE" && mode != "TRUNCATE" &&
        mode != "PERSIST" && mode != "MEMORY" && mode != "WAL" &&
        mode != "OFF") {
      return Error::Format(ErrorCode::kConfigurationInvalid,
                           "journal_mode=%s is not a SQLite journal mode",
                           mode.c_str());
    }
    p.journal_mode = mode;

    *out = std::move(p);
    return Error::Ok();
  }

  static std::string Describe(const Params& p) { return p.path; }

  /// An interrupted or busy statement leaves the connection usable, and
  /// reopening ":memory:" would silently hand out an empty database.
  static bool ShouldDiscard(const Params& p, const Error& err) {
    if (IsMemoryDatabase(p.path)) { return false; }
    return err.code == ErrorCode::kConnectionFailure ||
           err.code == ErrorCode::kIoFailure;
  }
};

using Sqlite3Connector = BasicConnector<Sqlite3Backend>;

}  // namespace unidb
