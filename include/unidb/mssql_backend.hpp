// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MssqlBackend -- backend traits for SQL Server.
//
// Design:
//   - Aggregates the ODBC handle and its parameters into one traits
//     struct, used as template parameter for BasicConnector<Backend>
//   - Requires UNIDB_HAS_ODBC=1, an ODBC driver manager and the SQL Server
//     ODBC driver

#pragma once

#include <string>

#include "unidb/basic_connector.hpp"
#include "unidb/config.hpp"
#include "unidb/error.hpp"
#include "unidb/mssql_handle.hpp"
#include "unidb/options.hpp"

namespace unidb {

constexpr int32_t kMssqlDefaultPort = 1433;

// ---------------------------------------------------------------------------
// MssqlBackend -- traits for BasicConnector<Backend>
// ---------------------------------------------------------------------------

struct MssqlBackend {
  using Handle = MssqlHandle;
  using Params = MssqlParams;
  static constexpr Backend kTag = Backend::kMssql;

  static Error MakeParams(const ConnectionDescriptor& d, Params* out) {
    Params p;
    p.server = d.host.value_or("localhost");
    p.port = static_cast<uint16_t>(d.port.value_or(kMssqlDefaultPort));
    p.database = d.database.value_or("");
    p.timeout_sec = TimeoutOf(d);
    p.integrated = d.UsesIntegratedAuth();
    p.user = d.username.value_or("");
    p.password = d.password.value_or("");
    p.driver = ExtraString(d, "driver", "ODBC Driver 18 for SQL Server");

    // Remaining extension keys pass through as ODBC keywords.
    for (const auto& kv : d.extra) {
      if (kv.first == "pool_size" || kv.first == "driver") { continue; }
      if (kv.first.find_first_of("=;{}") != std::string::npos) {
        return Error::Format(ErrorCode::kConfigurationInvalid,
                             "invalid ODBC keyword '%s'", kv.first.c_str());
      }
      p.keywords[kv.first] = kv.second;
    }

    Error err = PoolSizeOf(d, &p.pool_size);
    if (!err.ok()) { return err; }

    *out = std::move(p);
    return Error::Ok();
  }

  static std::string Describe(const Params& p) {
    std::string who = p.integrated ? std::string("(integrated)") : p.user;
    return who + "@" + p.server + "," + std::to_string(p.port) + "/" +
           p.database;
  }

  static bool ShouldDiscard(const Params&, const Error& err) {
    return IsConnectionLevelError(err);
  }
};

using MssqlConnector = BasicConnector<MssqlBackend>;

}  // namespace unidb
