// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Design:
//   - Aggregates the MariaDB handle and its parameters into one traits
//     struct, used as template parameter for BasicConnector<Backend>
//   - Requires UNIDB_HAS_MARIADB=1 and the MariaDB/MySQL client library

#pragma once

#include <cstdlib>
#include <string>

#include "unidb/basic_connector.hpp"
#include "unidb/config.hpp"
#include "unidb/error.hpp"
#include "unidb/maria_handle.hpp"
#include "unidb/options.hpp"

namespace unidb {

constexpr int32_t kMariaDefaultPort = 3306;

// ---------------------------------------------------------------------------
// MariaBackend -- traits for BasicConnector<Backend>
// ---------------------------------------------------------------------------

struct MariaBackend {
  using Handle = MariaHandle;
  using Params = MariaParams;
  static constexpr Backend kTag = Backend::kMaria;

  static Error MakeParams(const ConnectionDescriptor& d, Params* out) {
    Params p;
    p.host = d.host.value_or("localhost");
    p.port = static_cast<uint16_t>(d.port.value_or(kMariaDefaultPort));
    p.database = d.database.value_or("");
    p.timeout_sec = TimeoutOf(d);

    if (d.UsesIntegratedAuth()) {
      const char* os_user = std::getenv("USER");
      if (os_user == nullptr || os_user[0] == '\0') {
        return Error::Make(ErrorCode::kConfigurationInvalid,
                           "integrated_auth needs the USER environment variable");
      }
      p.user = os_user;
    } else {
      p.user = d.username.value_or("");
      p.has_password = d.password.has_value();
      p.password = d.password.value_or("");
    }

    p.charset = ExtraString(d, "charset", "utf8mb4");
    p.unix_socket = ExtraString(d, "unix_socket", "");
    Error err = PoolSizeOf(d, &p.pool_size);
    if (!err.ok()) { return err; }

    *out = std::move(p);
    return Error::Ok();
  }

  static std::string Describe(const Params& p) {
    return p.user + "@" + p.host + ":" + std::to_string(p.port) + "/" +
           p.database;
  }

  static bool ShouldDiscard(const Params&, const Error& err) {
    return IsConnectionLevelError(err);
  }
};

using MariaConnector = BasicConnector<MariaBackend>;

}  // namespace unidb
