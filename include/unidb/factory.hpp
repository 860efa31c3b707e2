// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::ConnectorFactory / unidb::Connect -- connector construction.
//
// Design:
//   - Create() dispatches on the backend tag only; no validation
//   - Connect() validates first, so an invalid descriptor never reaches
//     a driver
//   - MariaDB and SQL Server compile in with UNIDB_HAS_MARIADB /
//     UNIDB_HAS_ODBC; otherwise those tags report UnsupportedBackend

#pragma once

#include <memory>

#include "unidb/config.hpp"
#include "unidb/connector.hpp"
#include "unidb/error.hpp"
#include "unidb/sqlite3_backend.hpp"

#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
#include "unidb/maria_backend.hpp"
#endif

#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
#include "unidb/mssql_backend.hpp"
#endif

namespace unidb {

/// True when the backend's client library was compiled in.
inline bool BackendAvailable(Backend backend) {
  switch (backend) {
    case Backend::kSqlite:
      return true;
    case Backend::kMaria:
#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
      return true;
#else
      return false;
#endif
    case Backend::kMssql:
#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
      return true;
#else
      return false;
#endif
  }
  return false;
}

class ConnectorFactory {
 public:
  static Error Create(const ConnectionDescriptor& descriptor,
                      std::unique_ptr<CrudConnector>* out) {
    switch (descriptor.backend) {
      case Backend::kSqlite:
        return Sqlite3Connector::Create(descriptor, out);
      case Backend::kMaria:
#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
        return MariaConnector::Create(descriptor, out);
#else
        break;
#endif
      case Backend::kMssql:
#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
        return MssqlConnector::Create(descriptor, out);
#else
        break;
#endif
    }
    return Error::Format(ErrorCode::kUnsupportedBackend,
                         "backend %s is not available in this build",
                         BackendName(descriptor.backend));
  }
};

/// Validate `descriptor`, then build and ping its connector.
inline Error Connect(const ConnectionDescriptor& descriptor,
                     std::unique_ptr<CrudConnector>* out) {
  Error err = Validate(descriptor);
  if (!err.ok()) { return err; }
  return ConnectorFactory::Create(descriptor, out);
}

}  // namespace unidb
