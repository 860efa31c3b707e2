// Copyright (c) 2024 liudegui. MIT License.
//
// unidb native error tables for the server backends.
//
// Design:
//   - Explicit tables, no catch-all to a single kind beyond QueryFailure
//   - Independent of the client headers so the tables are testable
//     without a server driver installed
//   - SQLite result codes are mapped next to the SQLite handle

#pragma once

#include <cstring>

#include "unidb/error.hpp"

namespace unidb {

/// MariaDB / MySQL server and client error numbers.
inline ErrorCode MapMariaErrno(unsigned int errnum) {
  switch (errnum) {
    case 1022:  // ER_DUP_KEY
    case 1048:  // ER_BAD_NULL_ERROR
    case 1062:  // ER_DUP_ENTRY
    case 1169:  // ER_DUP_UNIQUE
    case 1216:  // ER_NO_REFERENCED_ROW
    case 1217:  // ER_ROW_IS_REFERENCED
    case 1451:  // ER_ROW_IS_REFERENCED_2
    case 1452:  // ER_NO_REFERENCED_ROW_2
    case 1557:  // ER_FOREIGN_DUPLICATE_KEY
    case 1586:  // ER_DUP_ENTRY_WITH_KEY_NAME
    case 3819:  // ER_CHECK_CONSTRAINT_VIOLATED (MySQL)
    case 4025:  // ER_CONSTRAINT_FAILED (MariaDB)
      return ErrorCode::kConstraintViolation;

    case 1040:  // ER_CON_COUNT_ERROR
    case 1044:  // ER_DBACCESS_DENIED_ERROR
    case 1045:  // ER_ACCESS_DENIED_ERROR
    case 1129:  // ER_HOST_IS_BLOCKED
    case 1130:  // ER_HOST_NOT_PRIVILEGED
    case 1698:  // ER_ACCESS_DENIED_NO_PASSWORD_ERROR
    case 2001:  // CR_SOCKET_CREATE_ERROR
    case 2002:  // CR_CONNECTION_ERROR
    case 2003:  // CR_CONN_HOST_ERROR
    case 2005:  // CR_UNKNOWN_HOST
    case 2006:  // CR_SERVER_GONE_ERROR
    case 2012:  // CR_SERVER_HANDSHAKE_ERR
    case 2013:  // CR_SERVER_LOST
    case 2026:  // CR_SSL_CONNECTION_ERROR
    case 2055:  // CR_SERVER_LOST_EXTENDED
      return ErrorCode::kConnectionFailure;

    case 1205:  // ER_LOCK_WAIT_TIMEOUT
    case 1969:  // ER_STATEMENT_TIMEOUT (MariaDB)
    case 3024:  // ER_QUERY_TIMEOUT (MySQL)
      return ErrorCode::kTimeout;

    case 1210:  // ER_WRONG_ARGUMENTS
    case 2031:  // CR_PARAMS_NOT_BOUND
    case 2036:  // CR_UNSUPPORTED_PARAM_TYPE
      return ErrorCode::kInvalidParameter;

    case 2008:  // CR_OUT_OF_MEMORY
    case 1021:  // ER_DISK_FULL
    case 1114:  // ER_RECORD_FILE_FULL
      return ErrorCode::kIoFailure;

    default:
      // Syntax errors, unknown table/column, everything else.
      return ErrorCode::kQueryFailure;
  }
}

/// ODBC SQLSTATE (five characters) as reported by SQLGetDiagRec.
inline ErrorCode MapOdbcSqlState(const char* state) {
  if (state == nullptr || std::strlen(state) < 2) {
    return ErrorCode::kQueryFailure;
  }
  if (std::strcmp(state, "HYT00") == 0 || std::strcmp(state, "HYT01") == 0) {
    return ErrorCode::kTimeout;
  }
  if (std::strcmp(state, "28000") == 0) { return ErrorCode::kConnectionFailure; }
  if (std::strcmp(state, "HY001") == 0) { return ErrorCode::kIoFailure; }
  if (std::strcmp(state, "07002") == 0 || std::strcmp(state, "07006") == 0 ||
      std::strcmp(state, "HY105") == 0) {
    return ErrorCode::kInvalidParameter;
  }

  const char cls0 = state[0];
  const char cls1 = state[1];
  if (cls0 == '2' && cls1 == '3') { return ErrorCode::kConstraintViolation; }
  if (cls0 == '0' && cls1 == '8') { return ErrorCode::kConnectionFailure; }
  if (cls0 == '2' && cls1 == '2') { return ErrorCode::kInvalidParameter; }
  // 42xxx syntax/access, 40001 deadlock and the rest.
  return ErrorCode::kQueryFailure;
}

}  // namespace unidb
