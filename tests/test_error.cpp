// Copyright (c) 2024 liudegui. MIT License.
// Tests for unidb::Error.

#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "unidb/error.hpp"

using namespace unidb;

TEST_CASE("Error: default is ok", "[error]") {
  Error err;
  REQUIRE(err.ok());
  REQUIRE(static_cast<bool>(err));
  REQUIRE(err.code == ErrorCode::kOk);
  REQUIRE(std::strcmp(err.name(), "Ok") == 0);
}

TEST_CASE("Error: Make() factory", "[error]") {
  Error err = Error::Make(ErrorCode::kQueryFailure, "syntax error near FROM");
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.code == ErrorCode::kQueryFailure);
  REQUIRE(std::strstr(err.message, "near FROM") != nullptr);
}

TEST_CASE("Error: Make() without message", "[error]") {
  Error err = Error::Make(ErrorCode::kAlreadyClosed);
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: Format()", "[error]") {
  Error err = Error::Format(ErrorCode::kTimeout, "gave up after %d ms", 250);
  REQUIRE(err.code == ErrorCode::kTimeout);
  REQUIRE(std::strcmp(err.message, "gave up after 250 ms") == 0);
}

TEST_CASE("Error: Set() and Clear()", "[error]") {
  Error err;
  err.Set(ErrorCode::kIoFailure, nullptr);
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.message[0] == '\0');

  err.SetFormat(ErrorCode::kConstraintViolation, "key %s", "k1");
  REQUIRE(std::strcmp(err.message, "key k1") == 0);

  err.Clear();
  REQUIRE(err.ok());
}

TEST_CASE("Error: message truncation", "[error]") {
  char long_msg[512];
  std::memset(long_msg, 'x', sizeof(long_msg) - 1);
  long_msg[sizeof(long_msg) - 1] = '\0';

  Error err;
  err.Set(ErrorCode::kQueryFailure, long_msg);
  REQUIRE(std::strlen(err.message) < Error::kMaxMessageLen);
  REQUIRE(err.message[Error::kMaxMessageLen - 1] == '\0');
}

TEST_CASE("Error: every kind has a distinct name", "[error]") {
  const ErrorCode kinds[] = {
      ErrorCode::kConnectionFailure, ErrorCode::kQueryFailure,
      ErrorCode::kConfigurationInvalid, ErrorCode::kUnsupportedBackend,
      ErrorCode::kAlreadyClosed, ErrorCode::kTimeout,
      ErrorCode::kConstraintViolation, ErrorCode::kInvalidParameter,
      ErrorCode::kNotImplemented, ErrorCode::kSerializationFailure,
      ErrorCode::kIoFailure};
  for (size_t i = 0; i < sizeof(kinds) / sizeof(kinds[0]); ++i) {
    for (size_t j = i + 1; j < sizeof(kinds) / sizeof(kinds[0]); ++j) {
      REQUIRE(std::strcmp(ErrorCodeName(kinds[i]), ErrorCodeName(kinds[j])) != 0);
    }
  }
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kConstraintViolation),
                      "ConstraintViolation") == 0);
}
