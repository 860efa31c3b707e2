// Copyright (c) 2024 liudegui. MIT License.
//
// unidb extension-map readers shared by the backend traits.
//
// Recognized keys: pool_size (all), charset / unix_socket (mariadb),
// driver + pass-through ODBC keywords (mssql), journal_mode /
// foreign_keys (sqlite). Unparsable values -> ConfigurationInvalid.

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>

#include "unidb/config.hpp"
#include "unidb/error.hpp"

namespace unidb {

constexpr uint32_t kDefaultPoolSize = 4;
constexpr uint32_t kMaxPoolSize = 1024;
constexpr int32_t kDefaultTimeoutSec = 30;

inline std::string ExtraString(const ConnectionDescriptor& d, const char* key,
                               const char* fallback) {
  auto it = d.extra.find(key);
  return (it != d.extra.end()) ? it->second : std::string(fallback);
}

inline Error ExtraUint32(const ConnectionDescriptor& d, const char* key,
                         uint32_t fallback, uint32_t min, uint32_t max,
                         uint32_t* out) {
  auto it = d.extra.find(key);
  if (it == d.extra.end()) {
    *out = fallback;
    return Error::Ok();
  }
  const std::string& text = it->second;
  char* end = nullptr;
  unsigned long v = std::strtoul(text.c_str(), &end, 10);
  if (text.empty() || text[0] == '-' || end != text.c_str() + text.size() ||
      v < min || v > max) {
    return Error::Format(ErrorCode::kConfigurationInvalid,
                         "%s=%s must be an integer in %u..%u", key,
                         text.c_str(), min, max);
  }
  *out = static_cast<uint32_t>(v);
  return Error::Ok();
}

inline Error ExtraBool(const ConnectionDescriptor& d, const char* key,
                       bool fallback, bool* out) {
  auto it = d.extra.find(key);
  if (it == d.extra.end()) {
    *out = fallback;
    return Error::Ok();
  }
  std::string lower;
  for (char c : it->second) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
    *out = true;
  } else if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
    *out = false;
  } else {
    return Error::Format(ErrorCode::kConfigurationInvalid,
                         "%s=%s is not a boolean", key, it->second.c_str());
  }
  return Error::Ok();
}

inline Error PoolSizeOf(const ConnectionDescriptor& d, uint32_t* out) {
  return ExtraUint32(d, "pool_size", kDefaultPoolSize, 1, kMaxPoolSize, out);
}

inline int32_t TimeoutOf(const ConnectionDescriptor& d) {
  return d.timeout_sec.value_or(kDefaultTimeoutSec);
}

}  // namespace unidb
