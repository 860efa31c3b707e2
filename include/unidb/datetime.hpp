// Copyright (c) 2024 liudegui. MIT License.
//
// unidb date/time helpers.
//
// Dates are days since 1970-01-01, timestamps are microseconds since the
// Unix epoch (UTC). Text forms follow ISO-8601: "YYYY-MM-DD" and
// "YYYY-MM-DD HH:MM:SS[.ffffff]".

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace unidb {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kMicrosPerDay = 86400LL * kMicrosPerSecond;

// civil <-> days conversion, proleptic Gregorian calendar.
inline int64_t DaysFromCivil(int64_t y, uint32_t m, uint32_t d) {
  y -= (m <= 2) ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const uint32_t yoe = static_cast<uint32_t>(y - era * 400);
  const uint32_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void CivilFromDays(int64_t z, int64_t* y, uint32_t* m, uint32_t* d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const uint32_t doe = static_cast<uint32_t>(z - era * 146097);
  const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const uint32_t mp = (5 * doy + 2) / 153;
  *d = doy - (153 * mp + 2) / 5 + 1;
  *m = mp < 10 ? mp + 3 : mp - 9;
  *y = static_cast<int64_t>(yoe) + era * 400 + (*m <= 2 ? 1 : 0);
}

inline int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
  return q;
}

inline int64_t YearOfDays(int64_t days) {
  int64_t y = 0;
  uint32_t m = 0;
  uint32_t d = 0;
  CivilFromDays(days, &y, &m, &d);
  return y;
}

/// True when the date lies in years 0001..9999, the range every backend
/// can store and render.
inline bool DateInRange(int64_t days) {
  int64_t y = YearOfDays(days);
  return y >= 1 && y <= 9999;
}

inline bool TimestampInRange(int64_t micros) {
  return DateInRange(FloorDiv(micros, kMicrosPerDay));
}

inline std::string FormatDate(int32_t days) {
  int64_t y = 0;
  uint32_t m = 0;
  uint32_t d = 0;
  CivilFromDays(days, &y, &m, &d);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(y), m, d);
  return buf;
}

/// Format a timestamp; the fraction is printed only when non-zero.
inline std::string FormatTimestamp(int64_t micros, char separator = ' ') {
  int64_t days = FloorDiv(micros, kMicrosPerDay);
  int64_t rem = micros - days * kMicrosPerDay;
  int64_t secs = rem / kMicrosPerSecond;
  int64_t frac = rem % kMicrosPerSecond;

  int64_t y = 0;
  uint32_t m = 0;
  uint32_t d = 0;
  CivilFromDays(days, &y, &m, &d);
  char buf[48];
  int n = std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u%c%02lld:%02lld:%02lld",
                        static_cast<long long>(y), m, d, separator,
                        static_cast<long long>(secs / 3600),
                        static_cast<long long>((secs / 60) % 60),
                        static_cast<long long>(secs % 60));
  if (frac != 0 && n > 0) {
    std::snprintf(buf + n, sizeof(buf) - static_cast<size_t>(n), ".%06lld",
                  static_cast<long long>(frac));
  }
  return buf;
}

namespace detail {

inline bool ReadDigits(const char* s, size_t len, size_t* pos, size_t count,
                       int64_t* out) {
  if (*pos + count > len) { return false; }
  int64_t v = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = s[*pos + i];
    if (c < '0' || c > '9') { return false; }
    v = v * 10 + (c - '0');
  }
  *pos += count;
  *out = v;
  return true;
}

inline bool Expect(const char* s, size_t len, size_t* pos, char c) {
  if (*pos >= len || s[*pos] != c) { return false; }
  ++*pos;
  return true;
}

inline bool DaysInMonth(int64_t y, int64_t m, int64_t d) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12 || d < 1) { return false; }
  bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
  int64_t max = kDays[m - 1] + ((m == 2 && leap) ? 1 : 0);
  return d <= max;
}

inline bool ParseDatePart(const char* s, size_t len, size_t* pos,
                          int64_t* days) {
  int64_t y = 0;
  int64_t m = 0;
  int64_t d = 0;
  if (!ReadDigits(s, len, pos, 4, &y) || !Expect(s, len, pos, '-') ||
      !ReadDigits(s, len, pos, 2, &m) || !Expect(s, len, pos, '-') ||
      !ReadDigits(s, len, pos, 2, &d)) {
    return false;
  }
  if (!DaysInMonth(y, m, d)) { return false; }
  *days = DaysFromCivil(y, static_cast<uint32_t>(m), static_cast<uint32_t>(d));
  return true;
}

}  // namespace detail

/// Parse "YYYY-MM-DD".
inline bool ParseDate(const char* s, size_t len, int32_t* out) {
  size_t pos = 0;
  int64_t days = 0;
  if (!detail::ParseDatePart(s, len, &pos, &days) || pos != len) {
    return false;
  }
  *out = static_cast<int32_t>(days);
  return true;
}

/// Parse "YYYY-MM-DD[( |T)HH:MM[:SS[.fffffffff]]][ ][Z|(+|-)HH[:MM]]".
/// Fractions beyond microseconds are truncated; offsets are folded into UTC.
inline bool ParseTimestamp(const char* s, size_t len, int64_t* out) {
  size_t pos = 0;
  int64_t days = 0;
  if (!detail::ParseDatePart(s, len, &pos, &days)) { return false; }

  int64_t hh = 0;
  int64_t mi = 0;
  int64_t ss = 0;
  int64_t frac = 0;
  if (pos < len && (s[pos] == ' ' || s[pos] == 'T')) {
    ++pos;
    if (!detail::ReadDigits(s, len, &pos, 2, &hh) ||
        !detail::Expect(s, len, &pos, ':') ||
        !detail::ReadDigits(s, len, &pos, 2, &mi)) {
      return false;
    }
    if (pos < len && s[pos] == ':') {
      ++pos;
      if (!detail::ReadDigits(s, len, &pos, 2, &ss)) { return false; }
      if (pos < len && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < len && s[pos] >= '0' && s[pos] <= '9') {
          if (digits < 6) {
            frac = frac * 10 + (s[pos] - '0');
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) { return false; }
        for (int i = digits; i < 6; ++i) { frac *= 10; }
      }
    }
    if (hh > 23 || mi > 59 || ss > 60) { return false; }
  }

  int64_t offset_secs = 0;
  if (pos < len && s[pos] == ' ') { ++pos; }
  if (pos < len && s[pos] == 'Z') {
    ++pos;
  } else if (pos < len && (s[pos] == '+' || s[pos] == '-')) {
    int64_t sign = (s[pos] == '-') ? -1 : 1;
    ++pos;
    int64_t oh = 0;
    int64_t om = 0;
    if (!detail::ReadDigits(s, len, &pos, 2, &oh)) { return false; }
    if (pos < len && s[pos] == ':') { ++pos; }
    if (pos < len && !detail::ReadDigits(s, len, &pos, 2, &om)) { return false; }
    offset_secs = sign * (oh * 3600 + om * 60);
  }
  if (pos != len) { return false; }

  int64_t secs = hh * 3600 + mi * 60 + ss - offset_secs;
  *out = days * kMicrosPerDay + secs * kMicrosPerSecond + frac;
  return true;
}

}  // namespace unidb
