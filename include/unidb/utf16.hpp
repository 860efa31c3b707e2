// Copyright (c) 2024 liudegui. MIT License.
//
// UTF-8 <-> UTF-16 conversion for wide-character driver APIs.
//
// Design:
//   - Utf8ToUtf16() rejects malformed UTF-8 (overlong forms, surrogates,
//     truncated sequences, code points above U+10FFFF)
//   - Utf16ToUtf8() never fails; unpaired surrogates become U+FFFD

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace unidb {

inline bool Utf8ToUtf16(const std::string& in, std::u16string* out) {
  out->clear();
  out->reserve(in.size());
  const size_t n = in.size();
  size_t i = 0;
  while (i < n) {
    const uint8_t lead = static_cast<uint8_t>(in[i]);
    uint32_t cp = 0;
    size_t len = 0;
    uint32_t min = 0;
    if (lead < 0x80) {
      cp = lead;
      len = 1;
    } else if ((lead >> 5) == 0x6) {
      cp = lead & 0x1F;
      len = 2;
      min = 0x80;
    } else if ((lead >> 4) == 0xE) {
      cp = lead & 0x0F;
      len = 3;
      min = 0x800;
    } else if ((lead >> 3) == 0x1E) {
      cp = lead & 0x07;
      len = 4;
      min = 0x10000;
    } else {
      return false;
    }
    if (i + len > n) { return false; }
    for (size_t k = 1; k < len; ++k) {
      const uint8_t b = static_cast<uint8_t>(in[i + k]);
      if ((b & 0xC0) != 0x80) { return false; }
      cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    if (cp < 0x10000) {
      out->push_back(static_cast<char16_t>(cp));
    } else {
      cp -= 0x10000;
      out->push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
      out->push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
    }
    i += len;
  }
  return true;
}

inline std::string Utf16ToUtf8(const char16_t* data, size_t n) {
  std::string out;
  out.reserve(n);
  size_t i = 0;
  while (i < n) {
    const uint32_t u = data[i];
    uint32_t cp = u;
    ++i;
    if (u >= 0xD800 && u <= 0xDBFF && i < n && data[i] >= 0xDC00 &&
        data[i] <= 0xDFFF) {
      cp = 0x10000 + ((u - 0xD800) << 10) + (data[i] - 0xDC00u);
      ++i;
    } else if (u >= 0xD800 && u <= 0xDFFF) {
      cp = 0xFFFD;
    }

    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

inline std::string Utf16ToUtf8(const std::u16string& in) {
  return Utf16ToUtf8(in.data(), in.size());
}

}  // namespace unidb
