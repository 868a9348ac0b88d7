// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/utf8.hpp"
#include <cstdint>

namespace commitlog {
namespace util {

namespace {

constexpr const char *kReplacement = "\xEF\xBF\xBD";

// Length of the valid sequence starting at bytes[i], or 0 if ill-formed.
// `consumed` receives the length of the maximal ill-formed prefix to skip.
size_t valid_sequence_length(std::string_view bytes, size_t i,
                             size_t &consumed) {
  const auto b0 = static_cast<uint8_t>(bytes[i]);
  consumed = 1;
  if (b0 < 0x80) {
    return 1;
  }

  size_t len;
  uint8_t lo = 0x80, hi = 0xBF; // bounds for the second byte
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0)
      lo = 0xA0; // overlong
    if (b0 == 0xED)
      hi = 0x9F; // surrogates
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0)
      lo = 0x90; // overlong
    if (b0 == 0xF4)
      hi = 0x8F; // above U+10FFFF
  } else {
    return 0;
  }

  for (size_t k = 1; k < len; ++k) {
    if (i + k >= bytes.size()) {
      return 0;
    }
    const auto b = static_cast<uint8_t>(bytes[i + k]);
    const uint8_t min = (k == 1) ? lo : 0x80;
    const uint8_t max = (k == 1) ? hi : 0xBF;
    if (b < min || b > max) {
      return 0;
    }
    consumed = k + 1;
  }
  return len;
}

} // anonymous namespace

std::string SanitizeUtf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    size_t consumed = 1;
    size_t len = valid_sequence_length(bytes, i, consumed);
    if (len == 0) {
      out.append(kReplacement);
      i += consumed;
    } else {
      out.append(bytes.substr(i, len));
      i += len;
    }
  }
  return out;
}

bool IsValidUtf8(std::string_view bytes) {
  size_t i = 0;
  while (i < bytes.size()) {
    size_t consumed = 1;
    size_t len = valid_sequence_length(bytes, i, consumed);
    if (len == 0) {
      return false;
    }
    i += len;
  }
  return true;
}

} // namespace util
} // namespace commitlog
