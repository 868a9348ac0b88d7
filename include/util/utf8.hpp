// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_UTIL_UTF8_HPP
#define COMMITLOG_UTIL_UTF8_HPP

#include <string>
#include <string_view>

namespace commitlog {
namespace util {

/**
 * Return `bytes` as valid UTF-8
 *
 * Every maximal ill-formed subsequence (truncated sequence, stray
 * continuation byte, overlong form, surrogate, code point above U+10FFFF)
 * is replaced by U+FFFD. Valid input is returned unchanged.
 */
std::string SanitizeUtf8(std::string_view bytes);

bool IsValidUtf8(std::string_view bytes);

} // namespace util
} // namespace commitlog

#endif // COMMITLOG_UTIL_UTF8_HPP
