// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_UTIL_STRENCODINGS_HPP
#define COMMITLOG_UTIL_STRENCODINGS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace commitlog {
namespace util {

// Lower-case hex encoding of raw bytes
std::string HexStr(std::string_view bytes);

// Inverse of HexStr; nullopt on odd length or a non-hex character
std::optional<std::string> ParseHex(std::string_view hex);

} // namespace util
} // namespace commitlog

#endif // COMMITLOG_UTIL_STRENCODINGS_HPP
