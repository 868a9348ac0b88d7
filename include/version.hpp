// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_VERSION_HPP
#define COMMITLOG_VERSION_HPP

#include "rpc/protocol.hpp"
#include <string>

namespace commitlog {

constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

constexpr const char *COPYRIGHT_YEAR = "2024";

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Shown by --version, together with the default file server endpoint
inline std::string GetFullVersionString() {
  return "commitlog version " + GetVersionString() + " (file server port " +
         std::to_string(rpc::protocol::DEFAULT_PORT) + ", scheme " +
         rpc::protocol::URI_SCHEME + "://)\nCopyright (C) " + COPYRIGHT_YEAR +
         " Coinbase Chain";
}

} // namespace commitlog

#endif // COMMITLOG_VERSION_HPP
