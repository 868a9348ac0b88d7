// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_APP_CONFIG_HPP
#define COMMITLOG_APP_CONFIG_HPP

#include "rpc/protocol.hpp"
#include "storage/file_system.hpp"
#include "storage/log_store.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace commitlog {
namespace app {

/**
 * StoreConfig - settings for the commitlog tool and file server
 *
 * Loaded from an optional JSON file, then overridden by command line
 * flags. Keys in the file use the member names below.
 */
struct StoreConfig {
  std::string backend = "local"; // "local" or "remote"
  std::filesystem::path root;    // local base dir / served root
  std::string host = "127.0.0.1";
  uint16_t port = rpc::protocol::DEFAULT_PORT;
  bool sync = false;
  std::string log_level = "info";
  std::string log_file; // empty = stderr
  size_t chunk_size = rpc::protocol::DEFAULT_READ_CHUNK;
  size_t io_threads = 2;
};

/**
 * Merge settings from a JSON config file into `config`
 * @return false (with `error` set) if the file is unreadable, not a JSON
 *         object, or a known key has the wrong type
 */
bool LoadConfigFile(const std::filesystem::path &file, StoreConfig &config,
                    std::string &error);

/**
 * Build the backend selected by config.backend
 * Throws std::invalid_argument for an unknown backend name.
 */
std::shared_ptr<storage::FileSystem> MakeFileSystem(const StoreConfig &config);

std::unique_ptr<storage::LogStore> MakeLogStore(const StoreConfig &config);

} // namespace app
} // namespace commitlog

#endif // COMMITLOG_APP_CONFIG_HPP
