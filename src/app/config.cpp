// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/config.hpp"
#include "rpc/remote_file_system.hpp"
#include "storage/local_file_system.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace commitlog {
namespace app {

bool LoadConfigFile(const std::filesystem::path &file, StoreConfig &config,
                    std::string &error) {
  auto contents = util::read_file_string(file);
  if (!contents) {
    error = "cannot read config file " + file.string();
    return false;
  }

  json j;
  try {
    j = json::parse(*contents);
  } catch (const json::exception &e) {
    error = "failed to parse " + file.string() + ": " + e.what();
    return false;
  }
  if (!j.is_object()) {
    error = file.string() + ": top level must be a JSON object";
    return false;
  }

  StoreConfig loaded = config;
  for (const auto &[key, value] : j.items()) {
    auto wrong_type = [&](const char *expected) {
      error = file.string() + ": '" + key + "' must be " + expected;
      return false;
    };

    if (key == "backend" || key == "host" || key == "log_level" ||
        key == "log_file" || key == "root") {
      if (!value.is_string()) {
        return wrong_type("a string");
      }
      const auto s = value.get<std::string>();
      if (key == "backend")
        loaded.backend = s;
      else if (key == "host")
        loaded.host = s;
      else if (key == "log_level")
        loaded.log_level = s;
      else if (key == "log_file")
        loaded.log_file = s;
      else
        loaded.root = s;
    } else if (key == "port") {
      if (!value.is_number_unsigned() ||
          value.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
        return wrong_type("a port number");
      }
      loaded.port = value.get<uint16_t>();
    } else if (key == "chunk_size" || key == "io_threads") {
      if (!value.is_number_unsigned() || value.get<uint64_t>() == 0) {
        return wrong_type("a positive integer");
      }
      if (key == "chunk_size")
        loaded.chunk_size = value.get<size_t>();
      else
        loaded.io_threads = value.get<size_t>();
    } else if (key == "sync") {
      if (!value.is_boolean()) {
        return wrong_type("a boolean");
      }
      loaded.sync = value.get<bool>();
    } else {
      LOG_WARN("{}: ignoring unknown config key '{}'", file.string(), key);
    }
  }

  config = loaded;
  return true;
}

std::shared_ptr<storage::FileSystem> MakeFileSystem(const StoreConfig &config) {
  if (config.backend == "local") {
    return std::make_shared<storage::LocalFileSystem>(config.root, config.sync);
  }
  if (config.backend == "remote") {
    rpc::RemoteFileSystem::Config remote;
    remote.host = config.host;
    remote.port = config.port;
    remote.read_chunk_size = config.chunk_size;
    return std::make_shared<rpc::RemoteFileSystem>(remote);
  }
  throw std::invalid_argument("Unknown backend: " + config.backend);
}

std::unique_ptr<storage::LogStore> MakeLogStore(const StoreConfig &config) {
  return std::make_unique<storage::FileSystemLogStore>(MakeFileSystem(config));
}

} // namespace app
} // namespace commitlog
