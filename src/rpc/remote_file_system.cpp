// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/remote_file_system.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <optional>
#include <cstring>
#include <utility>

using json = nlohmann::json;

namespace commitlog {
namespace rpc {

using storage::IOError;
using storage::LogPath;

namespace {

class RemoteInputStream : public storage::InputStream {
public:
  RemoteInputStream(RemoteFileSystem &fs, LogPath path, size_t chunk_size)
      : fs_(fs), path_(std::move(path)), chunk_size_(chunk_size) {}

  size_t read(char *buffer, size_t size) override {
    if (closed_) {
      throw IOError("Stream is closed: " + path_.str(), path_.str());
    }
    if (pos_ == chunk_.size()) {
      if (eof_) {
        return 0;
      }
      fetch();
      if (chunk_.empty()) {
        return 0;
      }
    }
    size_t n = std::min(size, chunk_.size() - pos_);
    std::memcpy(buffer, chunk_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  void skip(uint64_t offset) override {
    uint64_t buffered = chunk_.size() - pos_;
    if (offset <= buffered) {
      pos_ += static_cast<size_t>(offset);
      return;
    }
    offset_ += offset - buffered;
    chunk_.clear();
    pos_ = 0;
    eof_ = false;
  }

  void close() override { closed_ = true; }

private:
  void fetch() {
    auto response = fs_.Call({{"op", protocol::ops::READ},
                              {"path", path_.str()},
                              {"offset", offset_},
                              {"length", chunk_size_}});
    std::optional<std::string> data;
    try {
      data = util::ParseHex(response.at("data").get<std::string>());
      eof_ = response.value("eof", false);
    } catch (const json::exception &e) {
      throw IOError("Malformed read response for " + path_.str() + ": " +
                        e.what(),
                    path_.str());
    }
    if (!data) {
      throw IOError("Malformed read response for " + path_.str(), path_.str());
    }
    chunk_ = std::move(*data);
    pos_ = 0;
    offset_ += chunk_.size();
    if (chunk_.empty()) {
      eof_ = true;
    }
  }

  RemoteFileSystem &fs_;
  LogPath path_;
  size_t chunk_size_;
  uint64_t offset_ = 0; // server offset of the next fetch
  std::string chunk_;
  size_t pos_ = 0;
  bool eof_ = false;
  bool closed_ = false;
};

class RemoteOutputStream : public storage::OutputStream {
public:
  RemoteOutputStream(RemoteFileSystem &fs, LogPath path, bool overwrite)
      : fs_(fs), path_(std::move(path)), overwrite_(overwrite) {}

  ~RemoteOutputStream() override {
    if (!closed_) {
      LOG_RPC_TRACE("discarding {} unsent bytes for {}", data_.size(),
                    path_.str());
    }
  }

  void write(const char *data, size_t size) override {
    if (closed_) {
      throw IOError("Stream is closed: " + path_.str(), path_.str());
    }
    if (data_.size() + size > protocol::MAX_PUT_PAYLOAD) {
      throw IOError("Remote file " + path_.str() + " would exceed " +
                        std::to_string(protocol::MAX_PUT_PAYLOAD) +
                        " bytes, the largest single upload",
                    path_.str());
    }
    data_.append(data, size);
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    fs_.Call({{"op", protocol::ops::PUT},
              {"path", path_.str()},
              {"data", util::HexStr(data_)},
              {"overwrite", overwrite_}});
    data_.clear();
  }

private:
  RemoteFileSystem &fs_;
  LogPath path_;
  bool overwrite_;
  std::string data_;
  bool closed_ = false;
};

} // anonymous namespace

RemoteFileSystem::RemoteFileSystem(Config config) : config_(std::move(config)) {
  if (config_.read_chunk_size == 0) {
    config_.read_chunk_size = protocol::DEFAULT_READ_CHUNK;
  }
}

RemoteFileSystem::~RemoteFileSystem() { Disconnect(); }

void RemoteFileSystem::connect_locked() {
  using boost::asio::ip::tcp;
  try {
    tcp::resolver resolver(io_context_);
    auto endpoints =
        resolver.resolve(config_.host, std::to_string(config_.port));
    auto socket = std::make_unique<tcp::socket>(io_context_);
    boost::asio::connect(*socket, endpoints);
    boost::system::error_code opt_ec;
    socket->set_option(tcp::no_delay(true), opt_ec);
    socket_ = std::move(socket);
    buffer_.consume(buffer_.size());
    LOG_RPC_TRACE("connected to {}:{}", config_.host, config_.port);
  } catch (const boost::system::system_error &e) {
    throw IOError("Cannot connect to " + config_.host + ":" +
                  std::to_string(config_.port) + ": " + e.what());
  }
}

void RemoteFileSystem::disconnect_locked() {
  if (!socket_) {
    return;
  }
  boost::system::error_code ec;
  socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_->close(ec);
  socket_.reset();
}

void RemoteFileSystem::Disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_locked();
}

json RemoteFileSystem::Call(const json &request) {
  json response;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
      connect_locked();
    }

    std::string request_str =
        request.dump(-1, ' ', false, json::error_handler_t::replace);
    request_str.push_back('\n');

    try {
      boost::asio::write(*socket_, boost::asio::buffer(request_str));
      size_t n = boost::asio::read_until(*socket_, buffer_, '\n');
      std::string line(boost::asio::buffers_begin(buffer_.data()),
                       boost::asio::buffers_begin(buffer_.data()) + n);
      buffer_.consume(n);
      response = json::parse(line);
    } catch (const boost::system::system_error &e) {
      disconnect_locked();
      throw IOError(std::string("Transport error talking to ") + config_.host +
                    ": " + e.what());
    } catch (const json::exception &e) {
      disconnect_locked();
      throw IOError(std::string("Malformed response: ") + e.what());
    }
  }

  if (!response.value("ok", false)) {
    storage::ThrowStorageError(
        storage::ErrorKindFromString(response.value("error", "")),
        response.value("message", "remote error"),
        response.value("path", ""));
  }
  return response;
}

bool RemoteFileSystem::exists(const LogPath &path) {
  auto response = Call({{"op", protocol::ops::EXISTS}, {"path", path.str()}});
  return response.value("exists", false);
}

std::unique_ptr<storage::InputStream>
RemoteFileSystem::open_for_read(const LogPath &path) {
  auto response = Call({{"op", protocol::ops::STAT}, {"path", path.str()}});
  if (response.value("is_directory", false)) {
    throw IOError("Is a directory: " + path.str(), path.str());
  }
  return std::make_unique<RemoteInputStream>(*this, path,
                                             config_.read_chunk_size);
}

std::unique_ptr<storage::OutputStream>
RemoteFileSystem::open_for_write(const LogPath &path, bool overwrite) {
  return std::make_unique<RemoteOutputStream>(*this, path, overwrite);
}

std::vector<storage::FileStatus>
RemoteFileSystem::list_status(const LogPath &dir) {
  auto response = Call({{"op", protocol::ops::LIST}, {"path", dir.str()}});

  std::vector<storage::FileStatus> result;
  try {
    for (const auto &entry : response.at("entries")) {
      storage::FileStatus status;
      status.path = dir.child(entry.at("name").get<std::string>());
      status.size = entry.value("size", uint64_t(0));
      status.modification_time = entry.value("mtime", int64_t(0));
      status.is_directory = entry.value("is_directory", false);
      result.push_back(std::move(status));
    }
  } catch (const json::exception &e) {
    throw IOError("Malformed list response for " + dir.str() + ": " + e.what(),
                  dir.str());
  }
  return result;
}

bool RemoteFileSystem::rename(const LogPath &src, const LogPath &dst) {
  auto response = Call(
      {{"op", protocol::ops::RENAME}, {"src", src.str()}, {"dst", dst.str()}});
  return response.value("renamed", false);
}

bool RemoteFileSystem::remove(const LogPath &path, bool recursive) {
  auto response = Call({{"op", protocol::ops::DELETE},
                        {"path", path.str()},
                        {"recursive", recursive}});
  return response.value("deleted", false);
}

std::string RemoteFileSystem::make_qualified(const LogPath &path) {
  std::string p = path.str();
  while (!p.empty() && p.front() == '/') {
    p.erase(p.begin());
  }
  if (p == ".") {
    p.clear();
  }
  return scheme() + "://" + config_.host + ":" + std::to_string(config_.port) +
         "/" + p;
}

} // namespace rpc
} // namespace commitlog
