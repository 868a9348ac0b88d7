// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_RPC_REMOTE_FILE_SYSTEM_HPP
#define COMMITLOG_RPC_REMOTE_FILE_SYSTEM_HPP

#include "rpc/protocol.hpp"
#include "storage/file_system.hpp"
#include <utility>  // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace commitlog {
namespace rpc {

/**
 * RemoteFileSystem - storage backend served by a FileServer over TCP
 *
 * Each operation is one blocking request/response on a persistent
 * connection, opened lazily and dropped on any transport error (the next
 * call reconnects; nothing is retried). Calls from several threads are
 * serialized on the connection.
 *
 * Read streams fetch `read_chunk_size` bytes at a time. Write streams
 * stage everything locally and upload it in a single request on close(),
 * so nothing is visible remotely before close() and an abandoned stream
 * leaves no trace.
 */
class RemoteFileSystem : public storage::FileSystem {
public:
  struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = protocol::DEFAULT_PORT;
    size_t read_chunk_size = protocol::DEFAULT_READ_CHUNK;
  };

  explicit RemoteFileSystem(Config config);
  ~RemoteFileSystem() override;

  bool exists(const storage::LogPath &path) override;
  std::unique_ptr<storage::InputStream>
  open_for_read(const storage::LogPath &path) override;
  std::unique_ptr<storage::OutputStream>
  open_for_write(const storage::LogPath &path, bool overwrite) override;
  std::vector<storage::FileStatus>
  list_status(const storage::LogPath &dir) override;
  bool rename(const storage::LogPath &src,
              const storage::LogPath &dst) override;
  bool remove(const storage::LogPath &path, bool recursive) override;
  std::string make_qualified(const storage::LogPath &path) override;
  std::string scheme() const override { return protocol::URI_SCHEME; }

  // The server publishes through LocalFileSystem::rename
  bool supports_atomic_rename() const override { return true; }

  const Config &config() const { return config_; }

  /**
   * Send one request and wait for its response
   * Throws the StorageError reported by the server, or IOError on
   * transport failure.
   */
  nlohmann::json Call(const nlohmann::json &request);

  void Disconnect();

private:
  void connect_locked();
  void disconnect_locked();

  Config config_;
  std::mutex mutex_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  boost::asio::streambuf buffer_;
};

} // namespace rpc
} // namespace commitlog

#endif // COMMITLOG_RPC_REMOTE_FILE_SYSTEM_HPP
