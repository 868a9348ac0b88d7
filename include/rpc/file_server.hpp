// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_RPC_FILE_SERVER_HPP
#define COMMITLOG_RPC_FILE_SERVER_HPP

#include "rpc/protocol.hpp"
#include "storage/local_file_system.hpp"
#include <atomic>
#include <utility>  // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace commitlog {
namespace rpc {

class FileSession;

/**
 * FileServer - serves a local directory to RemoteFileSystem clients
 *
 * Every request is executed against a LocalFileSystem rooted at
 * Config::root, so renames keep their no-replace semantics and remote
 * clients may publish with create-if-absent writes. Client paths are
 * interpreted relative to the root; ".." components are rejected.
 *
 * Connections are served by `io_threads` threads running one
 * boost::asio::io_context.
 */
class FileServer {
public:
  struct Config {
    std::filesystem::path root;
    std::string bind_address = "127.0.0.1";
    uint16_t port = protocol::DEFAULT_PORT; // 0 picks an ephemeral port
    size_t io_threads = 2;
    bool sync = false;
  };

  explicit FileServer(Config config);
  ~FileServer();

  FileServer(const FileServer &) = delete;
  FileServer &operator=(const FileServer &) = delete;

  /**
   * Bind and start serving
   * @return false if the address could not be bound
   */
  bool Start();

  /**
   * Stop serving and close all client connections
   */
  void Stop();

  bool IsRunning() const { return running_; }

  // Port actually bound (useful with Config::port == 0)
  uint16_t port() const { return bound_port_; }

  /**
   * Execute one decoded request; never throws
   */
  nlohmann::json HandleRequest(const nlohmann::json &request);

private:
  friend class FileSession;

  void do_accept();
  bool register_session(const std::shared_ptr<FileSession> &session);

  // Map a client path to a path under the served root
  storage::LogPath confine(const std::string &path) const;

  nlohmann::json execute(const nlohmann::json &request);

  Config config_;
  storage::LocalFileSystem fs_;

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> io_threads_;

  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<FileSession>> sessions_;

  std::atomic<bool> running_{false};
  uint16_t bound_port_ = 0;
};

} // namespace rpc
} // namespace commitlog

#endif // COMMITLOG_RPC_FILE_SERVER_HPP
