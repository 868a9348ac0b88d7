// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/file_server.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace commitlog {
namespace rpc {

namespace {

json ErrorResponse(const std::string &message) {
  return {{"ok", false},
          {"error", storage::ErrorKindToString(storage::ErrorKind::IOFailure)},
          {"message", message},
          {"path", ""}};
}

} // anonymous namespace

// ============================================================================
// FileSession - one client connection
// ============================================================================

class FileSession : public std::enable_shared_from_this<FileSession> {
public:
  FileSession(FileServer &server, boost::asio::ip::tcp::socket socket)
      : server_(server), socket_(std::move(socket)),
        buffer_(protocol::MAX_MESSAGE_SIZE) {
    boost::system::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
      remote_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
  }

  void start() { do_read(); }

  void close() {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

private:
  void do_read() {
    boost::asio::async_read_until(
        socket_, buffer_, '\n',
        [this, self = shared_from_this()](const boost::system::error_code &ec,
                                          size_t bytes_transferred) {
          if (ec == boost::asio::error::not_found) {
            // Line exceeded MAX_MESSAGE_SIZE; answer once, then hang up
            LOG_RPC_WARN("oversized request from {}", remote_);
            reply_ = ErrorResponse(
                "Request exceeds " + std::to_string(protocol::MAX_MESSAGE_SIZE) +
                " bytes")
                         .dump();
            reply_.push_back('\n');
            close_after_write_ = true;
            do_write();
            return;
          }
          if (ec) {
            if (ec != boost::asio::error::eof &&
                ec != boost::asio::error::operation_aborted) {
              LOG_RPC_TRACE("read error from {}: {}", remote_, ec.message());
            }
            close();
            return;
          }

          std::string line(
              boost::asio::buffers_begin(buffer_.data()),
              boost::asio::buffers_begin(buffer_.data()) + bytes_transferred);
          buffer_.consume(bytes_transferred);

          json response;
          try {
            response = server_.HandleRequest(json::parse(line));
          } catch (const json::exception &e) {
            LOG_RPC_WARN("malformed request from {}: {}", remote_, e.what());
            response = ErrorResponse(std::string("Malformed request: ") +
                                     e.what());
          } catch (const std::exception &e) {
            LOG_RPC_ERROR("request from {} failed: {}", remote_, e.what());
            response = ErrorResponse(e.what());
          }

          reply_ = response.dump(-1, ' ', false,
                                 json::error_handler_t::replace);
          reply_.push_back('\n');
          do_write();
        });
  }

  void do_write() {
    boost::asio::async_write(
        socket_, boost::asio::buffer(reply_),
        [this, self = shared_from_this()](const boost::system::error_code &ec,
                                          size_t) {
          if (ec) {
            LOG_RPC_TRACE("write error to {}: {}", remote_, ec.message());
            close();
            return;
          }
          if (close_after_write_) {
            close();
            return;
          }
          do_read();
        });
  }

  FileServer &server_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::streambuf buffer_;
  std::string reply_;
  std::string remote_;
  bool close_after_write_ = false;
};

// ============================================================================
// FileServer
// ============================================================================

FileServer::FileServer(Config config)
    : config_(std::move(config)), fs_(config_.root, config_.sync) {}

FileServer::~FileServer() { Stop(); }

bool FileServer::Start() {
  if (running_) {
    return true;
  }

  try {
    using boost::asio::ip::tcp;
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.bind_address),
                           config_.port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const boost::system::system_error &e) {
    LOG_RPC_ERROR("failed to listen on {}:{}: {}", config_.bind_address,
                  config_.port, e.what());
    acceptor_.reset();
    return false;
  }

  io_context_.restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));

  running_ = true;
  do_accept();

  const size_t threads = std::max<size_t>(1, config_.io_threads);
  for (size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  LOG_RPC_INFO("file server listening on {}:{} (root: {})",
               config_.bind_address, bound_port_, config_.root.string());
  return true;
}

void FileServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Closing the acceptor and every socket aborts all pending operations,
  // after which the io threads run out of work and return
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    if (acceptor_) {
      acceptor_->close(ec);
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto &weak : sessions_) {
      if (auto session = weak.lock()) {
        session->close();
      }
    }
    sessions_.clear();
  });

  work_guard_.reset();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  LOG_RPC_INFO("file server stopped");
}

void FileServer::do_accept() {
  acceptor_->async_accept(
      [this](const boost::system::error_code &ec,
             boost::asio::ip::tcp::socket socket) {
        if (ec) {
          if (ec != boost::asio::error::operation_aborted) {
            LOG_RPC_WARN("accept failed: {}", ec.message());
          }
        } else {
          auto session = std::make_shared<FileSession>(*this, std::move(socket));
          if (register_session(session)) {
            session->start();
          } else {
            session->close();
          }
        }

        if (running_ && acceptor_->is_open()) {
          do_accept();
        }
      });
}

bool FileServer::register_session(const std::shared_ptr<FileSession> &session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (!running_) {
    return false;
  }
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [](const std::weak_ptr<FileSession> &weak) {
                                   return weak.expired();
                                 }),
                  sessions_.end());
  sessions_.push_back(session);
  return true;
}

storage::LogPath FileServer::confine(const std::string &path) const {
  std::string relative;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t slash = path.find('/', pos);
    if (slash == std::string::npos) {
      slash = path.size();
    }
    std::string part = path.substr(pos, slash - pos);
    pos = slash + 1;

    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      throw storage::IOError("Path escapes served root: " + path, path);
    }
    if (!relative.empty()) {
      relative.push_back('/');
    }
    relative += part;
  }
  return relative.empty() ? storage::LogPath(".") : storage::LogPath(relative);
}

json FileServer::HandleRequest(const json &request) {
  try {
    return execute(request);
  } catch (const storage::StorageError &e) {
    LOG_RPC_DEBUG("request failed: {} ({})", e.what(),
                  storage::ErrorKindToString(e.kind()));
    return {{"ok", false},
            {"error", storage::ErrorKindToString(e.kind())},
            {"message", e.what()},
            {"path", e.path()}};
  } catch (const json::exception &e) {
    return ErrorResponse(std::string("Malformed request: ") + e.what());
  } catch (const std::exception &e) {
    LOG_RPC_ERROR("request failed: {}", e.what());
    return ErrorResponse(e.what());
  }
}

json FileServer::execute(const json &request) {
  const std::string op = request.at("op").get<std::string>();
  LOG_RPC_TRACE("request: {}", op);

  if (op == protocol::ops::EXISTS) {
    auto path = confine(request.at("path").get<std::string>());
    return {{"ok", true}, {"exists", fs_.exists(path)}};
  }

  if (op == protocol::ops::STAT) {
    const auto client_path = request.at("path").get<std::string>();
    auto path = confine(client_path);
    if (!fs_.exists(path)) {
      throw storage::FileNotFoundError(client_path);
    }
    auto local = fs_.resolve(path);
    std::error_code ec;
    bool is_directory = std::filesystem::is_directory(local, ec);
    uint64_t size = is_directory ? 0 : std::filesystem::file_size(local, ec);
    if (ec) {
      throw storage::IOError("stat failed on " + client_path + ": " +
                                 ec.message(),
                             client_path);
    }
    return {{"ok", true}, {"size", size}, {"is_directory", is_directory}};
  }

  if (op == protocol::ops::READ) {
    auto path = confine(request.at("path").get<std::string>());
    const auto offset = request.at("offset").get<uint64_t>();
    const auto length = std::min<size_t>(request.at("length").get<size_t>(),
                                         protocol::MAX_READ_CHUNK);

    auto stream = fs_.open_for_read(path);
    stream->skip(offset);
    std::string data(length, '\0');
    size_t total = 0;
    while (total < length) {
      size_t n = stream->read(data.data() + total, length - total);
      if (n == 0) {
        break;
      }
      total += n;
    }
    stream->close();
    data.resize(total);
    return {{"ok", true}, {"data", util::HexStr(data)}, {"eof", total < length}};
  }

  if (op == protocol::ops::PUT) {
    auto path = confine(request.at("path").get<std::string>());
    const auto overwrite = request.value("overwrite", false);
    auto data = util::ParseHex(request.at("data").get<std::string>());
    if (!data) {
      throw storage::IOError("Malformed payload for " + path.str(), path.str());
    }

    auto stream = fs_.open_for_write(path, overwrite);
    try {
      stream->write(*data);
      stream->close();
    } catch (const storage::StorageError &) {
      // Do not leave a half-written file behind a failed create
      stream.reset();
      if (!overwrite) {
        try {
          fs_.remove(path, false);
        } catch (const storage::StorageError &e) {
          LOG_RPC_WARN("failed to remove partial {}: {}", path.str(), e.what());
        }
      }
      throw;
    }
    return {{"ok", true}, {"size", data->size()}};
  }

  if (op == protocol::ops::LIST) {
    auto path = confine(request.at("path").get<std::string>());
    json entries = json::array();
    for (const auto &status : fs_.list_status(path)) {
      entries.push_back({{"name", status.name()},
                         {"size", status.size},
                         {"mtime", status.modification_time},
                         {"is_directory", status.is_directory}});
    }
    return {{"ok", true}, {"entries", entries}};
  }

  if (op == protocol::ops::RENAME) {
    auto src = confine(request.at("src").get<std::string>());
    auto dst = confine(request.at("dst").get<std::string>());
    return {{"ok", true}, {"renamed", fs_.rename(src, dst)}};
  }

  if (op == protocol::ops::DELETE) {
    auto path = confine(request.at("path").get<std::string>());
    const auto recursive = request.value("recursive", false);
    return {{"ok", true}, {"deleted", fs_.remove(path, recursive)}};
  }

  throw storage::IOError("Unknown operation: " + op);
}

} // namespace rpc
} // namespace commitlog
