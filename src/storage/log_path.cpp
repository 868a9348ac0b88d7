// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/log_path.hpp"
#include <utility>

namespace commitlog {
namespace storage {

LogPath::LogPath(std::string path) : path_(std::move(path)) {
  while (path_.size() > 1 && path_.back() == '/') {
    path_.pop_back();
  }
}

LogPath LogPath::parent() const {
  auto pos = path_.rfind('/');
  if (pos == std::string::npos) {
    return LogPath(".");
  }
  if (pos == 0) {
    return LogPath("/");
  }
  return LogPath(path_.substr(0, pos));
}

std::string LogPath::name() const {
  if (is_root()) {
    return "";
  }
  auto pos = path_.rfind('/');
  if (pos == std::string::npos) {
    return path_;
  }
  return path_.substr(pos + 1);
}

LogPath LogPath::child(const std::string &name) const {
  if (path_.empty() || path_ == ".") {
    return LogPath(name);
  }
  if (is_root()) {
    return LogPath("/" + name);
  }
  return LogPath(path_ + "/" + name);
}

} // namespace storage
} // namespace commitlog
