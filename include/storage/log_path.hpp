// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_LOG_PATH_HPP
#define COMMITLOG_STORAGE_LOG_PATH_HPP

#include <compare>
#include <string>

namespace commitlog {
namespace storage {

/**
 * LogPath - backend-neutral path of a file inside a log directory
 *
 * Always '/'-separated regardless of backend. Trailing separators are
 * dropped so that parent()/name() are well defined. A path without any
 * separator lives in ".".
 *
 * Ordering and equality are byte-wise on the full string; commit ordering
 * within a directory uses name() only.
 */
class LogPath {
public:
  LogPath() = default;
  LogPath(std::string path);
  LogPath(const char *path) : LogPath(std::string(path)) {}

  const std::string &str() const { return path_; }
  bool empty() const { return path_.empty(); }
  bool is_root() const { return path_ == "/"; }

  LogPath parent() const;
  std::string name() const;
  LogPath child(const std::string &name) const;

  auto operator<=>(const LogPath &) const = default;

private:
  std::string path_;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_LOG_PATH_HPP
