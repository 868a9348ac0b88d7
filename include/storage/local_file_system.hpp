// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_LOCAL_FILE_SYSTEM_HPP
#define COMMITLOG_STORAGE_LOCAL_FILE_SYSTEM_HPP

#include "storage/file_system.hpp"
#include <filesystem>

namespace commitlog {
namespace storage {

/**
 * LocalFileSystem - storage backend on local disk
 *
 * Uses POSIX file descriptors directly. rename() never replaces an
 * existing destination: the source is hard-linked to the destination
 * (link() fails with EEXIST if it is taken) and then unlinked. On file
 * systems without hard links, renameat2(RENAME_NOREPLACE) is used.
 *
 * When `sync` is enabled, files are fsync'd before close and the parent
 * directory is fsync'd after a rename so the publish survives a crash.
 *
 * Relative paths are resolved against `root` (or the working directory
 * if root is empty).
 */
class LocalFileSystem : public FileSystem {
public:
  explicit LocalFileSystem(std::filesystem::path root = {}, bool sync = false);

  bool exists(const LogPath &path) override;
  std::unique_ptr<InputStream> open_for_read(const LogPath &path) override;
  std::unique_ptr<OutputStream> open_for_write(const LogPath &path,
                                               bool overwrite) override;
  std::vector<FileStatus> list_status(const LogPath &dir) override;
  bool rename(const LogPath &src, const LogPath &dst) override;
  bool remove(const LogPath &path, bool recursive) override;
  std::string make_qualified(const LogPath &path) override;
  std::string scheme() const override { return "file"; }
  bool supports_atomic_rename() const override { return true; }

  const std::filesystem::path &root() const { return root_; }

  // Map a LogPath onto the local file system
  std::filesystem::path resolve(const LogPath &path) const;

private:
  std::filesystem::path root_;
  bool sync_;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_LOCAL_FILE_SYSTEM_HPP
