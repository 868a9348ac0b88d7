// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_LOG_STORE_HPP
#define COMMITLOG_STORAGE_LOG_STORE_HPP

#include "storage/directory_listing.hpp"
#include "storage/file_system.hpp"
#include "storage/line_reader.hpp"
#include "storage/temp_path.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace commitlog {
namespace storage {

/**
 * Pull-based source of lines to write
 * Stores the next line in `line` and returns true, or returns false when
 * exhausted.
 */
using LineSource = std::function<bool(std::string &line)>;

/**
 * LogStore - reads, lists and publishes commit files
 *
 * Commit files are named so that byte-wise name order is commit order
 * (e.g. zero-padded versions). Once a commit file exists it is never
 * overwritten by a create-if-absent write.
 *
 * Errors are reported with StorageError subclasses:
 * - FileNotFoundError      the parent directory (or file to read) is missing
 * - FileAlreadyExistsError create-if-absent target is taken; pick the next
 *                          version and try again
 * - IllegalStateError      backend inconsistency; do not retry blindly
 * - IOError                transport failure, surfaced unchanged
 *
 * No operation retries on its own.
 */
class LogStore {
public:
  virtual ~LogStore() = default;

  /**
   * Open `path` and return its lines in file order
   */
  virtual LineReader read(const LogPath &path) = 0;

  /**
   * Entries of path's directory whose name is >= path's name, ascending
   */
  virtual DirectoryListing list_from(const LogPath &path) = 0;

  /**
   * Write `lines` to `path`, each followed by "\n"
   *
   * overwrite == true:  truncate and replace; last writer wins, a failure
   *                     may leave partial content behind
   * overwrite == false: publish only if `path` does not exist yet; readers
   *                     never observe partial content
   *
   * Lines must not contain line terminators.
   */
  virtual void write(const LogPath &path, const LineSource &lines,
                     bool overwrite) = 0;

  void write(const LogPath &path, const std::vector<std::string> &lines,
             bool overwrite);

  /**
   * Fully qualified physical location of `path`
   */
  virtual std::string resolve_path_on_physical_storage(const LogPath &path) = 0;

  /**
   * Read every line of `path`
   */
  std::vector<std::string> read_all(const LogPath &path);
};

/**
 * FileSystemLogStore - LogStore over any FileSystem backend
 *
 * Create-if-absent writes stage the content in a hidden temporary file
 * next to the target and publish it with FileSystem::rename(). The
 * rename is the only commit point, so the backend must refuse to rename
 * onto an existing file (FileSystem::supports_atomic_rename()); on other
 * backends create-if-absent writes are rejected with IllegalStateError.
 */
class FileSystemLogStore : public LogStore {
public:
  explicit FileSystemLogStore(
      std::shared_ptr<FileSystem> fs,
      std::shared_ptr<TokenSource> tokens = std::make_shared<RandomTokenSource>());

  using LogStore::write;

  LineReader read(const LogPath &path) override;
  DirectoryListing list_from(const LogPath &path) override;
  void write(const LogPath &path, const LineSource &lines,
             bool overwrite) override;
  std::string resolve_path_on_physical_storage(const LogPath &path) override;

  FileSystem &file_system() { return *fs_; }

private:
  void write_overwrite(const LogPath &path, const LineSource &lines);
  void write_with_rename(const LogPath &path, const LineSource &lines);

  std::shared_ptr<FileSystem> fs_;
  TempPathGenerator temp_paths_;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_LOG_STORE_HPP
