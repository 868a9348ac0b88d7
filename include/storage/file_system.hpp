// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_FILE_SYSTEM_HPP
#define COMMITLOG_STORAGE_FILE_SYSTEM_HPP

#include "storage/log_path.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace commitlog {
namespace storage {

/**
 * Abstract storage backend interface
 *
 * Allows dependency injection of different backends:
 * - LocalFileSystem: POSIX files on local disk
 * - RemoteFileSystem: files served by a FileServer over TCP
 * - SimulatedFileSystem: in-memory backend with fault injection for testing
 *
 * All calls are synchronous and blocking. Failures are reported by
 * throwing StorageError subclasses (see storage/errors.hpp).
 */

/**
 * FileStatus - one directory entry as reported by the backend
 */
struct FileStatus {
  LogPath path;
  uint64_t size = 0;
  int64_t modification_time = 0; // milliseconds since epoch
  bool is_directory = false;

  std::string name() const { return path.name(); }
};

/**
 * InputStream - forward-only byte source
 *
 * close() is idempotent. Destructors release the handle without throwing.
 */
class InputStream {
public:
  virtual ~InputStream() = default;

  /**
   * Read up to `size` bytes into `buffer`
   * @return number of bytes read, 0 at end of stream
   */
  virtual size_t read(char *buffer, size_t size) = 0;

  /**
   * Advance the read position by `offset` bytes (or to end of stream)
   * The default implementation reads and discards.
   */
  virtual void skip(uint64_t offset);

  virtual void close() = 0;
};

/**
 * OutputStream - byte sink
 *
 * Data is only guaranteed to reach the backend once close() returns
 * without throwing. close() is idempotent.
 */
class OutputStream {
public:
  virtual ~OutputStream() = default;

  virtual void write(const char *data, size_t size) = 0;

  void write(const std::string &data) { write(data.data(), data.size()); }

  virtual void close() = 0;
};

class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual bool exists(const LogPath &path) = 0;

  /**
   * Open a file for reading
   * Throws FileNotFoundError if the file does not exist
   */
  virtual std::unique_ptr<InputStream> open_for_read(const LogPath &path) = 0;

  /**
   * Open a file for writing
   * @param overwrite If true an existing file is truncated and replaced;
   *        if false the open fails with FileAlreadyExistsError
   */
  virtual std::unique_ptr<OutputStream> open_for_write(const LogPath &path,
                                                       bool overwrite) = 0;

  /**
   * List the entries of a directory (unordered)
   * Throws FileNotFoundError if the directory does not exist
   */
  virtual std::vector<FileStatus> list_status(const LogPath &dir) = 0;

  /**
   * Rename src to dst
   * @return true if the rename took effect, false if the backend refused
   *         it (e.g. dst exists or src is missing)
   *
   * Whether an existing dst is overwritten is backend specific, see
   * supports_atomic_rename().
   */
  virtual bool rename(const LogPath &src, const LogPath &dst) = 0;

  /**
   * Delete a file (or a directory when recursive)
   * @return true if something was deleted
   */
  virtual bool remove(const LogPath &path, bool recursive) = 0;

  /**
   * Fully qualified form of path, including the backend scheme
   */
  virtual std::string make_qualified(const LogPath &path) = 0;

  virtual std::string scheme() const = 0;

  /**
   * True if rename() is all-or-nothing and refuses to overwrite an
   * existing destination. Only such backends may publish with
   * create-if-absent semantics.
   */
  virtual bool supports_atomic_rename() const = 0;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_FILE_SYSTEM_HPP
