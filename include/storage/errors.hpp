// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_ERRORS_HPP
#define COMMITLOG_STORAGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace commitlog {
namespace storage {

/**
 * Failure categories surfaced by the store and its backends
 *
 * NotFound      - a required path or parent directory is absent
 * AlreadyExists - create-if-absent target is already present (benign race)
 * IllegalState  - backend inconsistency, must not be retried by the store
 * IOFailure     - transport-level error (open/read/write/close/list/delete)
 */
enum class ErrorKind {
  NotFound,
  AlreadyExists,
  IllegalState,
  IOFailure
};

std::string ErrorKindToString(ErrorKind kind);

// Unknown names map to IOFailure
ErrorKind ErrorKindFromString(const std::string &name);

/**
 * Base class of every exception thrown by the storage layer
 */
class StorageError : public std::runtime_error {
public:
  StorageError(ErrorKind kind, const std::string &message,
               const std::string &path = "")
      : std::runtime_error(message), kind_(kind), path_(path) {}

  ErrorKind kind() const { return kind_; }
  const std::string &path() const { return path_; }

private:
  ErrorKind kind_;
  std::string path_;
};

class FileNotFoundError : public StorageError {
public:
  explicit FileNotFoundError(const std::string &path)
      : StorageError(ErrorKind::NotFound,
                     "No such file or directory: " + path, path) {}
};

class FileAlreadyExistsError : public StorageError {
public:
  explicit FileAlreadyExistsError(const std::string &path)
      : StorageError(ErrorKind::AlreadyExists, path, path) {}
};

class IllegalStateError : public StorageError {
public:
  explicit IllegalStateError(const std::string &message,
                             const std::string &path = "")
      : StorageError(ErrorKind::IllegalState, message, path) {}
};

class IOError : public StorageError {
public:
  explicit IOError(const std::string &message, const std::string &path = "")
      : StorageError(ErrorKind::IOFailure, message, path) {}
};

/**
 * Rethrow a StorageError of the concrete class matching `kind`
 * Used by the remote client to surface server-side failures unchanged.
 */
[[noreturn]] void ThrowStorageError(ErrorKind kind, const std::string &message,
                                    const std::string &path);

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_ERRORS_HPP
