// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/errors.hpp"

namespace commitlog {
namespace storage {

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::AlreadyExists:
    return "already_exists";
  case ErrorKind::IllegalState:
    return "illegal_state";
  case ErrorKind::IOFailure:
    return "io_failure";
  }
  return "io_failure";
}

ErrorKind ErrorKindFromString(const std::string &name) {
  if (name == "not_found")
    return ErrorKind::NotFound;
  if (name == "already_exists")
    return ErrorKind::AlreadyExists;
  if (name == "illegal_state")
    return ErrorKind::IllegalState;
  return ErrorKind::IOFailure;
}

void ThrowStorageError(ErrorKind kind, const std::string &message,
                       const std::string &path) {
  switch (kind) {
  case ErrorKind::NotFound:
    // Message is rebuilt from the path so it reads the same on both sides
    throw FileNotFoundError(path.empty() ? message : path);
  case ErrorKind::AlreadyExists:
    throw FileAlreadyExistsError(path.empty() ? message : path);
  case ErrorKind::IllegalState:
    throw IllegalStateError(message, path);
  case ErrorKind::IOFailure:
    break;
  }
  throw IOError(message, path);
}

} // namespace storage
} // namespace commitlog
