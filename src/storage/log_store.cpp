// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/log_store.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include "util/utf8.hpp"
#include <utility>

namespace commitlog {
namespace storage {

namespace {

constexpr size_t WRITE_CHUNK_SIZE = 64 * 1024;

void write_lines(OutputStream &stream, const LineSource &lines) {
  std::string chunk;
  std::string line;
  while (lines(line)) {
    // Files hold UTF-8 only; ill-formed bytes are stored as U+FFFD
    if (util::IsValidUtf8(line)) {
      chunk += line;
    } else {
      chunk += util::SanitizeUtf8(line);
    }
    chunk.push_back('\n');
    if (chunk.size() >= WRITE_CHUNK_SIZE) {
      stream.write(chunk);
      chunk.clear();
    }
  }
  if (!chunk.empty()) {
    stream.write(chunk);
  }
}

/**
 * Owns one staging attempt: the open stream and the temporary file.
 *
 * On destruction the stream is closed if still open, then the temporary
 * file is deleted unless it was published. Cleanup failures are logged
 * and never replace the exception already in flight.
 */
class StagingGuard {
public:
  StagingGuard(FileSystem &fs, LogPath temp,
               std::unique_ptr<OutputStream> stream)
      : fs_(fs), temp_(std::move(temp)), stream_(std::move(stream)) {}

  ~StagingGuard() {
    if (stream_) {
      auto stream = std::move(stream_);
      try {
        stream->close();
      } catch (const std::exception &e) {
        LOG_STORAGE_WARN("failed to close staging file {}: {}", temp_.str(),
                         e.what());
      }
    }
    if (!published_) {
      try {
        if (!fs_.remove(temp_, false)) {
          LOG_STORAGE_TRACE("staging file {} already gone", temp_.str());
        }
      } catch (const std::exception &e) {
        LOG_STORAGE_WARN("failed to delete staging file {}: {}", temp_.str(),
                         e.what());
      }
    }
  }

  StagingGuard(const StagingGuard &) = delete;
  StagingGuard &operator=(const StagingGuard &) = delete;

  OutputStream &stream() { return *stream_; }

  // Closes exactly once; the stream is released even if close() throws
  void close_stream() {
    auto stream = std::move(stream_);
    stream->close();
  }

  void mark_published() { published_ = true; }

private:
  FileSystem &fs_;
  LogPath temp_;
  std::unique_ptr<OutputStream> stream_;
  bool published_ = false;
};

} // anonymous namespace

// ============================================================================
// LogStore
// ============================================================================

void LogStore::write(const LogPath &path, const std::vector<std::string> &lines,
                     bool overwrite) {
  size_t i = 0;
  write(
      path,
      [&](std::string &line) {
        if (i == lines.size()) {
          return false;
        }
        line = lines[i++];
        return true;
      },
      overwrite);
}

std::vector<std::string> LogStore::read_all(const LogPath &path) {
  std::vector<std::string> lines;
  auto reader = read(path);
  std::string line;
  while (reader.next(line)) {
    lines.push_back(std::move(line));
  }
  return lines;
}

// ============================================================================
// FileSystemLogStore
// ============================================================================

FileSystemLogStore::FileSystemLogStore(std::shared_ptr<FileSystem> fs,
                                       std::shared_ptr<TokenSource> tokens)
    : fs_(std::move(fs)), temp_paths_(std::move(tokens)) {}

LineReader FileSystemLogStore::read(const LogPath &path) {
  return LineReader(fs_->open_for_read(path));
}

DirectoryListing FileSystemLogStore::list_from(const LogPath &path) {
  const auto parent = path.parent();
  if (!fs_->exists(parent)) {
    throw FileNotFoundError(parent.str());
  }
  return DirectoryListing(fs_->list_status(parent), path.name());
}

void FileSystemLogStore::write(const LogPath &path, const LineSource &lines,
                               bool overwrite) {
  const auto parent = path.parent();
  if (!fs_->exists(parent)) {
    throw FileNotFoundError(parent.str());
  }

  if (overwrite) {
    write_overwrite(path, lines);
  } else {
    write_with_rename(path, lines);
  }
}

std::string
FileSystemLogStore::resolve_path_on_physical_storage(const LogPath &path) {
  return fs_->make_qualified(path);
}

void FileSystemLogStore::write_overwrite(const LogPath &path,
                                         const LineSource &lines) {
  auto stream = fs_->open_for_write(path, true);
  write_lines(*stream, lines);
  stream->close();
  LOG_STORAGE_DEBUG("wrote {} (overwrite)", path.str());
}

void FileSystemLogStore::write_with_rename(const LogPath &path,
                                           const LineSource &lines) {
  if (!fs_->supports_atomic_rename()) {
    throw IllegalStateError("Backend '" + fs_->scheme() +
                                "' cannot publish " + path.str() +
                                " without overwriting: rename is not atomic",
                            path.str());
  }

  // Advisory only; the rename below is what decides
  if (fs_->exists(path)) {
    throw FileAlreadyExistsError(path.str());
  }

  const auto temp = temp_paths_.make(path);
  StagingGuard staging(*fs_, temp, fs_->open_for_write(temp, false));

  write_lines(staging.stream(), lines);
  staging.close_stream();

  if (fs_->rename(temp, path)) {
    staging.mark_published();
    LOG_STORAGE_DEBUG("published {}", path.str());
    return;
  }

  if (fs_->exists(path)) {
    LOG_STORAGE_DEBUG("lost publish race for {}", path.str());
    throw FileAlreadyExistsError(path.str());
  }

  LOG_STORAGE_ERROR("rename of {} to {} failed but {} does not exist",
                    temp.str(), path.str(), path.str());
  throw IllegalStateError("Cannot rename " + temp.str() + " to " + path.str(),
                          path.str());
}

} // namespace storage
} // namespace commitlog
