// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/local_file_system.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif

#ifndef RENAME_NOREPLACE
#define RENAME_NOREPLACE (1 << 0)
#endif

namespace fs = std::filesystem;

namespace commitlog {
namespace storage {

namespace {

std::string GetErrorReason(int err) { return std::strerror(err); }

// Sync directory to ensure rename is durable
bool sync_directory(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0)
    return false;
  bool result = ::fsync(fd) == 0;
  ::close(fd);
  return result;
}

int64_t modification_time_ms(const struct stat &st) {
  return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
         st.st_mtim.tv_nsec / 1000000;
}

// Rename without replacing an existing destination when hard links are
// unavailable. Returns 0 or -1 with errno set.
int rename_noreplace(const fs::path &src, const fs::path &dst) {
#if defined(__linux__) && defined(SYS_renameat2)
  return static_cast<int>(::syscall(SYS_renameat2, AT_FDCWD, src.c_str(),
                                    AT_FDCWD, dst.c_str(), RENAME_NOREPLACE));
#else
  errno = ENOTSUP;
  return -1;
#endif
}

class LocalInputStream : public InputStream {
public:
  LocalInputStream(int fd, std::string path)
      : fd_(fd), path_(std::move(path)) {}

  ~LocalInputStream() override {
    if (fd_ != -1) {
      ::close(fd_);
    }
  }

  size_t read(char *buffer, size_t size) override {
    if (fd_ == -1) {
      throw IOError("Stream is closed: " + path_, path_);
    }
    while (true) {
      ssize_t n = ::read(fd_, buffer, size);
      if (n >= 0) {
        return static_cast<size_t>(n);
      }
      if (errno == EINTR) {
        continue;
      }
      throw IOError("Read error on " + path_ + ": " + GetErrorReason(errno),
                    path_);
    }
  }

  void skip(uint64_t offset) override {
    if (fd_ == -1) {
      throw IOError("Stream is closed: " + path_, path_);
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_CUR) < 0) {
      throw IOError("Seek error on " + path_ + ": " + GetErrorReason(errno),
                    path_);
    }
  }

  void close() override {
    if (fd_ == -1) {
      return;
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      throw IOError("Close error on " + path_ + ": " + GetErrorReason(errno),
                    path_);
    }
  }

private:
  int fd_;
  std::string path_;
};

class LocalOutputStream : public OutputStream {
public:
  LocalOutputStream(int fd, std::string path, bool sync)
      : fd_(fd), path_(std::move(path)), sync_(sync) {}

  ~LocalOutputStream() override {
    if (fd_ != -1) {
      ::close(fd_);
    }
  }

  void write(const char *data, size_t size) override {
    if (fd_ == -1) {
      throw IOError("Stream is closed: " + path_, path_);
    }
    size_t total = 0;
    while (total < size) {
      ssize_t n = ::write(fd_, data + total, size - total);
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        throw IOError("Write error on " + path_ + ": " + GetErrorReason(errno),
                      path_);
      }
      total += static_cast<size_t>(n);
    }
  }

  void close() override {
    if (fd_ == -1) {
      return;
    }
    int fd = fd_;
    fd_ = -1;
    if (sync_ && ::fsync(fd) != 0) {
      int err = errno;
      ::close(fd);
      throw IOError("fsync failed on " + path_ + ": " + GetErrorReason(err),
                    path_);
    }
    if (::close(fd) != 0) {
      throw IOError("Close error on " + path_ + ": " + GetErrorReason(errno),
                    path_);
    }
  }

private:
  int fd_;
  std::string path_;
  bool sync_;
};

} // anonymous namespace

LocalFileSystem::LocalFileSystem(fs::path root, bool sync)
    : root_(std::move(root)), sync_(sync) {}

fs::path LocalFileSystem::resolve(const LogPath &path) const {
  fs::path p(path.str());
  if (root_.empty() || p.is_absolute()) {
    return p;
  }
  return root_ / p;
}

bool LocalFileSystem::exists(const LogPath &path) {
  struct stat st;
  if (::stat(resolve(path).c_str(), &st) == 0) {
    return true;
  }
  if (errno == ENOENT || errno == ENOTDIR) {
    return false;
  }
  throw IOError("stat failed on " + path.str() + ": " + GetErrorReason(errno),
                path.str());
}

std::unique_ptr<InputStream> LocalFileSystem::open_for_read(const LogPath &path) {
  auto local = resolve(path);
  int fd = ::open(local.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw FileNotFoundError(path.str());
    }
    throw IOError("Failed to open " + path.str() + ": " + GetErrorReason(err),
                  path.str());
  }

  struct stat st;
  if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
    ::close(fd);
    throw IOError("Is a directory: " + path.str(), path.str());
  }

  LOG_FS_TRACE("opened {} for read", local.string());
  return std::make_unique<LocalInputStream>(fd, path.str());
}

std::unique_ptr<OutputStream>
LocalFileSystem::open_for_write(const LogPath &path, bool overwrite) {
  auto local = resolve(path);
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);
  int fd = ::open(local.c_str(), flags, 0644);
  if (fd < 0) {
    int err = errno;
    if (err == EEXIST) {
      throw FileAlreadyExistsError(path.str());
    }
    if (err == ENOENT || err == ENOTDIR) {
      throw FileNotFoundError(path.parent().str());
    }
    throw IOError("Failed to open " + path.str() + " for writing: " +
                      GetErrorReason(err),
                  path.str());
  }

  LOG_FS_TRACE("opened {} for write (overwrite: {})", local.string(),
               overwrite);
  return std::make_unique<LocalOutputStream>(fd, path.str(), sync_);
}

std::vector<FileStatus> LocalFileSystem::list_status(const LogPath &dir) {
  auto local = resolve(dir);

  struct stat dir_st;
  if (::stat(local.c_str(), &dir_st) != 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw FileNotFoundError(dir.str());
    }
    throw IOError("stat failed on " + dir.str() + ": " + GetErrorReason(err),
                  dir.str());
  }
  if (!S_ISDIR(dir_st.st_mode)) {
    throw IOError("Not a directory: " + dir.str(), dir.str());
  }

  std::error_code ec;
  fs::directory_iterator it(local, ec);
  if (ec) {
    throw IOError("Failed to list " + dir.str() + ": " + ec.message(),
                  dir.str());
  }

  std::vector<FileStatus> result;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const auto name = it->path().filename().string();
    struct stat st;
    if (::lstat(it->path().c_str(), &st) != 0) {
      // Entry vanished between readdir and stat (concurrent delete)
      LOG_FS_TRACE("skipping {}: {}", it->path().string(),
                   GetErrorReason(errno));
      continue;
    }

    FileStatus status;
    status.path = dir.child(name);
    status.is_directory = S_ISDIR(st.st_mode);
    status.size = status.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
    status.modification_time = modification_time_ms(st);
    result.push_back(std::move(status));
  }
  if (ec) {
    throw IOError("Failed to list " + dir.str() + ": " + ec.message(),
                  dir.str());
  }

  return result;
}

bool LocalFileSystem::rename(const LogPath &src, const LogPath &dst) {
  auto local_src = resolve(src);
  auto local_dst = resolve(dst);

  if (::link(local_src.c_str(), local_dst.c_str()) == 0) {
    if (::unlink(local_src.c_str()) != 0) {
      // Destination is published; the stale source name is only litter
      LOG_FS_WARN("rename {} -> {}: failed to unlink source: {}", src.str(),
                  dst.str(), GetErrorReason(errno));
    }
  } else {
    int err = errno;
    if (err == EEXIST || err == ENOENT || err == ENOTDIR) {
      LOG_FS_TRACE("rename {} -> {} refused: {}", src.str(), dst.str(),
                   GetErrorReason(err));
      return false;
    }
    if (err != EPERM && err != ENOTSUP && err != EOPNOTSUPP &&
        err != EMLINK && err != EXDEV) {
      throw IOError("Failed to rename " + src.str() + " to " + dst.str() +
                        ": " + GetErrorReason(err),
                    src.str());
    }

    // No hard links on this file system
    if (rename_noreplace(local_src, local_dst) != 0) {
      err = errno;
      if (err == EEXIST || err == ENOENT || err == ENOTDIR) {
        return false;
      }
      throw IOError("Failed to rename " + src.str() + " to " + dst.str() +
                        ": " + GetErrorReason(err),
                    src.str());
    }
  }

  if (sync_ && !sync_directory(local_dst.parent_path())) {
    LOG_FS_WARN("failed to sync directory {}",
                local_dst.parent_path().string());
  }
  return true;
}

bool LocalFileSystem::remove(const LogPath &path, bool recursive) {
  auto local = resolve(path);

  if (recursive) {
    std::error_code ec;
    auto removed = fs::remove_all(local, ec);
    if (ec) {
      throw IOError("Failed to delete " + path.str() + ": " + ec.message(),
                    path.str());
    }
    return removed > 0;
  }

  if (::unlink(local.c_str()) == 0) {
    return true;
  }
  int err = errno;
  if (err == ENOENT || err == ENOTDIR) {
    return false;
  }
  if (err == EISDIR || err == EPERM) {
    if (::rmdir(local.c_str()) == 0) {
      return true;
    }
    err = errno;
  }
  throw IOError("Failed to delete " + path.str() + ": " + GetErrorReason(err),
                path.str());
}

std::string LocalFileSystem::make_qualified(const LogPath &path) {
  std::error_code ec;
  auto absolute = fs::absolute(resolve(path), ec);
  if (ec) {
    throw IOError("Cannot qualify " + path.str() + ": " + ec.message(),
                  path.str());
  }
  return scheme() + "://" + absolute.lexically_normal().generic_string();
}

} // namespace storage
} // namespace commitlog
