// Copyright (c) 2024 Coinbase Chain
// Simulated storage backend for testing

#include "storage/simulated_file_system.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

namespace commitlog {
namespace storage {

// ============================================================================
// Simulated streams
// ============================================================================

class SimulatedInputStream : public InputStream {
public:
  SimulatedInputStream(SimulatedFileSystem *fs, std::string key)
      : fs_(fs), key_(std::move(key)) {}

  ~SimulatedInputStream() override {
    if (!closed_) {
      closed_ = true;
      fs_->finish_input();
    }
  }

  size_t read(char *buffer, size_t size) override {
    if (closed_) {
      throw IOError("Stream is closed: " + key_, key_);
    }
    size_t n = 0;
    if (!fs_->read_at(key_, offset_, buffer, size, n)) {
      throw IOError("Simulated read failure on " + key_, key_);
    }
    offset_ += n;
    return n;
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    fs_->finish_input();
  }

private:
  SimulatedFileSystem *fs_;
  std::string key_;
  size_t offset_ = 0;
  bool closed_ = false;
};

class SimulatedOutputStream : public OutputStream {
public:
  SimulatedOutputStream(SimulatedFileSystem *fs, std::string key)
      : fs_(fs), key_(std::move(key)) {}

  ~SimulatedOutputStream() override {
    if (!closed_) {
      closed_ = true;
      fs_->finish_output(false);
    }
  }

  void write(const char *data, size_t size) override {
    if (closed_) {
      throw IOError("Stream is closed: " + key_, key_);
    }
    fs_->append(key_, data, size, written_);
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    fs_->finish_output(true);
  }

private:
  SimulatedFileSystem *fs_;
  std::string key_;
  size_t written_ = 0;
  bool closed_ = false;
};

// ============================================================================
// SimulatedFileSystem
// ============================================================================

SimulatedFileSystem::SimulatedFileSystem() {
  nodes_["/"] = Node{true, "", 0};
  nodes_["."] = Node{true, "", 0};
}

SimulatedFileSystem::~SimulatedFileSystem() {
  if (open_inputs_ != 0 || open_outputs_ != 0) {
    LOG_FS_WARN("SimulatedFileSystem destroyed with {} input / {} output "
                "streams still open",
                open_inputs_.load(), open_outputs_.load());
  }
}

std::string SimulatedFileSystem::key(const LogPath &path) {
  return path.empty() ? std::string(".") : path.str();
}

bool SimulatedFileSystem::exists_locked(const std::string &key) const {
  return nodes_.find(key) != nodes_.end();
}

bool SimulatedFileSystem::parent_exists_locked(const LogPath &path) const {
  auto it = nodes_.find(key(path.parent()));
  return it != nodes_.end() && it->second.is_directory;
}

void SimulatedFileSystem::mkdirs_locked(const LogPath &dir) {
  auto k = key(dir);
  if (exists_locked(k)) {
    return;
  }
  if (!dir.is_root() && k != ".") {
    mkdirs_locked(dir.parent());
  }
  nodes_[k] = Node{true, "", ++clock_};
}

bool SimulatedFileSystem::exists(const LogPath &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return exists_locked(key(path));
}

std::unique_ptr<InputStream>
SimulatedFileSystem::open_for_read(const LogPath &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(key(path));
  if (it == nodes_.end()) {
    throw FileNotFoundError(path.str());
  }
  if (it->second.is_directory) {
    throw IOError("Is a directory: " + path.str(), path.str());
  }
  ++open_inputs_;
  return std::make_unique<SimulatedInputStream>(this, key(path));
}

std::unique_ptr<OutputStream>
SimulatedFileSystem::open_for_write(const LogPath &path, bool overwrite) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (faults_.fail_open_for_write) {
    throw IOError("Simulated open failure on " + path.str(), path.str());
  }
  if (!parent_exists_locked(path)) {
    throw FileNotFoundError(path.parent().str());
  }
  auto k = key(path);
  auto it = nodes_.find(k);
  if (it != nodes_.end()) {
    if (!overwrite) {
      throw FileAlreadyExistsError(path.str());
    }
    if (it->second.is_directory) {
      throw IOError("Is a directory: " + path.str(), path.str());
    }
  }
  nodes_[k] = Node{false, "", ++clock_};
  ++open_outputs_;
  return std::make_unique<SimulatedOutputStream>(this, k);
}

std::vector<FileStatus> SimulatedFileSystem::list_status(const LogPath &dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++list_calls_;
  if (faults_.fail_list) {
    throw IOError("Simulated list failure on " + dir.str(), dir.str());
  }
  auto it = nodes_.find(key(dir));
  if (it == nodes_.end()) {
    throw FileNotFoundError(dir.str());
  }
  if (!it->second.is_directory) {
    throw IOError("Not a directory: " + dir.str(), dir.str());
  }

  // Map order is not the listing contract; callers must sort
  std::vector<FileStatus> result;
  for (const auto &[k, node] : nodes_) {
    LogPath p(k);
    if (k == "/" || k == "." || key(p.parent()) != key(dir)) {
      continue;
    }
    FileStatus status;
    status.path = p;
    status.size = node.data.size();
    status.modification_time = node.modification_time;
    status.is_directory = node.is_directory;
    result.push_back(std::move(status));
  }
  std::reverse(result.begin(), result.end());
  return result;
}

bool SimulatedFileSystem::rename(const LogPath &src, const LogPath &dst) {
  ++rename_calls_;

  RenameHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = before_rename_;
  }
  if (hook) {
    hook(src, dst);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (faults_.fail_rename) {
    throw IOError("Simulated rename failure on " + src.str(), src.str());
  }
  if (rename_mode_ == RenameMode::Refuse) {
    LOG_FS_TRACE("simulated rename {} -> {} refused", src.str(), dst.str());
    return false;
  }

  auto src_it = nodes_.find(key(src));
  if (src_it == nodes_.end() || !parent_exists_locked(dst)) {
    return false;
  }
  if (exists_locked(key(dst)) && rename_mode_ == RenameMode::NoReplace) {
    return false;
  }

  Node node = std::move(src_it->second);
  nodes_.erase(src_it);
  node.modification_time = ++clock_;
  nodes_[key(dst)] = std::move(node);
  return true;
}

bool SimulatedFileSystem::remove(const LogPath &path, bool recursive) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++remove_calls_;
  if (faults_.fail_remove) {
    throw IOError("Simulated delete failure on " + path.str(), path.str());
  }
  auto k = key(path);
  auto it = nodes_.find(k);
  if (it == nodes_.end()) {
    return false;
  }
  if (it->second.is_directory) {
    const std::string prefix = path.is_root() ? "/" : k + "/";
    bool has_children = false;
    for (const auto &[child, node] : nodes_) {
      if (child.compare(0, prefix.size(), prefix) == 0 && child != k) {
        has_children = true;
        break;
      }
    }
    if (has_children && !recursive) {
      throw IOError("Directory is not empty: " + path.str(), path.str());
    }
    for (auto child = nodes_.begin(); child != nodes_.end();) {
      if (child->first.compare(0, prefix.size(), prefix) == 0 &&
          child->first != k) {
        child = nodes_.erase(child);
      } else {
        ++child;
      }
    }
  }
  nodes_.erase(k);
  return true;
}

std::string SimulatedFileSystem::make_qualified(const LogPath &path) {
  const auto &p = path.str();
  if (!p.empty() && p.front() == '/') {
    return scheme() + "://" + p;
  }
  return scheme() + ":///" + p;
}

void SimulatedFileSystem::set_faults(const Faults &faults) {
  std::lock_guard<std::mutex> lock(mutex_);
  faults_ = faults;
}

void SimulatedFileSystem::set_rename_mode(RenameMode mode) {
  std::lock_guard<std::mutex> lock(mutex_);
  rename_mode_ = mode;
}

void SimulatedFileSystem::set_before_rename_hook(RenameHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  before_rename_ = std::move(hook);
}

void SimulatedFileSystem::mkdirs(const LogPath &dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  mkdirs_locked(dir);
}

void SimulatedFileSystem::put_file(const LogPath &path,
                                   const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  mkdirs_locked(path.parent());
  nodes_[key(path)] = Node{false, content, ++clock_};
}

std::optional<std::string>
SimulatedFileSystem::contents(const LogPath &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(key(path));
  if (it == nodes_.end() || it->second.is_directory) {
    return std::nullopt;
  }
  return it->second.data;
}

std::vector<std::string>
SimulatedFileSystem::file_names(const LogPath &dir) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto &[k, node] : nodes_) {
    LogPath p(k);
    if (k != "/" && k != "." && key(p.parent()) == key(dir)) {
      names.push_back(p.name());
    }
  }
  return names;
}

void SimulatedFileSystem::append(const std::string &key, const char *data,
                                 size_t size, size_t &written) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    throw IOError("File was deleted while open: " + key, key);
  }

  size_t accepted = size;
  bool fail = false;
  if (faults_.fail_write_after_bytes) {
    size_t limit = *faults_.fail_write_after_bytes;
    if (written + size > limit) {
      accepted = limit > written ? limit - written : 0;
      fail = true;
    }
  }

  it->second.data.append(data, accepted);
  it->second.modification_time = ++clock_;
  written += accepted;
  if (fail) {
    throw IOError("Simulated write failure on " + key, key);
  }
}

void SimulatedFileSystem::finish_output(bool check_faults) {
  --open_outputs_;
  if (check_faults) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (faults_.fail_close) {
      throw IOError("Simulated close failure");
    }
  }
}

bool SimulatedFileSystem::read_at(const std::string &key, size_t offset,
                                  char *buffer, size_t size, size_t &read) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (faults_.fail_read) {
    return false;
  }
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    return false;
  }
  const auto &data = it->second.data;
  if (offset >= data.size()) {
    read = 0;
    return true;
  }
  read = std::min(size, data.size() - offset);
  std::memcpy(buffer, data.data() + offset, read);
  return true;
}

void SimulatedFileSystem::finish_input() { --open_inputs_; }

} // namespace storage
} // namespace commitlog
