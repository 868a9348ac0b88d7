// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_SIMULATED_FILE_SYSTEM_HPP
#define COMMITLOG_STORAGE_SIMULATED_FILE_SYSTEM_HPP

#include "storage/file_system.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace commitlog {
namespace storage {

/**
 * SimulatedFileSystem - in-memory backend for testing
 *
 * Files become visible on open and grow as data is written, like a real
 * file system. Supports deterministic fault injection:
 * - rename hooks (simulate a racing writer publishing first)
 * - rename behaviour of weaker backends (overwrite, spurious failure)
 * - I/O failures on write, close, read, list and delete
 * - counters for open streams and backend calls
 *
 * "/" and "." always exist. Thread-safe.
 */
class SimulatedFileSystem : public FileSystem {
public:
  enum class RenameMode {
    NoReplace, // fail with false if dst exists (atomic rename)
    Overwrite, // silently replace dst (unsafe for create-if-absent)
    Refuse     // report false without any effect
  };

  struct Faults {
    bool fail_open_for_write = false;
    std::optional<size_t> fail_write_after_bytes; // per stream
    bool fail_close = false;
    bool fail_read = false;
    bool fail_list = false;
    bool fail_remove = false;
    bool fail_rename = false; // throw IOError from rename
  };

  using RenameHook = std::function<void(const LogPath &src, const LogPath &dst)>;

  SimulatedFileSystem();
  ~SimulatedFileSystem() override;

  // FileSystem interface
  bool exists(const LogPath &path) override;
  std::unique_ptr<InputStream> open_for_read(const LogPath &path) override;
  std::unique_ptr<OutputStream> open_for_write(const LogPath &path,
                                               bool overwrite) override;
  std::vector<FileStatus> list_status(const LogPath &dir) override;
  bool rename(const LogPath &src, const LogPath &dst) override;
  bool remove(const LogPath &path, bool recursive) override;
  std::string make_qualified(const LogPath &path) override;
  std::string scheme() const override { return "sim"; }
  // An overwriting rename can never back create-if-absent publishing
  bool supports_atomic_rename() const override {
    return atomic_rename_.load() &&
           rename_mode_.load() != RenameMode::Overwrite;
  }

  // Testing interface
  void set_faults(const Faults &faults);
  void set_rename_mode(RenameMode mode);
  void set_supports_atomic_rename(bool supported) { atomic_rename_ = supported; }

  /**
   * Hook invoked at the start of rename(), before the backend decides.
   * Runs without the internal lock held, so it may call back into the
   * file system (e.g. to publish a competing file at dst).
   */
  void set_before_rename_hook(RenameHook hook);

  void mkdirs(const LogPath &dir);
  void put_file(const LogPath &path, const std::string &content);
  std::optional<std::string> contents(const LogPath &path) const;
  std::vector<std::string> file_names(const LogPath &dir) const;

  size_t open_input_streams() const { return open_inputs_.load(); }
  size_t open_output_streams() const { return open_outputs_.load(); }
  size_t list_calls() const { return list_calls_.load(); }
  size_t rename_calls() const { return rename_calls_.load(); }
  size_t remove_calls() const { return remove_calls_.load(); }

private:
  friend class SimulatedInputStream;
  friend class SimulatedOutputStream;

  struct Node {
    bool is_directory = false;
    std::string data;
    int64_t modification_time = 0;
  };

  static std::string key(const LogPath &path);
  bool exists_locked(const std::string &key) const;
  bool parent_exists_locked(const LogPath &path) const;
  void mkdirs_locked(const LogPath &dir);

  // Stream callbacks
  void append(const std::string &key, const char *data, size_t size,
              size_t &written);
  void finish_output(bool check_faults);
  bool read_at(const std::string &key, size_t offset, char *buffer,
               size_t size, size_t &read);
  void finish_input();

  mutable std::mutex mutex_;
  std::map<std::string, Node> nodes_;
  int64_t clock_ = 0;
  Faults faults_;
  std::atomic<RenameMode> rename_mode_{RenameMode::NoReplace};
  RenameHook before_rename_;
  std::atomic<bool> atomic_rename_{true};

  std::atomic<size_t> open_inputs_{0};
  std::atomic<size_t> open_outputs_{0};
  std::atomic<size_t> list_calls_{0};
  std::atomic<size_t> rename_calls_{0};
  std::atomic<size_t> remove_calls_{0};
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_SIMULATED_FILE_SYSTEM_HPP
