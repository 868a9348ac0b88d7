// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Shared fixtures for the commitlog test suite

#ifndef COMMITLOG_TEST_HELPERS_HPP
#define COMMITLOG_TEST_HELPERS_HPP

#include "storage/errors.hpp"
#include "storage/file_system.hpp"
#include "storage/temp_path.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace commitlog {
namespace test {

// Creates a unique directory under /tmp and removes it afterwards
class TempDirFixture {
public:
  std::filesystem::path test_dir;

  explicit TempDirFixture(const std::string &prefix = "commitlog_test") {
    static std::atomic<int> counter{0};
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    test_dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(now) + "_" +
                std::to_string(counter++));
    std::filesystem::create_directories(test_dir);
  }

  ~TempDirFixture() {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  void WriteRaw(const std::filesystem::path &relative,
                const std::string &content) const {
    auto full = test_dir / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out << content;
  }

  std::string ReadRaw(const std::filesystem::path &relative) const {
    std::ifstream in(test_dir / relative, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }
};

// Deterministic staging tokens: "t0", "t1", ...
class SequenceTokenSource : public storage::TokenSource {
public:
  std::string next_token() override {
    return "t" + std::to_string(next_++);
  }

private:
  std::atomic<int> next_{0};
};

// Serves a fixed string, `chunk` bytes per read. Counts close() calls in
// `close_count`, which must outlive the stream's owner.
class StringInputStream : public storage::InputStream {
public:
  StringInputStream(std::string data, size_t chunk, int *close_count = nullptr)
      : data_(std::move(data)), chunk_(chunk), close_count_(close_count) {}

  size_t read(char *buffer, size_t size) override {
    if (fail_after_ && pos_ >= *fail_after_) {
      throw storage::IOError("injected read failure");
    }
    size_t n = std::min({size, chunk_, data_.size() - pos_});
    std::memcpy(buffer, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  void close() override {
    if (close_count_) {
      ++*close_count_;
    }
  }

  void fail_after(size_t offset) { fail_after_ = offset; }

private:
  std::string data_;
  size_t chunk_;
  size_t pos_ = 0;
  int *close_count_;
  std::optional<size_t> fail_after_;
};

} // namespace test
} // namespace commitlog

#endif // COMMITLOG_TEST_HELPERS_HPP
