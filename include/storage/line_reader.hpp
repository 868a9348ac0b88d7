// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_LINE_READER_HPP
#define COMMITLOG_STORAGE_LINE_READER_HPP

#include "storage/file_system.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace commitlog {
namespace storage {

/**
 * LineReader - single-pass sequence of UTF-8 lines over an InputStream
 *
 * Lines are split on "\n", "\r\n" or "\r"; terminators are not part of
 * the yielded value. Malformed UTF-8 is replaced with U+FFFD.
 *
 * The underlying stream is closed exactly once: when the sequence is
 * exhausted, when close() is called, when a read fails, or when the
 * reader is destroyed early. Range-for iteration is supported once:
 *
 *   for (const auto &line : store.read(path)) { ... }
 */
class LineReader {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    iterator() = default;
    explicit iterator(LineReader *reader);

    reference operator*() const { return line_; }
    pointer operator->() const { return &line_; }
    iterator &operator++();
    void operator++(int) { ++*this; }

    bool operator==(const iterator &other) const {
      return reader_ == other.reader_;
    }

  private:
    LineReader *reader_ = nullptr;
    std::string line_;
  };

  explicit LineReader(std::unique_ptr<InputStream> stream,
                      size_t buffer_size = 8192);
  ~LineReader();

  LineReader(LineReader &&other) noexcept;
  LineReader &operator=(LineReader &&other) noexcept;
  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;

  /**
   * Fetch the next line
   * @return false once the stream is exhausted (the stream is then closed)
   */
  bool next(std::string &line);

  /**
   * Release the underlying stream. Safe to call repeatedly.
   */
  void close();

  bool is_closed() const { return stream_ == nullptr; }

  /**
   * Start the one permitted iteration
   * Throws IllegalStateError on a second call.
   */
  iterator begin();
  iterator end() { return iterator(); }

private:
  bool fill();
  void close_quietly() noexcept;

  std::unique_ptr<InputStream> stream_;
  std::vector<char> buffer_;
  size_t pos_ = 0;
  size_t len_ = 0;
  bool skip_lf_ = false;
  bool iterated_ = false;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_LINE_READER_HPP
