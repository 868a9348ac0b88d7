// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/line_reader.hpp"
#include "storage/errors.hpp"
#include "util/logging.hpp"
#include "util/utf8.hpp"
#include <utility>

namespace commitlog {
namespace storage {

LineReader::iterator::iterator(LineReader *reader) : reader_(reader) {
  ++*this;
}

LineReader::iterator &LineReader::iterator::operator++() {
  if (reader_ && !reader_->next(line_)) {
    reader_ = nullptr;
  }
  return *this;
}

LineReader::LineReader(std::unique_ptr<InputStream> stream, size_t buffer_size)
    : stream_(std::move(stream)), buffer_(buffer_size > 0 ? buffer_size : 1) {}

LineReader::~LineReader() { close_quietly(); }

LineReader::LineReader(LineReader &&other) noexcept
    : stream_(std::move(other.stream_)), buffer_(std::move(other.buffer_)),
      pos_(other.pos_), len_(other.len_), skip_lf_(other.skip_lf_),
      iterated_(other.iterated_) {
  other.pos_ = other.len_ = 0;
}

LineReader &LineReader::operator=(LineReader &&other) noexcept {
  if (this != &other) {
    close_quietly();
    stream_ = std::move(other.stream_);
    buffer_ = std::move(other.buffer_);
    pos_ = other.pos_;
    len_ = other.len_;
    skip_lf_ = other.skip_lf_;
    iterated_ = other.iterated_;
    other.pos_ = other.len_ = 0;
  }
  return *this;
}

bool LineReader::fill() {
  pos_ = 0;
  len_ = stream_->read(buffer_.data(), buffer_.size());
  return len_ > 0;
}

bool LineReader::next(std::string &line) {
  if (!stream_) {
    return false;
  }

  std::string raw;
  bool have_chars = false;
  try {
    while (true) {
      if (pos_ == len_ && !fill()) {
        if (!have_chars) {
          close();
          return false;
        }
        line = util::SanitizeUtf8(raw);
        return true;
      }

      char c = buffer_[pos_++];
      if (skip_lf_) {
        skip_lf_ = false;
        if (c == '\n') {
          continue;
        }
      }
      if (c == '\n' || c == '\r') {
        skip_lf_ = (c == '\r');
        line = util::SanitizeUtf8(raw);
        return true;
      }
      raw.push_back(c);
      have_chars = true;
    }
  } catch (...) {
    // Release the handle before the read error reaches the caller
    close_quietly();
    throw;
  }
}

void LineReader::close() {
  if (!stream_) {
    return;
  }
  auto stream = std::move(stream_);
  stream->close();
}

void LineReader::close_quietly() noexcept {
  if (!stream_) {
    return;
  }
  auto stream = std::move(stream_);
  try {
    stream->close();
  } catch (const std::exception &e) {
    LOG_STORAGE_WARN("failed to close line stream: {}", e.what());
  }
}

LineReader::iterator LineReader::begin() {
  if (iterated_) {
    throw IllegalStateError("LineReader can only be iterated once");
  }
  iterated_ = true;
  return iterator(this);
}

} // namespace storage
} // namespace commitlog
