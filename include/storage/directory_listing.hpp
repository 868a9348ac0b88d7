// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_DIRECTORY_LISTING_HPP
#define COMMITLOG_STORAGE_DIRECTORY_LISTING_HPP

#include "storage/file_system.hpp"
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace commitlog {
namespace storage {

/**
 * DirectoryListing - ascending, name-ordered entries of one directory
 *
 * Built from a single FileSystem::list_status() call. Entries whose
 * name compares byte-wise below the threshold are dropped; the rest are
 * sorted by name and handed out one at a time. Like LineReader it is a
 * single-pass sequence.
 *
 * The listing is a snapshot of whatever the backend reported. A file
 * published after the snapshot (or hidden by the backend's listing
 * consistency window) is not visible; callers that need it must list
 * again.
 */
class DirectoryListing {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = FileStatus;
    using difference_type = std::ptrdiff_t;
    using pointer = const FileStatus *;
    using reference = const FileStatus &;

    iterator() = default;
    explicit iterator(DirectoryListing *listing);

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++();
    void operator++(int) { ++*this; }

    bool operator==(const iterator &other) const {
      return listing_ == other.listing_;
    }

  private:
    DirectoryListing *listing_ = nullptr;
    FileStatus current_;
  };

  DirectoryListing(std::vector<FileStatus> entries,
                   const std::string &start_name);

  bool next(FileStatus &status);

  // Entries not yet handed out
  size_t remaining() const { return entries_.size() - pos_; }

  iterator begin();
  iterator end() { return iterator(); }

private:
  std::vector<FileStatus> entries_;
  size_t pos_ = 0;
  bool iterated_ = false;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_DIRECTORY_LISTING_HPP
