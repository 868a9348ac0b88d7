// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/directory_listing.hpp"
#include "storage/errors.hpp"
#include <algorithm>
#include <utility>

namespace commitlog {
namespace storage {

DirectoryListing::iterator::iterator(DirectoryListing *listing)
    : listing_(listing) {
  ++*this;
}

DirectoryListing::iterator &DirectoryListing::iterator::operator++() {
  if (listing_ && !listing_->next(current_)) {
    listing_ = nullptr;
  }
  return *this;
}

DirectoryListing::DirectoryListing(std::vector<FileStatus> entries,
                                   const std::string &start_name)
    : entries_(std::move(entries)) {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const FileStatus &status) {
                                  return status.name() < start_name;
                                }),
                 entries_.end());
  std::stable_sort(entries_.begin(), entries_.end(),
                   [](const FileStatus &a, const FileStatus &b) {
                     return a.name() < b.name();
                   });
}

bool DirectoryListing::next(FileStatus &status) {
  if (pos_ >= entries_.size()) {
    return false;
  }
  status = std::move(entries_[pos_++]);
  return true;
}

DirectoryListing::iterator DirectoryListing::begin() {
  if (iterated_) {
    throw IllegalStateError("DirectoryListing can only be iterated once");
  }
  iterated_ = true;
  return iterator(this);
}

} // namespace storage
} // namespace commitlog
