// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/file_system.hpp"
#include <algorithm>
#include <array>

namespace commitlog {
namespace storage {

void InputStream::skip(uint64_t offset) {
  std::array<char, 8192> scratch;
  while (offset > 0) {
    size_t want =
        static_cast<size_t>(std::min<uint64_t>(offset, scratch.size()));
    size_t n = read(scratch.data(), want);
    if (n == 0) {
      return;
    }
    offset -= n;
  }
}

} // namespace storage
} // namespace commitlog
