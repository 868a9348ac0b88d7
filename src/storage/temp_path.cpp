// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "storage/temp_path.hpp"
#include <array>
#include <cstdint>
#include <cstdio>
#include <utility>

namespace commitlog {
namespace storage {

RandomTokenSource::RandomTokenSource() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  gen_.seed(seq);
}

std::string RandomTokenSource::next_token() {
  uint64_t hi, lo;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hi = gen_();
    lo = gen_();
  }

  // RFC 4122 version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::array<char, 37> buf;
  std::snprintf(buf.data(), buf.size(), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf.data());
}

TempPathGenerator::TempPathGenerator(std::shared_ptr<TokenSource> tokens)
    : tokens_(std::move(tokens)) {}

LogPath TempPathGenerator::make(const LogPath &target) const {
  return target.parent().child("." + target.name() + "." +
                               tokens_->next_token() + ".tmp");
}

bool TempPathGenerator::IsTempName(const std::string &name) {
  const std::string suffix = ".tmp";
  return name.size() > 1 + suffix.size() && name.front() == '.' &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace storage
} // namespace commitlog
