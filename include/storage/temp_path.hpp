// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_STORAGE_TEMP_PATH_HPP
#define COMMITLOG_STORAGE_TEMP_PATH_HPP

#include "storage/log_path.hpp"
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace commitlog {
namespace storage {

/**
 * Source of unique tokens for staging file names
 */
class TokenSource {
public:
  virtual ~TokenSource() = default;
  virtual std::string next_token() = 0;
};

/**
 * Random version 4 UUIDs, e.g. "3f1c2a4e-9b7d-4c1e-8a2f-0d5e6b7c8a9f"
 */
class RandomTokenSource : public TokenSource {
public:
  RandomTokenSource();
  std::string next_token() override;

private:
  std::mutex mutex_;
  std::mt19937_64 gen_;
};

/**
 * Derives staging paths: <parent>/.<name>.<token>.tmp
 *
 * The staging file lives in the target's directory so the publishing
 * rename never crosses a file system boundary.
 */
class TempPathGenerator {
public:
  explicit TempPathGenerator(
      std::shared_ptr<TokenSource> tokens = std::make_shared<RandomTokenSource>());

  LogPath make(const LogPath &target) const;

  static bool IsTempName(const std::string &name);

private:
  std::shared_ptr<TokenSource> tokens_;
};

} // namespace storage
} // namespace commitlog

#endif // COMMITLOG_STORAGE_TEMP_PATH_HPP
