// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string &level) {
  commitlog::util::LogManager::Initialize(level, false, "");

  // "trace" should reach every component, including LOG_STORAGE_TRACE and
  // LOG_RPC_TRACE
  if (level == "trace") {
    commitlog::util::LogManager::SetComponentLevel("storage", "trace");
    commitlog::util::LogManager::SetComponentLevel("fs", "trace");
    commitlog::util::LogManager::SetComponentLevel("rpc", "trace");
    commitlog::util::LogManager::SetComponentLevel("app", "trace");
  }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() { commitlog::util::LogManager::Shutdown(); }
