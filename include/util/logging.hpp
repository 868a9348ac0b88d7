// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_UTIL_LOGGING_HPP
#define COMMITLOG_UTIL_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace commitlog {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the store.
 *
 * Thread-safety: All methods are thread-safe. Logger access and
 * (re)initialization are protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of stderr
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "commitlog.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "storage", "fs", "rpc")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (storage, fs, rpc, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace commitlog

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  commitlog::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  commitlog::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  commitlog::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  commitlog::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  commitlog::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  commitlog::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_STORAGE_TRACE(...)                                                 \
  commitlog::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORAGE_DEBUG(...)                                                 \
  commitlog::util::LogManager::GetLogger("storage")->debug(__VA_ARGS__)
#define LOG_STORAGE_INFO(...)                                                  \
  commitlog::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORAGE_WARN(...)                                                  \
  commitlog::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORAGE_ERROR(...)                                                 \
  commitlog::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

#define LOG_FS_TRACE(...)                                                      \
  commitlog::util::LogManager::GetLogger("fs")->trace(__VA_ARGS__)
#define LOG_FS_DEBUG(...)                                                      \
  commitlog::util::LogManager::GetLogger("fs")->debug(__VA_ARGS__)
#define LOG_FS_INFO(...)                                                       \
  commitlog::util::LogManager::GetLogger("fs")->info(__VA_ARGS__)
#define LOG_FS_WARN(...)                                                       \
  commitlog::util::LogManager::GetLogger("fs")->warn(__VA_ARGS__)
#define LOG_FS_ERROR(...)                                                      \
  commitlog::util::LogManager::GetLogger("fs")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  commitlog::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  commitlog::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  commitlog::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  commitlog::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  commitlog::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#endif // COMMITLOG_UTIL_LOGGING_HPP
