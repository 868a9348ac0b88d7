// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace commitlog {
namespace util {

namespace {

std::recursive_mutex s_mutex;
bool s_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

const std::vector<std::string> kComponents = {"default", "storage", "fs",
                                              "rpc", "app"};

// spdlog maps unknown names to "off"; a typo must not silence the store
bool ParseLevel(const std::string &name, spdlog::level::level_enum &level) {
  level = spdlog::level::from_str(name);
  return level != spdlog::level::off || name == "off";
}

} // anonymous namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (s_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true); // true = append mode
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      // stderr keeps stdout free for command output
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    spdlog::level::level_enum level;
    const bool level_ok = ParseLevel(log_level, level);
    if (!level_ok) {
      level = spdlog::level::info;
    }

    for (const auto &component : kComponents) {
      spdlog::drop(component);
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(level);
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized = true;

    if (!level_ok) {
      LOG_WARN("Unknown log level '{}', using info", log_level);
    }
    LOG_DEBUG("Logging system initialized (level: {})",
              spdlog::level::to_string_view(level));
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Shutdown() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  s_loggers.clear();
  spdlog::shutdown();
  s_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    // Auto-initialize with defaults if not initialized
    Initialize();
  }

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  if (s_loggers.empty()) {
    // Sink creation failed; fall back to whatever spdlog has
    return spdlog::default_logger();
  }
  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  spdlog::level::level_enum log_level;
  if (!ParseLevel(level, log_level)) {
    LOG_WARN("Unknown log level: {}", level);
    return;
  }
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  LOG_DEBUG("Log level changed to: {}", level);
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  spdlog::level::level_enum log_level;
  if (!ParseLevel(level, log_level)) {
    LOG_WARN("Unknown log level: {}", level);
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(log_level);
    LOG_DEBUG("Component '{}' log level set to: {}", component, level);
  } else {
    LOG_WARN("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace commitlog
