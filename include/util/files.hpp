// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_UTIL_FILES_HPP
#define COMMITLOG_UTIL_FILES_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace commitlog {
namespace util {

/**
 * Read entire file into string
 * Returns nullopt if the file cannot be opened or read
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.commitlog on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace commitlog

#endif // COMMITLOG_UTIL_FILES_HPP
