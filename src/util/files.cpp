// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace commitlog {
namespace util {

std::optional<std::string>
read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return contents.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".commitlog";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".commitlog";
}

} // namespace util
} // namespace commitlog
