// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_APP_CLI_HPP
#define COMMITLOG_APP_CLI_HPP

#include "app/config.hpp"
#include "storage/errors.hpp"
#include "storage/log_store.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace commitlog {
namespace app {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_NOT_FOUND = 2;
constexpr int EXIT_ALREADY_EXISTS = 3;
constexpr int EXIT_ILLEGAL_STATE = 4;
constexpr int EXIT_IO_FAILURE = 5;

int ExitCodeFor(storage::ErrorKind kind);

struct CommandLine {
  StoreConfig config;
  std::string command; // write, read, list, resolve, serve
  std::vector<std::string> args;
  bool overwrite = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * Parse command line arguments
 *
 * A --config=<file> option is applied first, so every other flag
 * overrides the file regardless of position.
 * @return false with `error` set on an unknown option or bad value
 */
bool ParseCommandLine(const std::vector<std::string> &argv, CommandLine &cmd,
                      std::string &error);

void PrintUsage(std::ostream &out, const std::string &program_name);

/**
 * Execute a store command (write, read, list, resolve)
 *
 * Store failures are reported on `err` and mapped to exit codes.
 */
int RunCommand(const CommandLine &cmd, storage::LogStore &store,
               std::istream &in, std::ostream &out, std::ostream &err);

} // namespace app
} // namespace commitlog

#endif // COMMITLOG_APP_CLI_HPP
