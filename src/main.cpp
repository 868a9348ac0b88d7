// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/cli.hpp"
#include "rpc/file_server.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) { g_shutdown_requested = true; }

int RunServer(const commitlog::app::StoreConfig &config) {
  if (config.root.empty()) {
    std::cerr << "serve: --root is required" << std::endl;
    return commitlog::app::EXIT_USAGE;
  }
  if (!commitlog::util::ensure_directory(config.root)) {
    LOG_ERROR("Cannot create served root {}", config.root.string());
    return commitlog::app::EXIT_IO_FAILURE;
  }

  commitlog::rpc::FileServer::Config server_config;
  server_config.root = config.root;
  server_config.bind_address = config.host;
  server_config.port = config.port;
  server_config.io_threads = config.io_threads;
  server_config.sync = config.sync;

  commitlog::rpc::FileServer server(server_config);
  if (!server.Start()) {
    LOG_ERROR("Failed to start file server");
    return commitlog::app::EXIT_IO_FAILURE;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  while (!g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.Stop();
  return commitlog::app::EXIT_OK;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args(argv, argv + argc);
    commitlog::app::CommandLine cmd;
    std::string error;

    if (!commitlog::app::ParseCommandLine(args, cmd, error)) {
      std::cerr << error << std::endl;
      commitlog::app::PrintUsage(std::cerr, args.empty() ? "commitlog" : args[0]);
      return commitlog::app::EXIT_USAGE;
    }
    if (cmd.show_help) {
      commitlog::app::PrintUsage(std::cout, args[0]);
      return commitlog::app::EXIT_OK;
    }
    if (cmd.show_version) {
      std::cout << commitlog::GetFullVersionString() << std::endl;
      return commitlog::app::EXIT_OK;
    }

    commitlog::util::LogManager::Initialize(cmd.config.log_level,
                                            !cmd.config.log_file.empty(),
                                            cmd.config.log_file);

    int rc;
    if (cmd.command == "serve") {
      rc = RunServer(cmd.config);
    } else {
      auto store = commitlog::app::MakeLogStore(cmd.config);
      rc = commitlog::app::RunCommand(cmd, *store, std::cin, std::cout,
                                      std::cerr);
    }

    commitlog::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    commitlog::util::LogManager::Shutdown();
    return 1;
  }
}
