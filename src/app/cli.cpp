// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/cli.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <istream>
#include <ostream>

namespace commitlog {
namespace app {

namespace {

bool ParseUnsigned(const std::string &text, uint64_t max, uint64_t &value) {
  if (text.empty() || text.size() > 20) {
    return false;
  }
  uint64_t result = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    uint64_t next = result * 10 + static_cast<uint64_t>(c - '0');
    if (next < result) {
      return false;
    }
    result = next;
  }
  if (result > max) {
    return false;
  }
  value = result;
  return true;
}

} // anonymous namespace

int ExitCodeFor(storage::ErrorKind kind) {
  switch (kind) {
  case storage::ErrorKind::NotFound:
    return EXIT_NOT_FOUND;
  case storage::ErrorKind::AlreadyExists:
    return EXIT_ALREADY_EXISTS;
  case storage::ErrorKind::IllegalState:
    return EXIT_ILLEGAL_STATE;
  case storage::ErrorKind::IOFailure:
    return EXIT_IO_FAILURE;
  }
  return EXIT_IO_FAILURE;
}

void PrintUsage(std::ostream &out, const std::string &program_name) {
  out << "Usage: " << program_name << " [options] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  write <path> [--overwrite]  Write lines from stdin to <path>\n"
      << "                              (create-if-absent unless --overwrite)\n"
      << "  read <path>                 Print the lines of <path>\n"
      << "  list <path>                 List entries of <path>'s directory\n"
      << "                              named >= <path>, in name order\n"
      << "  resolve <path>              Print the qualified location of <path>\n"
      << "  serve                       Serve --root to remote clients\n"
      << "\n"
      << "Options:\n"
      << "  --config=<file>      JSON config file (default: "
         "~/.commitlog/config.json if present)\n"
      << "  --backend=<name>     Storage backend: local, remote (default: "
         "local)\n"
      << "  --root=<dir>         Base directory for relative paths / served "
         "root\n"
      << "  --host=<host>        File server host (default: 127.0.0.1)\n"
      << "  --port=<port>        File server port (default: 9610)\n"
      << "  --threads=<n>        File server IO threads (default: 2)\n"
      << "  --sync               fsync files and directories on publish\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   trace, debug, info, warn, error, critical\n"
      << "                       Default: info\n"
      << "  --logfile=<path>     Log to file instead of stderr\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n";
}

bool ParseCommandLine(const std::vector<std::string> &argv, CommandLine &cmd,
                      std::string &error) {
  // Config file first so that flags override it
  bool explicit_config = false;
  for (size_t i = 1; i < argv.size(); ++i) {
    if (argv[i].find("--config=") == 0) {
      if (!LoadConfigFile(argv[i].substr(9), cmd.config, error)) {
        return false;
      }
      explicit_config = true;
    }
  }
  if (!explicit_config) {
    auto default_config = util::get_default_datadir() / "config.json";
    std::error_code ec;
    if (std::filesystem::exists(default_config, ec) &&
        !LoadConfigFile(default_config, cmd.config, error)) {
      return false;
    }
  }

  for (size_t i = 1; i < argv.size(); ++i) {
    const std::string &arg = argv[i];
    uint64_t number = 0;

    if (arg == "--help") {
      cmd.show_help = true;
    } else if (arg == "--version") {
      cmd.show_version = true;
    } else if (arg.find("--config=") == 0) {
      // Already applied
    } else if (arg.find("--backend=") == 0) {
      cmd.config.backend = arg.substr(10);
    } else if (arg.find("--root=") == 0) {
      cmd.config.root = arg.substr(7);
    } else if (arg.find("--host=") == 0) {
      cmd.config.host = arg.substr(7);
    } else if (arg.find("--port=") == 0) {
      if (!ParseUnsigned(arg.substr(7), 65535, number)) {
        error = "Invalid port: " + arg.substr(7);
        return false;
      }
      cmd.config.port = static_cast<uint16_t>(number);
    } else if (arg.find("--threads=") == 0) {
      if (!ParseUnsigned(arg.substr(10), 1024, number) || number == 0) {
        error = "Invalid thread count: " + arg.substr(10);
        return false;
      }
      cmd.config.io_threads = static_cast<size_t>(number);
    } else if (arg == "--sync") {
      cmd.config.sync = true;
    } else if (arg.find("--loglevel=") == 0) {
      cmd.config.log_level = arg.substr(11);
    } else if (arg.find("--logfile=") == 0) {
      cmd.config.log_file = arg.substr(10);
    } else if (arg == "--overwrite") {
      cmd.overwrite = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "Unknown option: " + arg;
      return false;
    } else if (cmd.command.empty()) {
      cmd.command = arg;
    } else {
      cmd.args.push_back(arg);
    }
  }

  if (cmd.show_help || cmd.show_version) {
    return true;
  }

  if (cmd.command.empty()) {
    error = "No command given";
    return false;
  }
  if (cmd.config.backend != "local" && cmd.config.backend != "remote") {
    error = "Unknown backend: " + cmd.config.backend;
    return false;
  }

  const bool needs_path = cmd.command == "write" || cmd.command == "read" ||
                          cmd.command == "list" || cmd.command == "resolve";
  if (needs_path && cmd.args.size() != 1) {
    error = "Command '" + cmd.command + "' takes exactly one path";
    return false;
  }
  if (cmd.command == "serve" && !cmd.args.empty()) {
    error = "Command 'serve' takes no arguments";
    return false;
  }
  if (!needs_path && cmd.command != "serve") {
    error = "Unknown command: " + cmd.command;
    return false;
  }
  if (cmd.overwrite && cmd.command != "write") {
    error = "--overwrite only applies to 'write'";
    return false;
  }
  return true;
}

int RunCommand(const CommandLine &cmd, storage::LogStore &store,
               std::istream &in, std::ostream &out, std::ostream &err) {
  const storage::LogPath path(cmd.args.empty() ? "" : cmd.args.front());

  try {
    if (cmd.command == "write") {
      store.write(
          path,
          [&in](std::string &line) {
            if (!std::getline(in, line)) {
              return false;
            }
            if (!line.empty() && line.back() == '\r') {
              line.pop_back();
            }
            return true;
          },
          cmd.overwrite);
      LOG_INFO("wrote {}", path.str());
    } else if (cmd.command == "read") {
      for (const auto &line : store.read(path)) {
        out << line << '\n';
      }
    } else if (cmd.command == "list") {
      for (const auto &status : store.list_from(path)) {
        out << status.name() << '\t' << status.size << '\t'
            << status.modification_time
            << (status.is_directory ? "\tdir" : "") << '\n';
      }
    } else if (cmd.command == "resolve") {
      out << store.resolve_path_on_physical_storage(path) << '\n';
    } else {
      err << "Unsupported command: " << cmd.command << '\n';
      return EXIT_USAGE;
    }
  } catch (const storage::StorageError &e) {
    LOG_DEBUG("{} {} failed: {}", cmd.command, path.str(), e.what());
    err << cmd.command << ": " << storage::ErrorKindToString(e.kind()) << ": "
        << e.what() << '\n';
    return ExitCodeFor(e.kind());
  }

  out.flush();
  return EXIT_OK;
}

} // namespace app
} // namespace commitlog
