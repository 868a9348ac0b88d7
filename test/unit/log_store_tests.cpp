// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for FileSystemLogStore against the simulated backend
// Covers create-if-absent publishing, staging cleanup and ordered listing

#include "storage/errors.hpp"
#include "storage/log_store.hpp"
#include "storage/simulated_file_system.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace commitlog::storage;
using commitlog::test::SequenceTokenSource;

namespace {

using Lines = std::vector<std::string>;

class LogStoreFixture {
public:
  std::shared_ptr<SimulatedFileSystem> fs;
  FileSystemLogStore store;

  LogStoreFixture()
      : fs(std::make_shared<SimulatedFileSystem>()),
        store(fs, std::make_shared<SequenceTokenSource>()) {
    fs->mkdirs("/logs");
  }

  bool HasStagingFiles() const {
    auto names = fs->file_names("/logs");
    return std::any_of(names.begin(), names.end(), [](const std::string &n) {
      return TempPathGenerator::IsTempName(n);
    });
  }

  void RequireNoOpenStreams() const {
    REQUIRE(fs->open_input_streams() == 0);
    REQUIRE(fs->open_output_streams() == 0);
  }
};

} // anonymous namespace

TEST_CASE("LogStore - write then read", "[storage][store][unit]") {
  LogStoreFixture f;

  SECTION("Create-if-absent round trip") {
    f.store.write("/logs/0001", Lines{"add a", "remove b"}, false);
    REQUIRE(f.fs->contents("/logs/0001") == "add a\nremove b\n");
    REQUIRE(f.store.read_all("/logs/0001") == Lines{"add a", "remove b"});
    REQUIRE_FALSE(f.HasStagingFiles());
    f.RequireNoOpenStreams();
  }

  SECTION("Publish goes through one rename of a staging file") {
    LogPath renamed_from;
    f.fs->set_before_rename_hook(
        [&](const LogPath &src, const LogPath &) { renamed_from = src; });
    f.store.write("/logs/0001", Lines{"x"}, false);
    REQUIRE(renamed_from.str() == "/logs/.0001.t0.tmp");
    REQUIRE(f.fs->rename_calls() == 1);
  }

  SECTION("Nothing is visible at the target before the rename") {
    bool target_existed = true;
    bool target_listed = true;
    std::string staged;
    f.fs->set_before_rename_hook([&](const LogPath &src, const LogPath &dst) {
      target_existed = f.fs->exists(dst);
      target_listed = false;
      for (const auto &status : f.store.list_from(dst)) {
        if (status.name() == dst.name()) {
          target_listed = true;
        }
      }
      staged = f.fs->contents(src);
    });
    f.store.write("/logs/0001", Lines{"a", "b"}, false);
    REQUIRE_FALSE(target_existed);
    REQUIRE_FALSE(target_listed);
    REQUIRE(staged == "a\nb\n");
    REQUIRE(f.fs->contents("/logs/0001") == "a\nb\n");
  }

  SECTION("Ill-formed UTF-8 is stored as U+FFFD") {
    f.store.write("/logs/0001", Lines{"bad\xFF", "ok"}, false);
    REQUIRE(f.fs->contents("/logs/0001") == "bad\xEF\xBF\xBD\nok\n");
  }

  SECTION("Empty content") {
    f.store.write("/logs/0001", Lines{}, false);
    REQUIRE(f.fs->contents("/logs/0001") == "");
    REQUIRE(f.store.read_all("/logs/0001").empty());
  }

  SECTION("Overwrite replaces content, last writer wins") {
    f.store.write("/logs/_last", Lines{"v1"}, true);
    f.store.write("/logs/_last", Lines{"v2", "more"}, true);
    REQUIRE(f.store.read_all("/logs/_last") == Lines{"v2", "more"});
    REQUIRE(f.fs->rename_calls() == 0);
  }

  SECTION("Overwrite of a file published create-if-absent") {
    f.store.write("/logs/0001", Lines{"a"}, false);
    f.store.write("/logs/0001", Lines{"b"}, true);
    REQUIRE(f.store.read_all("/logs/0001") == Lines{"b"});
  }

  SECTION("Lines are pulled lazily from a source") {
    int produced = 0;
    f.store.write(
        "/logs/0002",
        [&](std::string &line) {
          if (produced == 3) {
            return false;
          }
          line = "line" + std::to_string(produced++);
          return true;
        },
        false);
    REQUIRE(f.store.read_all("/logs/0002") == Lines{"line0", "line1", "line2"});
  }

  SECTION("Large content spans several write chunks") {
    Lines lines(5000, std::string(100, 'z'));
    f.store.write("/logs/0003", lines, false);
    REQUIRE(f.store.read_all("/logs/0003") == lines);
  }

  SECTION("Reading a missing file") {
    REQUIRE_THROWS_AS(f.store.read("/logs/0404"), FileNotFoundError);
    f.RequireNoOpenStreams();
  }
}

TEST_CASE("LogStore - create-if-absent conflicts", "[storage][store][unit]") {
  LogStoreFixture f;

  SECTION("Target already exists") {
    f.fs->put_file("/logs/0001", "original\n");
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"mine"}, false),
                      FileAlreadyExistsError);
    REQUIRE(f.fs->contents("/logs/0001") == "original\n");
    REQUIRE(f.fs->rename_calls() == 0);
    REQUIRE_FALSE(f.HasStagingFiles());
  }

  SECTION("Another writer publishes between staging and rename") {
    f.fs->set_before_rename_hook([&](const LogPath &, const LogPath &dst) {
      f.fs->put_file(dst, "winner\n");
    });
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"loser"}, false),
                      FileAlreadyExistsError);
    REQUIRE(f.fs->contents("/logs/0001") == "winner\n");
    REQUIRE_FALSE(f.HasStagingFiles());
    f.RequireNoOpenStreams();
  }

  SECTION("Already exists carries the target path") {
    f.fs->put_file("/logs/0001", "");
    try {
      f.store.write("/logs/0001", Lines{"x"}, false);
      FAIL("expected FileAlreadyExistsError");
    } catch (const StorageError &e) {
      REQUIRE(e.kind() == ErrorKind::AlreadyExists);
      REQUIRE(e.path() == "/logs/0001");
    }
  }
}

TEST_CASE("LogStore - missing parent directory", "[storage][store][unit]") {
  LogStoreFixture f;

  REQUIRE_THROWS_AS(f.store.write("/missing/0001", Lines{"x"}, false),
                    FileNotFoundError);
  REQUIRE_THROWS_AS(f.store.write("/missing/0001", Lines{"x"}, true),
                    FileNotFoundError);
  REQUIRE_THROWS_AS(f.store.list_from("/missing/0001"), FileNotFoundError);
  REQUIRE_FALSE(f.fs->exists("/missing"));
  REQUIRE(f.fs->list_calls() == 0);
  REQUIRE(f.fs->rename_calls() == 0);
}

TEST_CASE("LogStore - backend inconsistencies", "[storage][store][unit]") {
  LogStoreFixture f;

  SECTION("Rename refused but target absent") {
    f.fs->set_rename_mode(SimulatedFileSystem::RenameMode::Refuse);
    try {
      f.store.write("/logs/0001", Lines{"x"}, false);
      FAIL("expected IllegalStateError");
    } catch (const IllegalStateError &e) {
      REQUIRE(std::string(e.what()) ==
              "Cannot rename /logs/.0001.t0.tmp to /logs/0001");
    }
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());
    f.RequireNoOpenStreams();
  }

  SECTION("Replacing rename cannot publish create-if-absent") {
    f.fs->set_rename_mode(SimulatedFileSystem::RenameMode::Overwrite);
    f.fs->set_before_rename_hook([&](const LogPath &, const LogPath &dst) {
      f.fs->put_file(dst, "winner\n");
    });
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"loser"}, false),
                      IllegalStateError);
    REQUIRE(f.fs->rename_calls() == 0);
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());

    f.fs->put_file("/logs/0002", "winner\n");
    REQUIRE_THROWS_AS(f.store.write("/logs/0002", Lines{"loser"}, false),
                      IllegalStateError);
    REQUIRE(f.fs->contents("/logs/0002") == "winner\n");
    f.RequireNoOpenStreams();
  }

  SECTION("Backend without atomic rename cannot publish") {
    f.fs->set_supports_atomic_rename(false);
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"x"}, false),
                      IllegalStateError);
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());

    // Overwrite does not depend on rename
    REQUIRE_NOTHROW(f.store.write("/logs/_last", Lines{"x"}, true));
  }
}

TEST_CASE("LogStore - I/O failures clean up staging",
          "[storage][store][unit]") {
  LogStoreFixture f;
  SimulatedFileSystem::Faults faults;

  SECTION("Write fails midway") {
    faults.fail_write_after_bytes = 4;
    f.fs->set_faults(faults);
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"abcdef"}, false),
                      IOError);
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());
    f.RequireNoOpenStreams();
  }

  SECTION("Close fails") {
    faults.fail_close = true;
    f.fs->set_faults(faults);
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"abc"}, false),
                      IOError);
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());
    REQUIRE(f.fs->rename_calls() == 0);
    f.RequireNoOpenStreams();
  }

  SECTION("Rename throws") {
    faults.fail_rename = true;
    f.fs->set_faults(faults);
    REQUIRE_THROWS_AS(f.store.write("/logs/0001", Lines{"abc"}, false),
                      IOError);
    REQUIRE_FALSE(f.HasStagingFiles());
  }

  SECTION("Line source throws") {
    REQUIRE_THROWS_AS(f.store.write(
                          "/logs/0001",
                          [](std::string &) -> bool {
                            throw std::runtime_error("source failed");
                          },
                          false),
                      std::runtime_error);
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    REQUIRE_FALSE(f.HasStagingFiles());
    f.RequireNoOpenStreams();
  }

  SECTION("Cleanup failure does not mask the original error") {
    faults.fail_write_after_bytes = 0;
    faults.fail_remove = true;
    f.fs->set_faults(faults);
    try {
      f.store.write("/logs/0001", Lines{"abc"}, false);
      FAIL("expected IOError");
    } catch (const IOError &e) {
      REQUIRE(std::string(e.what()).find("write failure") != std::string::npos);
    }
    REQUIRE(f.fs->remove_calls() == 1);
    // The staging file is left behind, never the target
    REQUIRE(f.HasStagingFiles());
    REQUIRE_FALSE(f.fs->exists("/logs/0001"));
    f.RequireNoOpenStreams();
  }

  SECTION("Read failure closes the stream") {
    f.fs->put_file("/logs/0001", "a\nb\n");
    faults.fail_read = true;
    f.fs->set_faults(faults);
    auto reader = f.store.read("/logs/0001");
    std::string line;
    REQUIRE_THROWS_AS(reader.next(line), IOError);
    f.RequireNoOpenStreams();
  }
}

TEST_CASE("LogStore - list_from", "[storage][store][unit]") {
  LogStoreFixture f;
  for (const auto *name : {"0003", "0001", "0005", "0002"}) {
    f.fs->put_file(LogPath("/logs").child(name), "x\n");
  }

  SECTION("Entries at or after the start, ascending") {
    std::vector<std::string> names;
    for (const auto &status : f.store.list_from("/logs/0002")) {
      names.push_back(status.name());
    }
    REQUIRE(names == Lines{"0002", "0003", "0005"});
    REQUIRE(f.fs->list_calls() == 1);
  }

  SECTION("Start name that does not exist") {
    auto listing = f.store.list_from("/logs/0004");
    FileStatus status;
    REQUIRE(listing.next(status));
    REQUIRE(status.name() == "0005");
    REQUIRE(status.path.str() == "/logs/0005");
    REQUIRE_FALSE(listing.next(status));
  }

  SECTION("Past the last entry") {
    REQUIRE(f.store.list_from("/logs/0009").remaining() == 0);
  }

  SECTION("Snapshot does not see later publishes") {
    auto listing = f.store.list_from("/logs/0001");
    f.store.write("/logs/0006", Lines{"late"}, false);
    REQUIRE(listing.remaining() == 4);
  }

  SECTION("List failure surfaces as IOError") {
    SimulatedFileSystem::Faults faults;
    faults.fail_list = true;
    f.fs->set_faults(faults);
    REQUIRE_THROWS_AS(f.store.list_from("/logs/0001"), IOError);
  }
}

TEST_CASE("LogStore - resolve_path_on_physical_storage",
          "[storage][store][unit]") {
  LogStoreFixture f;
  REQUIRE(f.store.resolve_path_on_physical_storage("/logs/0001") ==
          "sim:///logs/0001");
}
