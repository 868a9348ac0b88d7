// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for the in-memory test backend

#include "storage/errors.hpp"
#include "storage/simulated_file_system.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace commitlog::storage;

TEST_CASE("SimulatedFileSystem - basic file operations", "[storage][sim][unit]") {
  SimulatedFileSystem fs;
  fs.mkdirs("/logs");

  SECTION("Write, read, list") {
    auto out = fs.open_for_write("/logs/a", false);
    out->write("hello");
    out->close();
    REQUIRE(fs.open_output_streams() == 0);
    REQUIRE(fs.contents("/logs/a") == "hello");

    auto in = fs.open_for_read("/logs/a");
    char buf[16];
    REQUIRE(in->read(buf, sizeof(buf)) == 5);
    REQUIRE(in->read(buf, sizeof(buf)) == 0);
    in->close();
    REQUIRE(fs.open_input_streams() == 0);

    auto entries = fs.list_status("/logs");
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].name() == "a");
    REQUIRE(entries[0].size == 5);
    REQUIRE(fs.list_calls() == 1);
  }

  SECTION("Create-only open refuses an existing file") {
    fs.put_file("/logs/a", "x");
    REQUIRE_THROWS_AS(fs.open_for_write("/logs/a", false),
                      FileAlreadyExistsError);
    auto out = fs.open_for_write("/logs/a", true);
    out->close();
    REQUIRE(fs.contents("/logs/a") == "");
  }

  SECTION("Missing parent or file") {
    REQUIRE_THROWS_AS(fs.open_for_write("/nope/a", false), FileNotFoundError);
    REQUIRE_THROWS_AS(fs.open_for_read("/logs/missing"), FileNotFoundError);
    REQUIRE_THROWS_AS(fs.list_status("/nope"), FileNotFoundError);
  }

  SECTION("Rename never replaces by default") {
    fs.put_file("/logs/src", "new");
    fs.put_file("/logs/dst", "old");
    REQUIRE_FALSE(fs.rename("/logs/src", "/logs/dst"));
    REQUIRE(fs.contents("/logs/dst") == "old");
    REQUIRE(fs.rename("/logs/src", "/logs/other"));
    REQUIRE_FALSE(fs.exists("/logs/src"));
    REQUIRE(fs.contents("/logs/other") == "new");
  }

  SECTION("Overwrite rename mode replaces") {
    REQUIRE(fs.supports_atomic_rename());
    fs.set_rename_mode(SimulatedFileSystem::RenameMode::Overwrite);
    // A replacing rename cannot back create-if-absent publishing
    REQUIRE_FALSE(fs.supports_atomic_rename());
    fs.put_file("/logs/src", "new");
    fs.put_file("/logs/dst", "old");
    REQUIRE(fs.rename("/logs/src", "/logs/dst"));
    REQUIRE(fs.contents("/logs/dst") == "new");
  }

  SECTION("Remove") {
    fs.put_file("/logs/sub/a", "x");
    REQUIRE_THROWS_AS(fs.remove("/logs/sub", false), IOError);
    REQUIRE(fs.remove("/logs/sub", true));
    REQUIRE_FALSE(fs.exists("/logs/sub/a"));
    REQUIRE_FALSE(fs.remove("/logs/sub", false));
  }

  SECTION("Qualified names") {
    REQUIRE(fs.make_qualified("/logs/a") == "sim:///logs/a");
    REQUIRE(fs.make_qualified("logs/a") == "sim:///logs/a");
  }
}

TEST_CASE("SimulatedFileSystem - fault injection", "[storage][sim][unit]") {
  SimulatedFileSystem fs;
  fs.mkdirs("/logs");

  SECTION("Write fails after a byte budget") {
    SimulatedFileSystem::Faults faults;
    faults.fail_write_after_bytes = 3;
    fs.set_faults(faults);

    auto out = fs.open_for_write("/logs/a", false);
    REQUIRE_THROWS_AS(out->write("hello"), IOError);
    REQUIRE(fs.contents("/logs/a") == "hel");
  }

  SECTION("Close failure still releases the stream") {
    SimulatedFileSystem::Faults faults;
    faults.fail_close = true;
    fs.set_faults(faults);

    auto out = fs.open_for_write("/logs/a", false);
    REQUIRE(fs.open_output_streams() == 1);
    REQUIRE_THROWS_AS(out->close(), IOError);
    REQUIRE(fs.open_output_streams() == 0);
    REQUIRE_NOTHROW(out->close());
  }

  SECTION("Before-rename hook may call back in") {
    fs.put_file("/logs/src", "mine");
    fs.set_before_rename_hook([&](const LogPath &, const LogPath &dst) {
      fs.put_file(dst, "theirs");
    });
    REQUIRE_FALSE(fs.rename("/logs/src", "/logs/dst"));
    REQUIRE(fs.contents("/logs/dst") == "theirs");
    REQUIRE(fs.rename_calls() == 1);
  }
}
