// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Integration tests for LocalFileSystem and the store on real disk

#include "storage/errors.hpp"
#include "storage/local_file_system.hpp"
#include "storage/log_store.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>

using namespace commitlog::storage;
using commitlog::test::SequenceTokenSource;
using commitlog::test::TempDirFixture;

namespace {
using Lines = std::vector<std::string>;
}

TEST_CASE("LocalFileSystem - no-replace rename", "[storage][local][integration]") {
  TempDirFixture fixture("commitlog_local_test");
  LocalFileSystem fs(fixture.test_dir);

  fixture.WriteRaw("src", "new");
  fixture.WriteRaw("dst", "old");

  SECTION("Existing destination is kept") {
    REQUIRE_FALSE(fs.rename("src", "dst"));
    REQUIRE(fixture.ReadRaw("dst") == "old");
    REQUIRE(fs.exists("src"));
  }

  SECTION("Free destination") {
    REQUIRE(fs.rename("src", "free"));
    REQUIRE_FALSE(fs.exists("src"));
    REQUIRE(fixture.ReadRaw("free") == "new");
  }

  SECTION("Missing source") {
    REQUIRE_FALSE(fs.rename("absent", "other"));
  }
}

TEST_CASE("LocalFileSystem - streams and listing", "[storage][local][integration]") {
  TempDirFixture fixture("commitlog_local_test");
  LocalFileSystem fs(fixture.test_dir, true);

  SECTION("Create-only open") {
    auto out = fs.open_for_write("a", false);
    out->write("payload");
    out->close();
    REQUIRE(fixture.ReadRaw("a") == "payload");
    REQUIRE_THROWS_AS(fs.open_for_write("a", false), FileAlreadyExistsError);
    REQUIRE_THROWS_AS(fs.open_for_write("nope/a", true), FileNotFoundError);
  }

  SECTION("Read with skip") {
    fixture.WriteRaw("a", "0123456789");
    auto in = fs.open_for_read("a");
    in->skip(4);
    char buf[3];
    REQUIRE(in->read(buf, 3) == 3);
    REQUIRE(std::string(buf, 3) == "456");
    in->close();
    in->close();
    REQUIRE_THROWS_AS(fs.open_for_read("missing"), FileNotFoundError);
  }

  SECTION("Listing reports sizes and directories") {
    fixture.WriteRaw("dir/0001", "abc");
    fixture.WriteRaw("dir/sub/x", "");
    auto entries = fs.list_status("dir");
    REQUIRE(entries.size() == 2);
    for (const auto &status : entries) {
      if (status.name() == "0001") {
        REQUIRE(status.size == 3);
        REQUIRE_FALSE(status.is_directory);
        REQUIRE(status.path.str() == "dir/0001");
        REQUIRE(status.modification_time > 0);
      } else {
        REQUIRE(status.name() == "sub");
        REQUIRE(status.is_directory);
      }
    }
    REQUIRE_THROWS_AS(fs.list_status("missing"), FileNotFoundError);
  }

  SECTION("Remove") {
    fixture.WriteRaw("dir/sub/x", "");
    REQUIRE(fs.remove("dir/sub/x", false));
    REQUIRE_FALSE(fs.remove("dir/sub/x", false));
    REQUIRE(fs.remove("dir", true));
    REQUIRE_FALSE(fs.exists("dir"));
  }

  SECTION("Qualified paths are absolute file URIs") {
    auto qualified = fs.make_qualified("logs/0001");
    REQUIRE(qualified.rfind("file:///", 0) == 0);
    REQUIRE(qualified.size() > std::string("logs/0001").size());
    REQUIRE(qualified.compare(qualified.size() - 9, 9, "logs/0001") == 0);
  }
}

TEST_CASE("LogStore - local disk end to end", "[storage][store][integration]") {
  TempDirFixture fixture("commitlog_local_store_test");
  std::filesystem::create_directories(fixture.test_dir / "logs");
  auto fs = std::make_shared<LocalFileSystem>(fixture.test_dir);
  FileSystemLogStore store(fs, std::make_shared<SequenceTokenSource>());

  store.write("logs/0001", Lines{"a", "b"}, false);
  store.write("logs/0002", Lines{"c"}, false);
  REQUIRE_THROWS_AS(store.write("logs/0002", Lines{"d"}, false),
                    FileAlreadyExistsError);
  REQUIRE(store.read_all("logs/0002") == Lines{"c"});

  fixture.WriteRaw("logs/0003", "crlf\r\nlone\rcr");
  REQUIRE(store.read_all("logs/0003") == Lines{"crlf", "lone", "cr"});

  std::vector<std::string> names;
  for (const auto &status : store.list_from("logs/0002")) {
    names.push_back(status.name());
  }
  REQUIRE(names == Lines{"0002", "0003"});

  // No staging files left behind
  size_t files = 0;
  for (const auto &entry :
       std::filesystem::directory_iterator(fixture.test_dir / "logs")) {
    REQUIRE_FALSE(TempPathGenerator::IsTempName(entry.path().filename().string()));
    ++files;
  }
  REQUIRE(files == 3);

  REQUIRE_THROWS_AS(store.write("absent/0001", Lines{"x"}, false),
                    FileNotFoundError);
  REQUIRE_THROWS_AS(store.list_from("absent/0001"), FileNotFoundError);
}
