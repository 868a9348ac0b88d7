// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for staging path generation

#include "storage/temp_path.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>

using namespace commitlog::storage;
using commitlog::test::SequenceTokenSource;

TEST_CASE("TempPathGenerator - staging file sits next to the target",
          "[storage][temp][unit]") {
  TempPathGenerator gen(std::make_shared<SequenceTokenSource>());

  auto first = gen.make(LogPath("/logs/0005"));
  auto second = gen.make(LogPath("/logs/0005"));

  REQUIRE(first.str() == "/logs/.0005.t0.tmp");
  REQUIRE(second.str() == "/logs/.0005.t1.tmp");
  REQUIRE(first.parent() == LogPath("/logs"));

  REQUIRE(gen.make(LogPath("0007")).str() == ".0007.t2.tmp");
}

TEST_CASE("TempPathGenerator - recognizes staging names",
          "[storage][temp][unit]") {
  REQUIRE(TempPathGenerator::IsTempName(".0005.t0.tmp"));
  REQUIRE_FALSE(TempPathGenerator::IsTempName("0005"));
  REQUIRE_FALSE(TempPathGenerator::IsTempName("0005.tmp"));
  REQUIRE_FALSE(TempPathGenerator::IsTempName(".tmp"));
}

TEST_CASE("RandomTokenSource - version 4 UUIDs", "[storage][temp][unit]") {
  RandomTokenSource tokens;
  std::set<std::string> seen;

  for (int i = 0; i < 100; ++i) {
    auto token = tokens.next_token();
    REQUIRE(token.size() == 36);
    REQUIRE(token[8] == '-');
    REQUIRE(token[13] == '-');
    REQUIRE(token[14] == '4');
    REQUIRE(token[18] == '-');
    REQUIRE((token[19] == '8' || token[19] == '9' || token[19] == 'a' ||
             token[19] == 'b'));
    REQUIRE(token[23] == '-');
    seen.insert(token);
  }
  REQUIRE(seen.size() == 100);
}
