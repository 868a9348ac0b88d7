// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string &level);
void ShutdownTestLogging();

int main(int argc, char *argv[]) {
  // COMMITLOG_TEST_LOGLEVEL=trace shows everything the store logs
  const char *level = std::getenv("COMMITLOG_TEST_LOGLEVEL");
  InitializeTestLogging(level ? level : "warn");

  int result = Catch::Session().run(argc, argv);

  ShutdownTestLogging();
  return result;
}
