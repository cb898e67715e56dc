/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "sift/log.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <thread>
#include <vector>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(sift::log::GetLevel() == sift::log::Level::kInfo);
#else
  REQUIRE(sift::log::GetLevel() == sift::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = sift::log::GetLevel();
  sift::log::SetLevel(sift::log::Level::kError);
  REQUIRE(sift::log::GetLevel() == sift::log::Level::kError);
  sift::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!sift::log::IsInitialized());
  sift::log::Init();
  REQUIRE(sift::log::IsInitialized());
  sift::log::Shutdown();
  REQUIRE(!sift::log::IsInitialized());
}

TEST_CASE("Log macros compile and run", "[log]") {
  sift::log::SetLevel(sift::log::Level::kDebug);
  SIFT_LOG_DEBUG("Test", "debug %d", 1);
  SIFT_LOG_INFO("Test", "info %s", "msg");
  SIFT_LOG_WARN("Test", "warn");
  SIFT_LOG_ERROR("Test", "error %llu", 2ULL);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  sift::log::SetLevel(sift::log::Level::kOff);
  SIFT_LOG_INFO("Test", "should not appear");
  SIFT_LOG_ERROR("Test", "should not appear");
  sift::log::SetLevel(sift::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log level tags and basename", "[log]") {
  REQUIRE(std::strcmp(sift::log::detail::LevelTag(sift::log::Level::kWarn), "WARN") == 0);
  REQUIRE(std::strcmp(sift::log::detail::LevelTag(sift::log::Level::kFatal), "FATAL") == 0);
  REQUIRE(std::strcmp(sift::log::detail::Basename("/a/b/frame_reader.hpp"), "frame_reader.hpp") == 0);
  REQUIRE(std::strcmp(sift::log::detail::Basename("plain.cpp"), "plain.cpp") == 0);
}

TEST_CASE("Log concurrent writers", "[log]") {
  sift::log::SetLevel(sift::log::Level::kInfo);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 25; ++i) {
        SIFT_LOG_INFO("Test", "thread %d line %d", t, i);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  sift::log::SetLevel(sift::log::Level::kDebug);
  REQUIRE(true);
}
