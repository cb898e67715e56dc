/**
 * @file test_buffer_pool.cpp
 * @brief Tests for buffer_pool.hpp
 */

#include "sift/buffer_pool.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

TEST_CASE("BufferPool construction", "[buffer_pool]") {
  sift::BufferPool pool(6, 1024);
  REQUIRE(pool.Capacity() == 6U);
  REQUIRE(pool.BufferSize() == 1024U);
  REQUIRE(pool.Available() == 6U);
  REQUIRE(pool.Outstanding() == 0U);
  REQUIRE(pool.HighWatermark() == 0U);
}

TEST_CASE("BufferPool acquire and release", "[buffer_pool]") {
  sift::BufferPool pool(2, 64);

  auto a = pool.Acquire();
  REQUIRE(a.has_value());
  sift::PooledBuffer buf = std::move(a).value();
  REQUIRE(buf.valid());
  REQUIRE(buf.capacity() == 64U);
  REQUIRE(pool.Outstanding() == 1U);
  REQUIRE(pool.Available() == 1U);

  buf.data()[0] = 0xAB;
  buf.Release();
  REQUIRE_FALSE(buf.valid());
  REQUIRE(buf.capacity() == 0U);
  REQUIRE(pool.Outstanding() == 0U);
  REQUIRE(pool.Available() == 2U);

  // Second Release on an empty handle is a no-op.
  buf.Release();
  REQUIRE(pool.Available() == 2U);
}

TEST_CASE("BufferPool handle returns buffer on destruction", "[buffer_pool]") {
  sift::BufferPool pool(1, 16);
  {
    auto a = pool.Acquire();
    REQUIRE(a.has_value());
    REQUIRE(pool.Available() == 0U);
  }
  REQUIRE(pool.Available() == 1U);
  REQUIRE(pool.Outstanding() == 0U);
}

TEST_CASE("BufferPool move transfers ownership exactly once", "[buffer_pool]") {
  sift::BufferPool pool(2, 16);
  sift::PooledBuffer first = std::move(pool.Acquire()).value();
  uint8_t* raw = first.data();

  sift::PooledBuffer second(std::move(first));
  REQUIRE_FALSE(first.valid());
  REQUIRE(second.data() == raw);
  REQUIRE(pool.Outstanding() == 1U);

  sift::PooledBuffer third = std::move(pool.Acquire()).value();
  REQUIRE(pool.Outstanding() == 2U);
  // Assigning over a live handle returns the old buffer first.
  third = std::move(second);
  REQUIRE(pool.Outstanding() == 1U);
  REQUIRE(third.data() == raw);

  pool.Release(third);
  REQUIRE(pool.Outstanding() == 0U);
  REQUIRE(pool.Available() == 2U);
}

TEST_CASE("BufferPool acquire blocks when exhausted", "[buffer_pool]") {
  sift::BufferPool pool(2, 32);
  sift::PooledBuffer a = std::move(pool.Acquire()).value();
  sift::PooledBuffer b = std::move(pool.Acquire()).value();

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    auto c = pool.Acquire();
    acquired.store(c.has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(acquired.load());
  REQUIRE(pool.Outstanding() == 2U);

  a.Release();
  waiter.join();
  REQUIRE(acquired.load());
  REQUIRE(pool.HighWatermark() == 2U);
}

TEST_CASE("BufferPool checkouts never exceed capacity", "[buffer_pool]") {
  constexpr uint32_t kBuffers = 3;
  sift::BufferPool pool(kBuffers, 128);
  std::atomic<uint32_t> max_seen{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 6; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        auto r = pool.Acquire();
        if (!r.has_value()) {
          return;
        }
        uint32_t now = pool.Outstanding();
        uint32_t seen = max_seen.load();
        while (now > seen && !max_seen.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::yield();
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  REQUIRE(max_seen.load() <= kBuffers);
  REQUIRE(pool.HighWatermark() <= kBuffers);
  REQUIRE(pool.Outstanding() == 0U);
  REQUIRE(pool.Available() == kBuffers);
}

TEST_CASE("BufferPool Interrupt cancels a blocked acquire", "[buffer_pool]") {
  sift::BufferPool pool(1, 8);
  sift::PooledBuffer held = std::move(pool.Acquire()).value();

  sift::ChannelError err = sift::ChannelError::kClosed;
  bool got = true;
  std::thread waiter([&] {
    auto r = pool.Acquire();
    got = r.has_value();
    if (!got) {
      err = r.get_error();
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  pool.Interrupt();
  waiter.join();
  REQUIRE_FALSE(got);
  REQUIRE(err == sift::ChannelError::kInterrupted);

  // Returning a buffer never waits, so it succeeds while interrupted.
  held.Release();
  REQUIRE(pool.Available() == 1U);

  pool.ClearInterrupt();
  auto again = pool.Acquire();
  REQUIRE(again.has_value());
}
