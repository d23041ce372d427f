/// @file test_server_pool.cpp
/// @brief Unit tests for ServerPool.

#include "common/error.hpp"
#include "pool/server_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace game_lb;

TEST(ServerPoolTest, CreateWithZeroFails) {
  auto result = ServerPool::create(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), errc::invalid_server_count);
}

TEST(ServerPoolTest, StartsEmpty) {
  auto pool = ServerPool::create(3).value();
  EXPECT_EQ(pool.size(), 3u);

  auto snap = pool.snapshot();
  ASSERT_EQ(snap.size(), 3u);
  for (std::size_t i = 0; i < snap.size(); ++i) {
    EXPECT_EQ(snap[i].server_id, i);
    EXPECT_EQ(snap[i].requests_served, 0u);
    EXPECT_DOUBLE_EQ(snap[i].total_response_time, 0.0);
    EXPECT_DOUBLE_EQ(snap[i].avg_response_time(), 0.0);
  }
}

TEST(ServerPoolTest, NamesAreOneBased) {
  auto pool = ServerPool::create(2).value();
  auto snap = pool.snapshot();
  EXPECT_EQ(snap[0].name, "Game_Server_1");
  EXPECT_EQ(snap[1].name, "Game_Server_2");
  EXPECT_EQ(ServerPool::server_name(9), "Game_Server_10");
}

TEST(ServerPoolTest, RecordCompletionAccumulates) {
  auto pool = ServerPool::create(2).value();
  ASSERT_TRUE(pool.record_completion(1, 1.5).has_value());
  ASSERT_TRUE(pool.record_completion(1, 2.5).has_value());

  auto s = pool.stats(1);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->requests_served, 2u);
  EXPECT_DOUBLE_EQ(s->total_response_time, 4.0);
  EXPECT_DOUBLE_EQ(s->avg_response_time(), 2.0);

  EXPECT_EQ(pool.stats(0)->requests_served, 0u);
}

TEST(ServerPoolTest, OutOfRangeIndexRejected) {
  auto pool = ServerPool::create(2).value();
  auto result = pool.record_completion(2, 1.0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), errc::invalid_server_index);
  EXPECT_TRUE(is_dispatch_error(result.error()));

  EXPECT_FALSE(pool.stats(5).has_value());
  EXPECT_FALSE(pool.contains(2));
  EXPECT_TRUE(pool.contains(1));

  // Nothing recorded anywhere.
  for (const auto &s : pool.snapshot()) {
    EXPECT_EQ(s.requests_served, 0u);
  }
}

TEST(ServerPoolTest, MoveKeepsCounters) {
  auto pool = ServerPool::create(2).value();
  ASSERT_TRUE(pool.record_completion(0, 3.0).has_value());

  ServerPool moved{std::move(pool)};
  EXPECT_EQ(moved.size(), 2u);
  EXPECT_EQ(moved.stats(0)->requests_served, 1u);
}

// ─── Concurrency ────────────────────────────────────────────────────────

TEST(ServerPoolTest, ConcurrentUpdatesToSameServerAreNotLost) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 5000;
  auto pool = ServerPool::create(1).value();

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        ASSERT_TRUE(pool.record_completion(0, 1.0).has_value());
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  auto s = pool.stats(0).value();
  EXPECT_EQ(s.requests_served, static_cast<std::uint64_t>(kThreads * kPerThread));
  EXPECT_DOUBLE_EQ(s.total_response_time,
                   static_cast<double>(kThreads * kPerThread));
}

TEST(ServerPoolTest, SnapshotPairsStayConsistentUnderWriters) {
  // Every completion adds exactly 2.0, so a consistent pair always has
  // total == 2 * count.
  auto pool = ServerPool::create(4).value();
  std::atomic<bool> running{true};

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&, t] {
      std::size_t idx = static_cast<std::size_t>(t);
      while (running.load()) {
        ASSERT_TRUE(pool.record_completion(idx, 2.0).has_value());
        idx = (idx + 1) % 4;
      }
    });
  }

  for (int round = 0; round < 2000; ++round) {
    for (const auto &s : pool.snapshot()) {
      ASSERT_DOUBLE_EQ(s.total_response_time,
                       2.0 * static_cast<double>(s.requests_served));
    }
  }

  running = false;
  for (auto &t : writers) {
    t.join();
  }
}
