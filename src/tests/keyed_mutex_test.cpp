#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include "upload/keyed_mutex.hpp"
#include "test_utils.hpp"

using namespace cfs::upload;

class KeyedMutexTest : public ::testing::Test {
protected:
  KeyedMutex locks;

  void SetUp() override {
    init_logging();
  }
};

TEST_F(KeyedMutexTest, DistinctKeysDoNotBlock) {
  auto held = locks.lock("alpha");

  auto other = std::async(std::launch::async, [this]() {
    auto guard = locks.lock("beta");
    return guard.key();
  });

  ASSERT_EQ(other.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(other.get(), "beta");
}

TEST_F(KeyedMutexTest, SameKeyWaitsForHolder) {
  std::atomic<bool> acquired{false};
  std::future<void> waiter;
  {
    auto held = locks.lock("alpha");
    waiter = std::async(std::launch::async, [this, &acquired]() {
      auto guard = locks.lock("alpha");
      acquired = true;
    });

    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_FALSE(acquired);
  }

  ASSERT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(acquired);
}

TEST_F(KeyedMutexTest, CriticalSectionsDoNotOverlap) {
  const int num_threads = 8;
  const int iterations = 200;
  int counter = 0;
  std::atomic<int> inside{0};
  std::atomic<int> overlaps{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < iterations; ++j) {
        auto guard = locks.lock("shared");
        if (inside.fetch_add(1) != 0) {
          overlaps++;
        }
        ++counter;
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(overlaps, 0);
  EXPECT_EQ(counter, num_threads * iterations);
}

TEST_F(KeyedMutexTest, SlotsAreReleased) {
  {
    auto a = locks.lock("a");
    auto b = locks.lock("b");
    EXPECT_EQ(locks.active_keys(), 2u);

    // Moving a guard keeps exactly one owner
    auto moved = std::move(a);
    EXPECT_EQ(locks.active_keys(), 2u);
  }
  EXPECT_EQ(locks.active_keys(), 0u);

  auto again = locks.lock("a");
  EXPECT_EQ(locks.active_keys(), 1u);
}
