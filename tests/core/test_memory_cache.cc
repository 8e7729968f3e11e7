#include "hitl/core/memory_cache.h"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace hitl {
namespace {

class MemoryCacheTest : public ::testing::Test {
 protected:
  using Cache = MemoryCache<std::string, int>;

  void SetUp() override {
    now_ = std::chrono::steady_clock::time_point();
    cache_ = std::make_unique<Cache>(3, std::chrono::seconds(10),
                                     [this]() { return now_; });
  }

  void advance(int seconds) { now_ += std::chrono::seconds(seconds); }

  std::chrono::steady_clock::time_point now_;
  std::unique_ptr<Cache> cache_;
};

TEST_F(MemoryCacheTest, BasicPutAndGet) {
  cache_->put("key1", 100);
  cache_->put("key2", 200);

  ASSERT_TRUE(cache_->get("key1").has_value());
  EXPECT_EQ(cache_->get("key1").value(), 100);
  EXPECT_EQ(cache_->get("key2").value(), 200);
  EXPECT_FALSE(cache_->get("nonexistent").has_value());
  EXPECT_EQ(cache_->size(), 2u);
  EXPECT_EQ(cache_->capacity(), 3u);
}

TEST_F(MemoryCacheTest, UpdateExistingKey) {
  cache_->put("key1", 100);
  cache_->put("key1", 150);
  EXPECT_EQ(cache_->get("key1").value(), 150);
  EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(MemoryCacheTest, TTLExpiration) {
  cache_->put("short", 1, std::chrono::seconds(2));
  cache_->put("default", 2);

  advance(1);
  EXPECT_TRUE(cache_->get("short").has_value());
  advance(1);
  EXPECT_FALSE(cache_->get("short").has_value());
  EXPECT_TRUE(cache_->get("default").has_value());
  advance(8);
  EXPECT_FALSE(cache_->get("default").has_value());
  EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(MemoryCacheTest, LRUEviction) {
  cache_->put("a", 1);
  cache_->put("b", 2);
  cache_->put("c", 3);

  // Touch "a" so "b" becomes the oldest
  ASSERT_TRUE(cache_->get("a").has_value());
  cache_->put("d", 4);

  EXPECT_EQ(cache_->size(), 3u);
  EXPECT_TRUE(cache_->get("a").has_value());
  EXPECT_FALSE(cache_->get("b").has_value());
  EXPECT_TRUE(cache_->get("c").has_value());
  EXPECT_TRUE(cache_->get("d").has_value());
}

TEST_F(MemoryCacheTest, RemoveAndClear) {
  cache_->put("a", 1);
  cache_->put("b", 2);

  EXPECT_TRUE(cache_->remove("a"));
  EXPECT_FALSE(cache_->remove("a"));
  EXPECT_FALSE(cache_->get("a").has_value());

  cache_->clear();
  EXPECT_EQ(cache_->size(), 0u);
  EXPECT_FALSE(cache_->get("b").has_value());
}

TEST_F(MemoryCacheTest, EvictExpired) {
  cache_->put("a", 1, std::chrono::seconds(1));
  cache_->put("b", 2, std::chrono::seconds(1));
  cache_->put("c", 3, std::chrono::seconds(30));

  advance(5);
  EXPECT_EQ(cache_->evictExpired(), 2u);
  EXPECT_EQ(cache_->size(), 1u);
  EXPECT_EQ(cache_->evictExpired(), 0u);
}

TEST_F(MemoryCacheTest, GetOrLoadCachesResult) {
  int loads = 0;
  auto loader = [&loads]() {
    ++loads;
    return 42;
  };

  EXPECT_EQ(cache_->getOrLoad("devices", loader), 42);
  EXPECT_EQ(cache_->getOrLoad("devices", loader), 42);
  EXPECT_EQ(loads, 1);

  advance(10);
  EXPECT_EQ(cache_->getOrLoad("devices", loader), 42);
  EXPECT_EQ(loads, 2);
}

TEST_F(MemoryCacheTest, GetOrLoadDoesNotCacheFailures) {
  EXPECT_THROW(cache_->getOrLoad("devices",
                                 []() -> int {
                                   throw std::runtime_error("backend down");
                                 }),
               std::runtime_error);
  EXPECT_FALSE(cache_->get("devices").has_value());
  EXPECT_EQ(cache_->getOrLoad("devices", []() { return 7; }), 7);
}

TEST_F(MemoryCacheTest, ComplexValues) {
  MemoryCache<std::string, std::vector<std::string>> keys(
      4, std::chrono::seconds(60));
  keys.put("devices", {"key-1", "key-2"});

  auto cached = keys.get("devices");
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(cached->size(), 2u);
  EXPECT_EQ((*cached)[1], "key-2");
}

TEST(MemoryCacheThreadTest, ConcurrentAccess) {
  MemoryCache<int, int> cache(64, std::chrono::seconds(60));
  std::atomic<int> hits{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&cache, &hits, t]() {
      for (int i = 0; i < 500; ++i) {
        int key = (t * 500 + i) % 100;
        cache.put(key, i);
        if (cache.get(key)) {
          ++hits;
        }
        if (i % 50 == 0) {
          cache.remove(key);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_LE(cache.size(), 64u);
  EXPECT_GT(hits.load(), 0);
}

}  // namespace
}  // namespace hitl
