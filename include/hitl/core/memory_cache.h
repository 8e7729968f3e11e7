#ifndef HITL_CORE_MEMORY_CACHE_H
#define HITL_CORE_MEMORY_CACHE_H

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <unordered_map>

#include "hitl/core/compat.h"

/**
 * @file memory_cache.h
 * @brief Thread-safe LRU cache with per-entry TTL
 */

namespace hitl {

/**
 * @brief Thread-safe LRU cache with TTL support
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Hash The hash function for the key type
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class MemoryCache {
 public:
  using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

  /**
   * @param max_size Maximum number of entries
   * @param default_ttl Time-to-live for entries put without an explicit TTL
   * @param clock Time source, replaced in tests
   */
  explicit MemoryCache(size_t max_size = 64,
                       std::chrono::seconds default_ttl = std::chrono::seconds(60),
                       SteadyClock clock = SteadyClock())
      : max_size_(max_size),
        default_ttl_(default_ttl),
        clock_(clock ? std::move(clock)
                     : SteadyClock([]() {
                         return std::chrono::steady_clock::now();
                       })) {}

  void put(const Key& key,
           const Value& value,
           optional<std::chrono::seconds> ttl = nullopt) {
    std::lock_guard<std::mutex> lock(mutex_);
    putLocked(key, value, ttl.value_or(default_ttl_));
  }

  // nullopt when absent or expired
  optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return getLocked(key);
  }

  /**
   * @brief Cached value, or the loader's result which is then cached
   *
   * The loader runs without the lock held; exceptions propagate and nothing
   * is cached.
   */
  template <typename Loader>
  Value getOrLoad(const Key& key, Loader&& loader) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto hit = getLocked(key);
      if (hit) {
        return *hit;
      }
    }
    Value loaded = loader();
    std::lock_guard<std::mutex> lock(mutex_);
    putLocked(key, loaded, default_ttl_);
    return loaded;
  }

  bool remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return false;
    }
    lru_list_.erase(it->second.list_iterator);
    cache_map_.erase(it);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_map_.clear();
    lru_list_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
  }

  size_t capacity() const { return max_size_; }

  // Returns the number of entries dropped
  size_t evictExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t evicted = 0;
    auto it = cache_map_.begin();
    while (it != cache_map_.end()) {
      if (now >= it->second.expiry) {
        lru_list_.erase(it->second.list_iterator);
        it = cache_map_.erase(it);
        ++evicted;
      } else {
        ++it;
      }
    }
    return evicted;
  }

 private:
  struct CacheData {
    typename std::list<Key>::iterator list_iterator;
    Value value;
    std::chrono::steady_clock::time_point expiry;
  };

  void putLocked(const Key& key, const Value& value, std::chrono::seconds ttl) {
    auto map_it = cache_map_.find(key);
    if (map_it != cache_map_.end()) {
      lru_list_.erase(map_it->second.list_iterator);
      cache_map_.erase(map_it);
    }

    lru_list_.push_front(key);
    cache_map_.emplace(key, CacheData{lru_list_.begin(), value, clock_() + ttl});

    while (cache_map_.size() > max_size_ && !lru_list_.empty()) {
      cache_map_.erase(lru_list_.back());
      lru_list_.pop_back();
    }
  }

  optional<Value> getLocked(const Key& key) {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return nullopt;
    }
    if (clock_() >= it->second.expiry) {
      lru_list_.erase(it->second.list_iterator);
      cache_map_.erase(it);
      return nullopt;
    }
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.list_iterator);
    it->second.list_iterator = lru_list_.begin();
    return it->second.value;
  }

  mutable std::mutex mutex_;
  size_t max_size_;
  std::chrono::seconds default_ttl_;
  SteadyClock clock_;
  std::list<Key> lru_list_;  // front = most recently used
  std::unordered_map<Key, CacheData, Hash> cache_map_;
};

}  // namespace hitl

#endif  // HITL_CORE_MEMORY_CACHE_H
