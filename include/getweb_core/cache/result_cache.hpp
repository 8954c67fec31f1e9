#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace getweb_core {

/**
 * @brief Size- and time-bounded map from fingerprint to a cached value.
 *
 * Entries expire ttl after insertion; expiry is checked on read. After an
 * insert that leaves more than capacity entries, the oldest entries are
 * evicted. A capacity of 0 disables storing altogether. Safe to share between
 * threads.
 */
template <typename V>
class ResultCache {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  ResultCache(std::size_t capacity, std::chrono::seconds ttl, ClockFn clock = &Clock::now)
      : capacity_(capacity), ttl_(ttl), clock_(std::move(clock)) {}

  std::optional<V> get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (clock_() - it->second.inserted_at >= ttl_) {
      entries_.erase(it);
      return std::nullopt;
    }
    return it->second.value;
  }

  void put(const std::string& key, V value) {
    if (capacity_ == 0) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(key, Entry{std::move(value), clock_()});
    while (entries_.size() > capacity_) {
      evict_oldest();
    }
  }

  // Drops every entry whose ttl has elapsed
  void purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now - it->second.inserted_at >= ttl_) {
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::size_t capacity() const {
    return capacity_;
  }

 private:
  struct Entry {
    V value;
    Clock::time_point inserted_at;
  };

  void evict_oldest() {
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->second.inserted_at < oldest->second.inserted_at) {
        oldest = it;
      }
    }
    entries_.erase(oldest);
  }

  std::size_t capacity_;
  std::chrono::seconds ttl_;
  ClockFn clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace getweb_core
