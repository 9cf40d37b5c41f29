// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace custody {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded key/value map
 *
 * Every operation takes the lock exactly once. Values are returned by copy
 * (Get) or inspected in place under the lock (Read); there is no iterator
 * API, so no caller can hold a reference past the lock.
 *
 * Usage:
 *   ThreadSafeMap<std::string, TenantId> routes_;
 *   routes_.Insert(verkey, tenant);
 *   auto tenant = routes_.Get(verkey);   // std::optional<TenantId>
 */
template <typename Key, typename Value,
          template <typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
  ThreadSafeMap() = default;

  ThreadSafeMap(const ThreadSafeMap &) = delete;
  ThreadSafeMap &operator=(const ThreadSafeMap &) = delete;
  ThreadSafeMap(ThreadSafeMap &&) = delete;
  ThreadSafeMap &operator=(ThreadSafeMap &&) = delete;

  // Insert or overwrite. Returns true if the key was new.
  bool Insert(const Key &key, const Value &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = map_.insert_or_assign(key, value);
    return inserted;
  }

  std::optional<Value> Get(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // Calls reader(const Value&) under the lock. Returns false if absent.
  template <typename Func> bool Read(const Key &key, Func &&reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    reader(it->second);
    return true;
  }

  bool Contains(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.count(key) > 0;
  }

  bool Erase(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
  }

  std::vector<Key> GetKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(map_.size());
    for (const auto &[key, _] : map_) {
      keys.push_back(key);
    }
    return keys;
  }

private:
  mutable std::mutex mutex_;
  MapType<Key, Value> map_;
};

} // namespace util
} // namespace custody
