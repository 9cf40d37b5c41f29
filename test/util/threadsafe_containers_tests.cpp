// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace custody::util;

// ============================================================================
// ThreadSafeMap Tests
// ============================================================================

TEST_CASE("ThreadSafeMap: Basic operations", "[util][threadsafe][map]") {
  ThreadSafeMap<std::string, std::string> map;

  SECTION("Insert and Get") {
    REQUIRE(map.Insert("VK_A", "acme"));
    REQUIRE(map.Get("VK_A") == std::string("acme"));
    REQUIRE_FALSE(map.Get("VK_B").has_value());
  }

  SECTION("Insert existing key overwrites and returns false") {
    REQUIRE(map.Insert("VK_A", "acme"));
    REQUIRE_FALSE(map.Insert("VK_A", "globex"));
    REQUIRE(map.Get("VK_A") == std::string("globex"));
    REQUIRE(map.Size() == 1);
  }

  SECTION("Read inspects in place") {
    map.Insert("VK_A", "acme");
    size_t length = 0;
    REQUIRE(map.Read("VK_A", [&](const std::string &value) { length = value.size(); }));
    REQUIRE(length == 4);
    REQUIRE_FALSE(map.Read("VK_B", [&](const std::string &) { length = 0; }));
    REQUIRE(length == 4);
  }

  SECTION("Contains, Erase and Clear") {
    map.Insert("a", "1");
    map.Insert("b", "2");
    REQUIRE(map.Contains("a"));
    REQUIRE(map.Erase("a"));
    REQUIRE_FALSE(map.Erase("a"));
    REQUIRE_FALSE(map.Contains("a"));
    REQUIRE(map.Size() == 1);
    map.Clear();
    REQUIRE(map.Size() == 0);
  }

  SECTION("GetKeys") {
    map.Insert("a", "1");
    map.Insert("b", "2");
    auto keys = map.GetKeys();
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{"a", "b"});
  }
}

TEST_CASE("ThreadSafeMap: Ordered map type", "[util][threadsafe][map]") {
  ThreadSafeMap<int, int, std::map> map;
  map.Insert(3, 30);
  map.Insert(1, 10);
  map.Insert(2, 20);
  REQUIRE(map.GetKeys() == std::vector<int>{1, 2, 3});
}

TEST_CASE("ThreadSafeMap: Shared pointer values", "[util][threadsafe][map]") {
  ThreadSafeMap<uint64_t, std::shared_ptr<int>> map;
  auto value = std::make_shared<int>(5);
  map.Insert(1, value);
  REQUIRE(value.use_count() == 2);

  auto copy = map.Get(1);
  REQUIRE(copy.has_value());
  REQUIRE(**copy == 5);

  map.Erase(1);
  copy.reset();
  REQUIRE(value.use_count() == 1);
}

TEST_CASE("ThreadSafeMap: Concurrent access", "[util][threadsafe][map][concurrent]") {
  ThreadSafeMap<int, int> map;
  constexpr int NUM_THREADS = 8;
  constexpr int OPS_PER_THREAD = 500;

  SECTION("Disjoint inserts") {
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
      threads.emplace_back([&map, t] {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
          map.Insert(t * OPS_PER_THREAD + i, i);
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    REQUIRE(map.Size() == NUM_THREADS * OPS_PER_THREAD);
  }

  SECTION("Mixed readers and writers") {
    std::atomic<int> found{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
      threads.emplace_back([&map, &found, t] {
        for (int i = 0; i < OPS_PER_THREAD; ++i) {
          if (t % 2 == 0) {
            map.Insert(i, t);
            map.Erase(i + 1);
          } else if (map.Get(i)) {
            found.fetch_add(1);
          }
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    REQUIRE(map.Size() <= OPS_PER_THREAD);
  }
}
