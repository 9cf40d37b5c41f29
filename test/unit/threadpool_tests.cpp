// Unit tests for util::ThreadPool
#include <catch2/catch_test_macros.hpp>
#include "util/threadpool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

using namespace custody::util;
using namespace std::chrono_literals;

TEST_CASE("ThreadPool - runs tasks", "[util][threadpool]") {
  ThreadPool pool(4, 0, "test");
  REQUIRE(pool.size() == 4);
  REQUIRE(pool.name() == "test");

  SECTION("enqueue returns results") {
    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.enqueue([] { return std::string("done"); });
    REQUIRE(sum.get() == 5);
    REQUIRE(text.get() == "done");
  }

  SECTION("enqueue propagates exceptions through the future") {
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
  }

  SECTION("TryPost runs every task") {
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
      REQUIRE(pool.TryPost([&counter] { counter.fetch_add(1); }));
    }
    pool.shutdown();
    pool.wait_for_completion();
    REQUIRE(counter.load() == 100);
    REQUIRE(pool.tasks_completed() == 100);
  }

  SECTION("Empty task is refused") {
    REQUIRE_FALSE(pool.TryPost(std::function<void()>()));
  }
}

TEST_CASE("ThreadPool - worker survives a throwing task", "[util][threadpool]") {
  ThreadPool pool(1, 0, "test");
  REQUIRE(pool.TryPost([] { throw std::runtime_error("task failed"); }));
  auto after = pool.enqueue([] { return 7; });
  REQUIRE(after.get() == 7);
  REQUIRE(pool.task_exceptions() == 1);
}

TEST_CASE("ThreadPool - queue limit", "[util][threadpool]") {
  ThreadPool pool(1, 1, "bounded");

  std::promise<void> started;
  std::promise<void> release;
  auto release_future = release.get_future().share();

  REQUIRE(pool.TryPost([&started, release_future] {
    started.set_value();
    release_future.wait();
  }));
  started.get_future().wait(); // worker busy, queue empty

  std::atomic<int> ran{0};
  REQUIRE(pool.TryPost([&ran] { ran.fetch_add(1); }));
  REQUIRE(pool.pending_tasks() == 1);
  REQUIRE_FALSE(pool.TryPost([&ran] { ran.fetch_add(1); }));
  REQUIRE_THROWS_AS(pool.enqueue([] { return 0; }), std::runtime_error);

  release.set_value();
  pool.shutdown();
  pool.wait_for_completion();
  REQUIRE(ran.load() == 1);
}

TEST_CASE("ThreadPool - shutdown", "[util][threadpool]") {
  ThreadPool pool(2, 0, "test");

  std::atomic<int> ran{0};
  for (int i = 0; i < 10; ++i) {
    REQUIRE(pool.TryPost([&ran] {
      std::this_thread::sleep_for(1ms);
      ran.fetch_add(1);
    }));
  }

  pool.shutdown();
  pool.shutdown();
  REQUIRE(pool.is_stopped());
  REQUIRE_FALSE(pool.TryPost([] {}));
  REQUIRE_THROWS_AS(pool.enqueue([] { return 0; }), std::runtime_error);

  pool.wait_for_completion();
  REQUIRE(ran.load() == 10); // queued work drains
}
