// Unit tests for CancelToken
#include <catch2/catch_test_macros.hpp>
#include "session/cancel_token.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace custody::session;

TEST_CASE("CancelToken - callback runs once", "[session][cancel]") {
  auto token = CancelToken::Create();
  int calls = 0;
  token->SetCallback([&] { calls++; });

  REQUIRE_FALSE(token->IsCancelled());
  token->Cancel();
  token->Cancel();
  REQUIRE(token->IsCancelled());
  REQUIRE(calls == 1);
}

TEST_CASE("CancelToken - late callback runs immediately", "[session][cancel]") {
  auto token = CancelToken::Create();
  token->Cancel();

  bool ran = false;
  token->SetCallback([&] { ran = true; });
  REQUIRE(ran);
}

TEST_CASE("CancelToken - cleared callback does not run", "[session][cancel]") {
  auto token = CancelToken::Create();
  bool ran = false;
  token->SetCallback([&] { ran = true; });
  token->ClearCallback();
  token->Cancel();
  REQUIRE_FALSE(ran);
  REQUIRE(token->IsCancelled());
}

TEST_CASE("CancelToken - concurrent cancels", "[session][cancel]") {
  auto token = CancelToken::Create();
  std::atomic<int> calls{0};
  token->SetCallback([&] { calls++; });

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&] { token->Cancel(); });
  }
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE(calls.load() == 1);
}
