// Unit tests for the exchange session state machine
#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include <future>
#include <thread>

using namespace custody;
using namespace custody::session;
using namespace custody::test;
using namespace std::chrono_literals;

TEST_CASE("Exchange - routing disabled keeps the base context", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings());
  auto exchange = fx.factory.Open({"agent.example", "10.0.0.1"});

  REQUIRE(exchange->state() == ExchangeState::OPEN);
  exchange->ResolveTenant(std::string("{}"));

  REQUIRE(exchange->state() == ExchangeState::CONTEXT_RESOLVED);
  REQUIRE(exchange->context() == fx.base); // same object, no substitution
  REQUIRE(fx.resolver.Calls() == 0);
  REQUIRE(fx.store.Opens() == 0);
}

TEST_CASE("Exchange - routing enabled binds the tenant context", "[session][exchange]") {
  SessionFixture fx(RoutingSettings(), {"acme"});
  auto exchange = fx.factory.Open({"agent.example", "10.0.0.1"});

  exchange->ResolveTenant(std::string("{}"));

  REQUIRE(exchange->context() != fx.base);
  REQUIRE(exchange->context()->Scope() == "acme");
  REQUIRE_FALSE(fx.base->HasTenant()); // base never mutated

  exchange->Receive(std::string("hello"));
  REQUIRE(fx.unpacker.Scopes() == std::vector<std::string>{"acme"});
}

TEST_CASE("Exchange - tenant resolution failure closes the exchange", "[session][exchange]") {
  SECTION("No candidates") {
    SessionFixture fx(RoutingSettings(), {});
    auto exchange = fx.factory.Open({});
    REQUIRE_THROWS_AS(exchange->ResolveTenant(std::string("{}")), TenantResolutionError);
    REQUIRE(exchange->is_closed());
    REQUIRE_FALSE(exchange->can_respond());
    REQUIRE_THROWS_AS(exchange->Receive(std::string("hello")), std::logic_error);
    REQUIRE(fx.unpacker.Calls() == 0);
  }

  SECTION("Store cannot be opened") {
    SessionFixture fx(RoutingSettings(), {"acme"});
    fx.store.FailOpen("acme");
    auto exchange = fx.factory.Open({});
    REQUIRE_THROWS_AS(exchange->ResolveTenant(std::string("{}")), TenantResolutionError);
    REQUIRE(exchange->is_closed());
    REQUIRE_FALSE(fx.cache.Contains("acme"));
    REQUIRE(fx.correlator.PendingCount() == 0);
  }
}

TEST_CASE("Exchange - ordering is enforced", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings());
  auto exchange = fx.factory.Open({});

  SECTION("Receive before ResolveTenant") {
    REQUIRE_THROWS_AS(exchange->Receive(std::string("hello")), std::logic_error);
  }

  SECTION("ResolveTenant twice") {
    exchange->ResolveTenant(std::string("{}"));
    REQUIRE_THROWS_AS(exchange->ResolveTenant(std::string("{}")), std::logic_error);
  }

  SECTION("Receive after close") {
    exchange->ResolveTenant(std::string("{}"));
    exchange->Close();
    REQUIRE_THROWS_AS(exchange->Receive(std::string("hello")), std::logic_error);
  }

  SECTION("AwaitResponse before Receive returns nothing") {
    REQUIRE_FALSE(exchange->AwaitResponse(10ms).has_value());
  }
}

TEST_CASE("Exchange - no direct response requested", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings());
  auto exchange = fx.factory.Open({});
  exchange->ResolveTenant(std::string("{}"));

  auto message = exchange->Receive(std::string("hello"));
  REQUIRE_FALSE(message.receipt.direct_response_requested);
  REQUIRE(exchange->state() == ExchangeState::NO_RESPONSE);
  REQUIRE_FALSE(exchange->direct_response_requested());
  REQUIRE_FALSE(fx.correlator.IsArmed(exchange->id()));

  auto targets = fx.router.Targets();
  REQUIRE(targets.size() == 1);
  REQUIRE_FALSE(targets[0].direct_response);
  REQUIRE(targets[0].exchange_id == exchange->id());
}

TEST_CASE("Exchange - direct response delivered", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings(2000ms));

  SECTION("Reply from another thread") {
    std::future<bool> producer;
    fx.router.SetReaction([&](const ParsedMessage &, const ReplyTarget &target) {
      producer = std::async(std::launch::async,
                            [&correlator = fx.correlator, id = target.exchange_id] {
                              std::this_thread::sleep_for(20ms);
                              return correlator.Deliver(id, std::string("ack"));
                            });
    });

    auto exchange = fx.factory.Open({});
    exchange->ResolveTenant(std::string("{}"));
    exchange->Receive(std::string("reply please"));
    REQUIRE(exchange->can_respond());

    auto reply = exchange->AwaitResponse();
    REQUIRE(reply.has_value());
    REQUIRE(std::get<std::string>(*reply) == "ack");
    REQUIRE(exchange->state() == ExchangeState::RESPONDED);
    REQUIRE_FALSE(exchange->can_respond());
    REQUIRE(producer.get());
  }

  SECTION("Reply produced inside Route is not lost") {
    fx.router.SetReaction([&](const ParsedMessage &, const ReplyTarget &target) {
      REQUIRE(fx.correlator.Deliver(target.exchange_id, Bytes{0xde, 0xad}));
    });

    auto exchange = fx.factory.Open({});
    exchange->ResolveTenant(std::string("{}"));
    exchange->Receive(std::string("reply please"));

    auto reply = exchange->AwaitResponse(10ms);
    REQUIRE(reply.has_value());
    REQUIRE(std::get<Bytes>(*reply) == Bytes{0xde, 0xad});
  }

  SECTION("Second delivery after the wait is discarded") {
    fx.router.SetReaction([&](const ParsedMessage &, const ReplyTarget &target) {
      fx.correlator.Deliver(target.exchange_id, std::string("first"));
    });

    auto exchange = fx.factory.Open({});
    exchange->ResolveTenant(std::string("{}"));
    exchange->Receive(std::string("reply please"));
    REQUIRE(exchange->AwaitResponse().has_value());

    REQUIRE_FALSE(exchange->DeliverResponse(std::string("second")));
    REQUIRE_FALSE(exchange->AwaitResponse(10ms).has_value());
  }
}

TEST_CASE("Exchange - direct response timeout", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings(50ms));
  auto exchange = fx.factory.Open({});
  exchange->ResolveTenant(std::string("{}"));
  exchange->Receive(std::string("reply please"));

  auto reply = exchange->AwaitResponse();
  REQUIRE_FALSE(reply.has_value());
  REQUIRE(exchange->state() == ExchangeState::NO_RESPONSE);
  REQUIRE_FALSE(exchange->can_respond());

  const auto id = exchange->id();
  exchange.reset();
  REQUIRE_FALSE(fx.correlator.Deliver(id, std::string("late")));
}

TEST_CASE("Exchange - cancellation ends the wait", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings(10s));
  auto token = CancelToken::Create();

  ExchangeOptions options;
  options.cancel = token;
  auto exchange = fx.factory.Open({}, options);
  exchange->ResolveTenant(std::string("{}"));
  exchange->Receive(std::string("reply please"));

  auto waiter = std::async(std::launch::async, [&] { return exchange->AwaitResponse(); });
  std::this_thread::sleep_for(30ms);
  token->Cancel();

  REQUIRE(waiter.wait_for(2s) == std::future_status::ready);
  REQUIRE_FALSE(waiter.get().has_value());
  REQUIRE(exchange->state() == ExchangeState::NO_RESPONSE);

  // The dispatcher's late reply is simply dropped
  REQUIRE_FALSE(fx.correlator.Deliver(exchange->id(), std::string("late")));
}

TEST_CASE("Exchange - parse failure", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings());
  auto exchange = fx.factory.Open({});
  exchange->ResolveTenant(std::string("{}"));

  REQUIRE_THROWS_AS(exchange->Receive(std::string("bad bytes")), MessageParseError);
  REQUIRE(fx.router.Targets().empty());
  exchange.reset();
  REQUIRE(fx.correlator.PendingCount() == 0);
}

TEST_CASE("Exchange - router failure is not an exchange failure", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings(20ms));
  fx.router.SetReaction([](const ParsedMessage &, const ReplyTarget &) {
    throw std::runtime_error("dispatcher exploded");
  });

  auto exchange = fx.factory.Open({});
  exchange->ResolveTenant(std::string("{}"));
  REQUIRE_NOTHROW(exchange->Receive(std::string("reply please")));
  REQUIRE_FALSE(exchange->AwaitResponse().has_value());
}

TEST_CASE("Exchange - close is idempotent and final", "[session][exchange]") {
  SessionFixture fx(ShortTimeoutSettings());
  auto exchange = fx.factory.Open({});
  REQUIRE(fx.correlator.PendingCount() == 1);

  exchange->Close();
  exchange->Close();
  REQUIRE(exchange->is_closed());
  REQUIRE_FALSE(exchange->can_respond());
  REQUIRE(fx.correlator.PendingCount() == 0);

  exchange.reset();
  REQUIRE(fx.correlator.PendingCount() == 0);
}

TEST_CASE("Exchange - can_respond flips exactly once on every path", "[session][exchange]") {
  SessionFixture fx(RoutingSettings(20ms), {"acme"});

  auto run = [&](const std::string &body) {
    auto exchange = fx.factory.Open({});
    REQUIRE(exchange->can_respond());
    try {
      exchange->ResolveTenant(body);
      exchange->Receive(body);
      exchange->AwaitResponse();
    } catch (const MessageParseError &) {
    }
    exchange->Close();
    REQUIRE_FALSE(exchange->can_respond());
  };

  run("hello");
  run("reply please");
  run("bad bytes");
  REQUIRE(fx.correlator.PendingCount() == 0);
}

TEST_CASE("InboundSessionFactory - unique ids", "[session][exchange]") {
  SessionFixture fx;
  auto a = fx.factory.Open({});
  auto b = fx.factory.Open({});
  REQUIRE(a->id() != b->id());
  REQUIRE(fx.factory.OpenedCount() == 2);
  REQUIRE(a->context() == fx.factory.base_context());
}
