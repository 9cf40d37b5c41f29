// Unit tests for settings loading
#include <catch2/catch_test_macros.hpp>
#include "session/context.hpp"
#include "session/errors.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include "test_helpers.hpp"

using namespace custody;
using namespace custody::session;
using json = nlohmann::json;

using custody::test::TempDir;

TEST_CASE("SettingsFromJson - defaults", "[session][settings]") {
  Settings settings = SettingsFromJson(json(nullptr));
  REQUIRE_FALSE(settings.tenant_routing);
  REQUIRE(settings.tenant_selection == TenantSelectionPolicy::FIRST);
  REQUIRE(settings.response_timeout == std::chrono::milliseconds(30000));
  REQUIRE(settings.max_message_size == 0);

  Settings empty = SettingsFromJson(json::object());
  REQUIRE(empty.label == settings.label);
}

TEST_CASE("SettingsFromJson - values", "[session][settings]") {
  json j = {
      {"label", "edge-1"},
      {"tenant_routing", true},
      {"tenant_selection", "sole"},
      {"response_timeout_ms", 1500},
      {"max_message_size", 65536},
      {"tenants", json::array()}, // other sections are ignored
  };
  Settings settings = SettingsFromJson(j);
  REQUIRE(settings.label == "edge-1");
  REQUIRE(settings.tenant_routing);
  REQUIRE(settings.tenant_selection == TenantSelectionPolicy::SOLE);
  REQUIRE(settings.response_timeout == std::chrono::milliseconds(1500));
  REQUIRE(settings.max_message_size == 65536);
}

TEST_CASE("SettingsFromJson - invalid values", "[session][settings]") {
  REQUIRE_THROWS_AS(SettingsFromJson(json::array()), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"tenant_routing", "yes"}}), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"tenant_selection", "random"}}), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"response_timeout_ms", 0}}), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"response_timeout_ms", -5}}), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"max_message_size", 1ull << 40}}), ConfigError);
  REQUIRE_THROWS_AS(SettingsFromJson({{"label", 7}}), ConfigError);

  SECTION("Response timeout above the upper bound") {
    REQUIRE_THROWS_AS(SettingsFromJson({{"response_timeout_ms", 18446744073709551615ull}}),
                      ConfigError);
    REQUIRE_THROWS_AS(SettingsFromJson({{"response_timeout_ms", 10000000000000000ull}}),
                      ConfigError);
    REQUIRE_THROWS_AS(
        SettingsFromJson({{"response_timeout_ms", MAX_RESPONSE_TIMEOUT_MS + 1}}),
        ConfigError);

    Settings settings = SettingsFromJson({{"response_timeout_ms", MAX_RESPONSE_TIMEOUT_MS}});
    REQUIRE(settings.response_timeout == std::chrono::milliseconds(MAX_RESPONSE_TIMEOUT_MS));
  }

  SECTION("Exchange thread count out of range") {
    REQUIRE_THROWS_AS(ExchangeThreadsFromJson({{"exchange_threads", -1}}), ConfigError);
    REQUIRE_THROWS_AS(ExchangeThreadsFromJson({{"exchange_threads", 0}}), ConfigError);
    REQUIRE_THROWS_AS(ExchangeThreadsFromJson({{"exchange_threads", MAX_EXCHANGE_THREADS + 1}}),
                      ConfigError);
    REQUIRE_THROWS_AS(ExchangeThreadsFromJson({{"exchange_threads", "8"}}), ConfigError);
  }
}

TEST_CASE("ExchangeThreadsFromJson - accepted values", "[session][settings]") {
  REQUIRE_FALSE(ExchangeThreadsFromJson(json()).has_value());
  REQUIRE_FALSE(ExchangeThreadsFromJson({{"port", 8020}}).has_value());

  auto threads = ExchangeThreadsFromJson({{"exchange_threads", 4}});
  REQUIRE(threads.has_value());
  REQUIRE(*threads == 4);

  auto most = ExchangeThreadsFromJson({{"exchange_threads", MAX_EXCHANGE_THREADS}});
  REQUIRE(most.has_value());
  REQUIRE(*most == MAX_EXCHANGE_THREADS);
}

TEST_CASE("LoadSettings - configuration file", "[session][settings]") {
  TempDir dir;
  const auto path = dir.path() / "custody.json";

  SECTION("Missing file yields defaults") {
    Settings settings = LoadSettings(path);
    REQUIRE_FALSE(settings.tenant_routing);
    REQUIRE(ReadConfigDocument(path).is_null());
  }

  SECTION("Valid file") {
    REQUIRE(util::atomic_write_file(path, R"({"tenant_routing": true, "response_timeout_ms": 250})"));
    Settings settings = LoadSettings(path);
    REQUIRE(settings.tenant_routing);
    REQUIRE(settings.response_timeout == std::chrono::milliseconds(250));
  }

  SECTION("Malformed file is fatal") {
    REQUIRE(util::atomic_write_file(path, "{ not json"));
    REQUIRE_THROWS_AS(LoadSettings(path), ConfigError);
  }
}
