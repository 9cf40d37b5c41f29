// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace custody::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
  SECTION("Positive, negative and zero") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE(SafeParseInt("-50", -100, 100) == -50);
    REQUIRE(SafeParseInt("0", -10, 10) == 0);
  }

  SECTION("Bounds are inclusive") {
    REQUIRE(SafeParseInt("0", 0, 100) == 0);
    REQUIRE(SafeParseInt("100", 0, 100) == 100);
  }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
  REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("4.2", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
  REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
}

TEST_CASE("SafeParseInt64 - range", "[util][string_parsing]") {
  const int64_t max = std::numeric_limits<int64_t>::max();
  REQUIRE(SafeParseInt64("9223372036854775807", 0, max) == max);
  REQUIRE(SafeParseInt64("3600000", 1, 3600000) == 3600000);
  REQUIRE_FALSE(SafeParseInt64("3600001", 1, 3600000).has_value());
  REQUIRE_FALSE(SafeParseInt64("9223372036854775808", 0, max).has_value());
  REQUIRE_FALSE(SafeParseInt64("", 0, max).has_value());
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
  REQUIRE(SafeParsePort("1") == 1);
  REQUIRE(SafeParsePort("8020") == 8020);
  REQUIRE(SafeParsePort("65535") == 65535);
  REQUIRE_FALSE(SafeParsePort("0").has_value());
  REQUIRE_FALSE(SafeParsePort("-1").has_value());
  REQUIRE_FALSE(SafeParsePort("65536").has_value());
  REQUIRE_FALSE(SafeParsePort("http").has_value());
  REQUIRE_FALSE(SafeParsePort("80a").has_value());
}

TEST_CASE("Trim, ToLower and SplitList", "[util][string_parsing]") {
  REQUIRE(Trim("  a b \t\n") == "a b");
  REQUIRE(Trim("   ").empty());
  REQUIRE(ToLower("Network") == "network");

  REQUIRE(SplitList("network, session,,tenant", ',') ==
          std::vector<std::string>{"network", "session", "tenant"});
  REQUIRE(SplitList("", ',').empty());
  REQUIRE(SplitList(" , ", ',').empty());
  REQUIRE(SplitList("c_i=abc&lang=en", '&') ==
          std::vector<std::string>{"c_i=abc", "lang=en"});
}

TEST_CASE("MediaType", "[util][string_parsing]") {
  REQUIRE(MediaType("application/json") == "application/json");
  REQUIRE(MediaType("Application/JSON; charset=utf-8") == "application/json");
  REQUIRE(MediaType("  application/ssi-agent-wire ") == "application/ssi-agent-wire");
  REQUIRE(MediaType("").empty());
  REQUIRE(MediaType(";charset=utf-8").empty());
}

TEST_CASE("Base64UrlDecode", "[util][string_parsing]") {
  auto text = [](std::string_view input) -> std::optional<std::string> {
    auto bytes = Base64UrlDecode(input);
    if (!bytes) {
      return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
  };

  SECTION("Unpadded and padded") {
    REQUIRE(text("eyJhIjoxfQ") == std::string(R"({"a":1})"));
    REQUIRE(text("eyJhIjoxfQ==") == std::string(R"({"a":1})"));
    REQUIRE(text("TWFu") == std::string("Man"));
    REQUIRE(text("TWE") == std::string("Ma"));
    REQUIRE(text("") == std::string());
  }

  SECTION("URL-safe and standard alphabets") {
    auto url = Base64UrlDecode("-_8");
    auto standard = Base64UrlDecode("+/8");
    REQUIRE(url.has_value());
    REQUIRE(url == standard);
    REQUIRE(*url == std::vector<uint8_t>{0xFB, 0xFF});
  }

  SECTION("Invalid input") {
    REQUIRE_FALSE(Base64UrlDecode("TWF*").has_value());
    REQUIRE_FALSE(Base64UrlDecode("T").has_value());
    REQUIRE_FALSE(Base64UrlDecode("TWFu TWFu").has_value());
  }
}
