// Unit tests for payload classification
#include <catch2/catch_test_macros.hpp>
#include "session/payload.hpp"

using namespace custody::session;

TEST_CASE("ClassifyBody - structured text vs wire bytes", "[session][payload]") {
  SECTION("application/json is text") {
    auto p = ClassifyBody("application/json", "{\"a\":1}");
    REQUIRE(IsText(p));
    REQUIRE(std::get<std::string>(p) == "{\"a\":1}");
  }

  SECTION("Parameters and case are ignored") {
    REQUIRE(IsText(ClassifyBody("Application/JSON; charset=utf-8", "{}")));
    REQUIRE(IsText(ClassifyBody("  application/json  ;q=1", "{}")));
  }

  SECTION("Anything else is bytes, unmodified") {
    std::string body("\x00\x01packed", 8);
    auto p = ClassifyBody("application/ssi-agent-wire", body);
    REQUIRE_FALSE(IsText(p));
    REQUIRE(PayloadSize(p) == 8);
    REQUIRE(PayloadView(p) == std::string_view(body));
  }

  SECTION("Missing content type is bytes") {
    REQUIRE_FALSE(IsText(ClassifyBody("", "{}")));
    REQUIRE_FALSE(IsText(ClassifyBody("application/jsonx", "{}")));
  }
}

TEST_CASE("ReplyContentType - chosen by payload type", "[session][payload]") {
  REQUIRE(std::string(ReplyContentType(Payload{std::string("ack")})) == "application/json");
  REQUIRE(std::string(ReplyContentType(Payload{Bytes{1, 2, 3}})) ==
          "application/ssi-agent-wire");
}
