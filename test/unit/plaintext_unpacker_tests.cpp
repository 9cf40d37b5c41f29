// Unit tests for the plaintext DIDComm unpacker
#include <catch2/catch_test_macros.hpp>
#include "messaging/plaintext_unpacker.hpp"
#include "session/errors.hpp"
#include "session/tenant.hpp"
#include "util/time.hpp"

using namespace custody;
using namespace custody::session;
using custody::messaging::PlaintextUnpacker;

namespace {

const char *PING =
    R"({"@type":"https://didcomm.org/trust_ping/1.0/ping","@id":"a1b2",)"
    R"("response_requested":true,"~transport":{"return_route":"all"}})";

ProcessingContextPtr DefaultContext() {
  return ProcessingContext::Create(Settings{});
}

} // namespace

TEST_CASE("PlaintextUnpacker - reads the receipt", "[messaging][unpacker]") {
  PlaintextUnpacker unpacker;
  auto context = DefaultContext();

  SECTION("Text payload with return_route all") {
    util::MockTimeScope mock(1761402789);
    auto message = unpacker.Unpack(Payload{std::string(PING)}, *context);
    REQUIRE(message.receipt.message_type == "https://didcomm.org/trust_ping/1.0/ping");
    REQUIRE(message.receipt.message_id == "a1b2");
    REQUIRE(message.receipt.thread_id == "a1b2");
    REQUIRE(message.receipt.direct_response_mode == DirectResponseMode::ALL);
    REQUIRE(message.receipt.direct_response_requested);
    REQUIRE(message.receipt.direct_response_thread.empty());
    REQUIRE(message.receipt.tenant_scope == "default");
    REQUIRE(message.receipt.received_at ==
            std::chrono::system_clock::from_time_t(1761402789));
    REQUIRE(message.body["response_requested"] == true);
  }

  SECTION("Byte payload decodes the same way") {
    std::string text(PING);
    auto message = unpacker.Unpack(Payload{Bytes(text.begin(), text.end())}, *context);
    REQUIRE(message.receipt.message_id == "a1b2");
    REQUIRE(message.receipt.direct_response_requested);
  }

  SECTION("No transport decorator means no direct response") {
    auto message = unpacker.Unpack(
        Payload{std::string(R"({"@type":"x/1.0/y","@id":"m1"})")}, *context);
    REQUIRE(message.receipt.direct_response_mode == DirectResponseMode::NONE);
    REQUIRE_FALSE(message.receipt.direct_response_requested);
  }

  SECTION("Thread decorator overrides the thread id") {
    auto message = unpacker.Unpack(
        Payload{std::string(R"({"@type":"x/1.0/y","@id":"m2","~thread":{"thid":"t9"}})")},
        *context);
    REQUIRE(message.receipt.message_id == "m2");
    REQUIRE(message.receipt.thread_id == "t9");
  }

  SECTION("return_route thread") {
    auto message = unpacker.Unpack(
        Payload{std::string(R"({"@type":"x/1.0/y","@id":"m3","~thread":{"thid":"t3"},)"
                            R"("~transport":{"return_route":"thread"}})")},
        *context);
    REQUIRE(message.receipt.direct_response_mode == DirectResponseMode::THREAD);
    REQUIRE(message.receipt.direct_response_thread == "t3");

    auto explicit_thread = unpacker.Unpack(
        Payload{std::string(R"({"@type":"x/1.0/y","@id":"m4",)"
                            R"("~transport":{"return_route":"thread","return_route_thread":"t7"}})")},
        *context);
    REQUIRE(explicit_thread.receipt.direct_response_thread == "t7");
  }

  SECTION("Recipient key from the routing decorator") {
    auto message = unpacker.Unpack(
        Payload{std::string(R"({"@type":"x/1.0/y","~routing":{"recipient_keys":["VK1","VK2"]}})")},
        *context);
    REQUIRE(message.receipt.recipient_verkey == "VK1");
    REQUIRE(message.receipt.message_id.empty());
  }

  SECTION("Scope follows the tenant context") {
    auto tenant = std::make_shared<TenantContext>();
    tenant->id = "acme";
    auto tenant_context = context->WithTenant(tenant);
    auto message = unpacker.Unpack(Payload{std::string(PING)}, *tenant_context);
    REQUIRE(message.receipt.tenant_scope == "acme");
  }
}

TEST_CASE("PlaintextUnpacker - return_route values", "[messaging][unpacker]") {
  REQUIRE(PlaintextUnpacker::ParseReturnRoute("all") == DirectResponseMode::ALL);
  REQUIRE(PlaintextUnpacker::ParseReturnRoute("thread") == DirectResponseMode::THREAD);
  REQUIRE(PlaintextUnpacker::ParseReturnRoute("none") == DirectResponseMode::NONE);
  REQUIRE(PlaintextUnpacker::ParseReturnRoute("") == DirectResponseMode::NONE);
  REQUIRE(PlaintextUnpacker::ParseReturnRoute("ALL") == DirectResponseMode::NONE);
}

TEST_CASE("PlaintextUnpacker - rejects malformed input", "[messaging][unpacker]") {
  PlaintextUnpacker unpacker;
  auto context = DefaultContext();

  auto rejects = [&](std::string text) {
    try {
      unpacker.Unpack(Payload{std::move(text)}, *context);
    } catch (const MessageParseError &) {
      return true;
    }
    return false;
  };

  REQUIRE(rejects(""));
  REQUIRE(rejects("not json"));
  REQUIRE(rejects("{\"@type\":"));
  REQUIRE(rejects("[1,2,3]"));
  REQUIRE(rejects("\"string\""));
  REQUIRE(rejects(R"({"@id":"no-type"})"));
  REQUIRE(rejects(R"({"@type":42})"));
  REQUIRE(rejects(R"({"protected":"eyJ9","iv":"a","ciphertext":"b","tag":"c"})"));
}
