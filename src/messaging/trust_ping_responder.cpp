// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "messaging/trust_ping_responder.hpp"
#include "util/logging.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

namespace custody {
namespace messaging {

namespace {

constexpr std::string_view PING_SUFFIX = "/trust_ping/1.0/ping";

std::string NewMessageId() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace

TrustPingResponder::TrustPingResponder(session::ResponseCorrelator &correlator,
                                       size_t num_threads)
    : correlator_(correlator), pool_(num_threads == 0 ? 1 : num_threads, 0, "ping") {}

TrustPingResponder::~TrustPingResponder() { Stop(); }

void TrustPingResponder::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  pool_.shutdown();
  pool_.wait_for_completion();
}

bool TrustPingResponder::IsTrustPing(const std::string &message_type) {
  return message_type.size() >= PING_SUFFIX.size() &&
         message_type.compare(message_type.size() - PING_SUFFIX.size(),
                              PING_SUFFIX.size(), PING_SUFFIX) == 0;
}

std::string TrustPingResponder::BuildPingResponse(const session::ParsedMessage &ping) {
  const auto &receipt = ping.receipt;
  nlohmann::json response = {
      {"@type", receipt.message_type + "_response"},
      {"@id", NewMessageId()},
      {"~thread", {{"thid", receipt.message_id}}},
  };
  return response.dump();
}

void TrustPingResponder::Route(const session::ParsedMessage &message,
                               const session::ReplyTarget &target) {
  const auto &receipt = message.receipt;
  if (!IsTrustPing(receipt.message_type)) {
    messages_dropped_.fetch_add(1);
    LOG_DEBUG("No handler for '{}' (exchange {}, scope {}), dropping",
              receipt.message_type, target.exchange_id, target.tenant_scope);
    return;
  }

  pings_received_.fetch_add(1);

  bool response_requested = true;
  auto it = message.body.find("response_requested");
  if (it != message.body.end() && it->is_boolean()) {
    response_requested = it->get<bool>();
  }
  if (!response_requested || !target.direct_response) {
    LOG_DEBUG("Trust ping {} needs no direct reply", receipt.message_id);
    return;
  }

  // Copy what the worker needs: the message does not outlive this call
  session::ParsedMessage ping = message;
  const session::ExchangeId exchange_id = target.exchange_id;
  bool posted = pool_.TryPost([this, ping = std::move(ping), exchange_id] {
    std::string reply = BuildPingResponse(ping);
    if (correlator_.Deliver(exchange_id, std::move(reply))) {
      responses_delivered_.fetch_add(1);
    } else {
      LOG_DEBUG("Exchange {} no longer waiting, ping_response dropped",
                exchange_id);
    }
  });
  if (!posted) {
    messages_dropped_.fetch_add(1);
    LOG_WARN("Responder stopped, trust ping {} dropped", receipt.message_id);
  }
}

} // namespace messaging
} // namespace custody
