// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/inbound_handler.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <optional>

namespace custody {
namespace session {

const char *const INVITATION_NOTICE =
    "You have received a connection invitation. To accept the invitation, "
    "paste it into your agent application.";

namespace {

InboundResponse Fault(unsigned code, const char *reason) {
  InboundResponse response;
  response.status = code;
  response.content_type = "text/plain";
  response.body = std::to_string(code) + ": " + reason;
  return response;
}

// Value of `name` in an application/x-www-form-urlencoded query, undecoded.
// Presence is all the probe looks at.
std::optional<std::string> QueryValue(std::string_view query,
                                      std::string_view name) {
  for (const auto &pair : util::SplitList(query, '&')) {
    auto eq = pair.find('=');
    std::string_view key = std::string_view(pair).substr(0, eq);
    if (key == name) {
      return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
    }
  }
  return std::nullopt;
}

} // namespace

InboundMessageHandler::InboundMessageHandler(InboundSessionFactory &factory)
    : factory_(factory) {}

InboundResponse InboundMessageHandler::HandleMessage(InboundRequest request) {
  exchanges_handled_.fetch_add(1);

  Payload raw = ClassifyBody(request.content_type, std::move(request.body));

  ExchangeOptions options;
  options.can_respond = true;
  options.accept_undelivered = true;
  options.cancel = std::move(request.cancel);

  // Scope owns the exchange: it is closed on every path out of here
  std::unique_ptr<Exchange> exchange =
      factory_.Open(std::move(request.peer), std::move(options));

  try {
    exchange->ResolveTenant(raw);
  } catch (const TenantResolutionError &e) {
    resolution_failures_.fetch_add(1);
    LOG_SESSION_WARN("Exchange {} from {}: {}", exchange->id(),
                     exchange->peer().remote, e.what());
    return Fault(status::INTERNAL_ERROR, "Internal Server Error");
  }

  ParsedMessage message;
  try {
    message = exchange->Receive(raw);
  } catch (const MessageParseError &e) {
    parse_failures_.fetch_add(1);
    LOG_SESSION_DEBUG("Exchange {} from {}: unparseable message: {}",
                      exchange->id(), exchange->peer().remote, e.what());
    return Fault(status::BAD_REQUEST, "Bad Request");
  }

  InboundResponse response;
  if (!exchange->direct_response_requested()) {
    return response;
  }

  std::optional<Payload> reply = exchange->AwaitResponse();
  exchange->Close();
  if (!reply) {
    return response;
  }

  replies_sent_.fetch_add(1);
  response.content_type = ReplyContentType(*reply);
  if (IsText(*reply)) {
    response.body = std::move(std::get<std::string>(*reply));
  } else {
    const Bytes &bytes = std::get<Bytes>(*reply);
    response.body.assign(bytes.begin(), bytes.end());
  }
  return response;
}

InboundResponse InboundMessageHandler::HandleInvitation(std::string_view query) const {
  InboundResponse response;
  auto invitation = QueryValue(query, "c_i");
  if (invitation && !invitation->empty()) {
    response.content_type = "text/plain; charset=utf-8";
    response.body = INVITATION_NOTICE;
  }
  return response;
}

} // namespace session
} // namespace custody
