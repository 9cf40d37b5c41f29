// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/exchange.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace custody {
namespace session {

// One request as handed over by a transport adapter
struct InboundRequest {
  std::string content_type; // raw Content-Type header, may be empty
  std::string body;
  PeerInfo peer;
  std::shared_ptr<CancelToken> cancel; // fired on connection loss (optional)
};

// What the transport writes back to the peer
struct InboundResponse {
  unsigned status = 200;
  std::string content_type; // empty when there is no body
  std::string body;
};

namespace status {
constexpr unsigned OK = 200;
constexpr unsigned BAD_REQUEST = 400;
constexpr unsigned INTERNAL_ERROR = 500;
} // namespace status

/**
 * InboundMessageHandler - drives one exchange per inbound message and maps
 * its outcome to a transport-neutral response
 *
 *   no direct response requested      -> 200, empty
 *   reply delivered                   -> 200, reply body (wire or JSON)
 *   wait timed out / cancelled        -> 200, empty
 *   MessageParseError                 -> 400
 *   TenantResolutionError             -> 500
 *
 * Thread-safe: each call owns its exchange; only the counters are shared.
 */
class InboundMessageHandler {
public:
  explicit InboundMessageHandler(InboundSessionFactory &factory);

  InboundResponse HandleMessage(InboundRequest request);

  // Invitation probe: `query` is the raw query string (without '?')
  InboundResponse HandleInvitation(std::string_view query) const;

  uint64_t ExchangesHandled() const { return exchanges_handled_.load(); }
  uint64_t ParseFailures() const { return parse_failures_.load(); }
  uint64_t ResolutionFailures() const { return resolution_failures_.load(); }
  uint64_t RepliesSent() const { return replies_sent_.load(); }

private:
  InboundSessionFactory &factory_;

  std::atomic<uint64_t> exchanges_handled_{0};
  std::atomic<uint64_t> parse_failures_{0};
  std::atomic<uint64_t> resolution_failures_{0};
  std::atomic<uint64_t> replies_sent_{0};
};

// Text returned by the invitation probe when `c_i` is present
extern const char *const INVITATION_NOTICE;

} // namespace session
} // namespace custody
