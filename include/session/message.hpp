// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/context.hpp"
#include "session/payload.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace custody {
namespace session {

// Process-unique exchange identity, allocated by InboundSessionFactory
using ExchangeId = uint64_t;

// How the sender asked to receive replies ("~transport.return_route")
enum class DirectResponseMode {
  NONE,   // replies travel over a separate outbound connection
  ALL,    // any reply may come back on this exchange
  THREAD, // only replies on the requested thread
};

const char *DirectResponseModeName(DirectResponseMode mode);

// Metadata produced while unpacking a message
struct MessageReceipt {
  std::string message_id;
  std::string message_type;
  std::string thread_id;

  DirectResponseMode direct_response_mode = DirectResponseMode::NONE;
  bool direct_response_requested = false;
  // Thread named by return_route "thread" (empty otherwise)
  std::string direct_response_thread;

  // Empty for plaintext messages
  std::string sender_verkey;
  std::string recipient_verkey;

  // Scope of the context the message was unpacked in ("default" or tenant id)
  std::string tenant_scope;

  std::chrono::system_clock::time_point received_at;
};

struct ParsedMessage {
  MessageReceipt receipt;
  nlohmann::json body;
};

/**
 * MessageUnpacker - turns inbound bytes into a structured message
 *
 * Runs with the exchange's (possibly tenant-scoped) context, since keys for
 * decryption belong to the tenant.
 */
class MessageUnpacker {
public:
  virtual ~MessageUnpacker() = default;

  // @throws MessageParseError if the bytes cannot be decoded/authenticated
  virtual ParsedMessage Unpack(const Payload &raw,
                               const ProcessingContext &context) = 0;
};

// Where the downstream dispatcher may send a reply for a routed message
struct ReplyTarget {
  ExchangeId exchange_id = 0;
  // The exchange holds its connection open for a direct response
  bool direct_response = false;
  // The exchange tolerates no reply being produced at all
  bool accept_undelivered = true;
  std::string tenant_scope;
};

/**
 * InboundMessageRouter - hands parsed messages to the downstream dispatcher
 *
 * Route() must not block on producing the reply; replies are delivered later
 * through ResponseCorrelator::Deliver(target.exchange_id, payload).
 */
class InboundMessageRouter {
public:
  virtual ~InboundMessageRouter() = default;

  virtual void Route(const ParsedMessage &message, const ReplyTarget &target) = 0;
};

} // namespace session
} // namespace custody
