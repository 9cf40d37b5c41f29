// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/cancel_token.hpp"
#include "session/context.hpp"
#include "session/context_switcher.hpp"
#include "session/message.hpp"
#include "session/response_correlator.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace custody {
namespace session {

// Exchange states
//
//   OPEN -> CONTEXT_RESOLVED -> RECEIVING -> AWAITING_RESPONSE -> RESPONDED
//                                        |                    \-> NO_RESPONSE
//                                        \-> NO_RESPONSE
//   every state -> CLOSED (terminal, also on error)
enum class ExchangeState {
  OPEN,
  CONTEXT_RESOLVED,
  RECEIVING,
  AWAITING_RESPONSE,
  RESPONDED,
  NO_RESPONSE,
  CLOSED
};

const char *ExchangeStateName(ExchangeState state);

// Opaque peer metadata supplied by the transport
struct PeerInfo {
  std::string host;   // Host header
  std::string remote; // remote socket address
};

struct ExchangeOptions {
  bool can_respond = true;
  bool accept_undelivered = true;
  // Fired by the transport when the connection drops (optional)
  std::shared_ptr<CancelToken> cancel;
};

/**
 * Collaborators injected into every exchange at startup
 *
 * tenant_resolver/context_switcher may be null only when tenant routing is
 * disabled in the base context's settings.
 */
struct ExchangeServices {
  TenantResolver *tenant_resolver = nullptr;
  ContextSwitcher *context_switcher = nullptr;
  MessageUnpacker *unpacker = nullptr;
  InboundMessageRouter *router = nullptr;
  ResponseCorrelator *correlator = nullptr;
};

/**
 * Exchange - one inbound request and its optional synchronous reply
 *
 * Owned exclusively by the task serving the request. Methods must be called
 * in order: ResolveTenant(), Receive(), then AwaitResponse() when the
 * receipt asked for a direct response. Close() is idempotent and runs from
 * the destructor, so leaving the owning scope releases the exchange on every
 * path, including exceptions.
 *
 * can_respond starts true and becomes false exactly once: when the response
 * wait returns, or when the exchange closes, whichever happens first.
 */
class Exchange {
public:
  Exchange(ExchangeId id, PeerInfo peer, ProcessingContextPtr context,
           const ExchangeServices &services, ExchangeOptions options,
           std::chrono::milliseconds default_timeout);
  ~Exchange();

  Exchange(const Exchange &) = delete;
  Exchange &operator=(const Exchange &) = delete;

  /**
   * Bind the tenant context for this message (tenant routing only)
   *
   * With routing disabled the base context is kept as is. On failure the
   * exchange closes before the error propagates.
   *
   * @throws TenantResolutionError
   * @throws std::logic_error if not called first
   */
  void ResolveTenant(const Payload &raw);

  /**
   * Unpack the message with the current context and route it downstream
   *
   * Arms the response slot before routing when a direct response was
   * requested, so a fast dispatcher cannot lose its reply.
   *
   * @throws MessageParseError if the bytes cannot be decoded
   * @throws std::logic_error if ResolveTenant() has not run or the exchange
   *         is closed
   */
  ParsedMessage Receive(const Payload &raw);

  /**
   * Wait for the direct response
   *
   * @param timeout Bound on the wait; defaults to the configured
   *        response timeout
   * @return the reply, or nullopt on timeout, cancellation, or when no
   *         direct response was requested. Afterwards can_respond() is false.
   */
  std::optional<Payload>
  AwaitResponse(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Offer a reply for this exchange (same as correlator Deliver)
  bool DeliverResponse(Payload payload);

  void Close();

  ExchangeId id() const { return id_; }
  const PeerInfo &peer() const { return peer_; }
  ExchangeState state() const { return state_.load(); }
  bool is_closed() const { return state() == ExchangeState::CLOSED; }

  // Current context (base, or tenant-scoped after ResolveTenant)
  const ProcessingContextPtr &context() const { return context_; }

  bool can_respond() const { return can_respond_.load(); }
  bool accept_undelivered() const { return accept_undelivered_; }
  bool direct_response_requested() const { return direct_response_requested_; }

private:
  void RequireState(ExchangeState expected, const char *operation) const;
  void DisableResponses();

  const ExchangeId id_;
  const PeerInfo peer_;
  ProcessingContextPtr context_;
  ExchangeServices services_;
  std::shared_ptr<CancelToken> cancel_;
  const std::chrono::milliseconds default_timeout_;

  std::atomic<ExchangeState> state_{ExchangeState::OPEN};
  std::atomic<bool> can_respond_;
  const bool accept_undelivered_;
  bool direct_response_requested_{false};
  bool awaited_{false};
};

/**
 * InboundSessionFactory - creates exchanges bound to the process-wide
 * default context and the collaborators chosen at startup
 */
class InboundSessionFactory {
public:
  InboundSessionFactory(ProcessingContextPtr base_context,
                        ExchangeServices services);

  std::unique_ptr<Exchange> Open(PeerInfo peer, ExchangeOptions options = {});

  const ProcessingContextPtr &base_context() const { return base_context_; }
  const ExchangeServices &services() const { return services_; }

  uint64_t OpenedCount() const { return next_id_.load() - 1; }

private:
  ProcessingContextPtr base_context_;
  ExchangeServices services_;
  std::atomic<ExchangeId> next_id_{1};
};

} // namespace session
} // namespace custody
