// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/exchange.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace custody {
namespace session {

const char *ExchangeStateName(ExchangeState state) {
  switch (state) {
  case ExchangeState::OPEN:
    return "OPEN";
  case ExchangeState::CONTEXT_RESOLVED:
    return "CONTEXT_RESOLVED";
  case ExchangeState::RECEIVING:
    return "RECEIVING";
  case ExchangeState::AWAITING_RESPONSE:
    return "AWAITING_RESPONSE";
  case ExchangeState::RESPONDED:
    return "RESPONDED";
  case ExchangeState::NO_RESPONSE:
    return "NO_RESPONSE";
  case ExchangeState::CLOSED:
    return "CLOSED";
  }
  return "UNKNOWN";
}

// ============================================================================
// Exchange
// ============================================================================

Exchange::Exchange(ExchangeId id, PeerInfo peer, ProcessingContextPtr context,
                   const ExchangeServices &services, ExchangeOptions options,
                   std::chrono::milliseconds default_timeout)
    : id_(id), peer_(std::move(peer)), context_(std::move(context)),
      services_(services), cancel_(std::move(options.cancel)),
      default_timeout_(default_timeout), can_respond_(options.can_respond),
      accept_undelivered_(options.accept_undelivered) {
  if (!context_) {
    throw std::invalid_argument("Exchange requires a processing context");
  }
  if (!services_.unpacker || !services_.router || !services_.correlator) {
    throw std::invalid_argument("Exchange requires unpacker, router and correlator");
  }
  if (!services_.correlator->Open(id_)) {
    throw std::logic_error("exchange id " + std::to_string(id_) + " already in use");
  }

  if (cancel_) {
    // Captures only long-lived collaborators: the callback may still run
    // after this exchange is gone.
    ResponseCorrelator *correlator = services_.correlator;
    const ExchangeId id_copy = id_;
    cancel_->SetCallback([correlator, id_copy] { correlator->Cancel(id_copy); });
  }

  LOG_SESSION_TRACE("Exchange {} opened (host={}, remote={})", id_, peer_.host,
                    peer_.remote);
}

Exchange::~Exchange() { Close(); }

void Exchange::RequireState(ExchangeState expected, const char *operation) const {
  const ExchangeState current = state();
  if (current != expected) {
    throw std::logic_error(std::string("Exchange::") + operation +
                           " called in state " + ExchangeStateName(current));
  }
}

void Exchange::DisableResponses() {
  if (can_respond_.exchange(false)) {
    LOG_SESSION_TRACE("Exchange {}: responses disabled", id_);
  }
}

void Exchange::ResolveTenant(const Payload &raw) {
  RequireState(ExchangeState::OPEN, "ResolveTenant");

  const Settings &settings = context_->settings();
  if (!settings.tenant_routing) {
    state_ = ExchangeState::CONTEXT_RESOLVED;
    return;
  }

  try {
    if (!services_.tenant_resolver || !services_.context_switcher) {
      throw TenantResolutionError("tenant routing is enabled but no tenant resolver is configured");
    }
    std::vector<TenantId> candidates = services_.tenant_resolver->Resolve(raw);
    TenantId tenant_id =
        services_.context_switcher->Select(candidates, settings.tenant_selection);
    context_ = services_.context_switcher->Switch(context_, tenant_id);
  } catch (const TenantResolutionError &e) {
    LOG_SESSION_WARN("Exchange {}: tenant resolution failed: {}", id_, e.what());
    Close();
    throw;
  }

  state_ = ExchangeState::CONTEXT_RESOLVED;
  LOG_SESSION_DEBUG("Exchange {} bound to tenant '{}'", id_, context_->Scope());
}

ParsedMessage Exchange::Receive(const Payload &raw) {
  RequireState(ExchangeState::CONTEXT_RESOLVED, "Receive");
  state_ = ExchangeState::RECEIVING;

  ParsedMessage message = services_.unpacker->Unpack(raw, *context_);
  if (message.receipt.tenant_scope.empty()) {
    message.receipt.tenant_scope = context_->Scope();
  }

  direct_response_requested_ =
      message.receipt.direct_response_requested && can_respond();
  if (direct_response_requested_) {
    if (!services_.correlator->Arm(id_)) {
      // Connection already gone; AwaitResponse() will return at once
      LOG_SESSION_DEBUG("Exchange {}: response slot could not be armed", id_);
    }
  } else {
    state_ = ExchangeState::NO_RESPONSE;
  }

  LOG_SESSION_DEBUG("Exchange {} received '{}' (id={}, return_route={}, scope={})",
                    id_, message.receipt.message_type, message.receipt.message_id,
                    DirectResponseModeName(message.receipt.direct_response_mode),
                    message.receipt.tenant_scope);

  ReplyTarget target;
  target.exchange_id = id_;
  target.direct_response = direct_response_requested_;
  target.accept_undelivered = accept_undelivered_;
  target.tenant_scope = message.receipt.tenant_scope;

  // The sender is not at fault for a dispatcher failure: the exchange
  // completes without a reply.
  try {
    services_.router->Route(message, target);
  } catch (const std::exception &e) {
    LOG_SESSION_ERROR("Exchange {}: routing '{}' failed: {}", id_,
                      message.receipt.message_type, e.what());
  }

  return message;
}

std::optional<Payload>
Exchange::AwaitResponse(std::optional<std::chrono::milliseconds> timeout) {
  if (!direct_response_requested_ || awaited_ ||
      state() != ExchangeState::RECEIVING) {
    LOG_SESSION_DEBUG("Exchange {}: no response wait in state {}", id_,
                      ExchangeStateName(state()));
    DisableResponses();
    return std::nullopt;
  }

  awaited_ = true;
  state_ = ExchangeState::AWAITING_RESPONSE;

  std::chrono::milliseconds wait = timeout.value_or(default_timeout_);
  if (wait.count() < 0) {
    wait = std::chrono::milliseconds(0);
  }

  std::optional<Payload> response = services_.correlator->Wait(id_, wait);
  DisableResponses();

  if (response) {
    state_ = ExchangeState::RESPONDED;
    LOG_SESSION_DEBUG("Exchange {}: direct response of {} bytes", id_,
                      PayloadSize(*response));
  } else {
    state_ = ExchangeState::NO_RESPONSE;
    LOG_SESSION_DEBUG("Exchange {}: no direct response within {} ms", id_,
                      wait.count());
  }
  return response;
}

bool Exchange::DeliverResponse(Payload payload) {
  return services_.correlator->Deliver(id_, std::move(payload));
}

void Exchange::Close() {
  if (state_.exchange(ExchangeState::CLOSED) == ExchangeState::CLOSED) {
    return;
  }
  DisableResponses();
  if (cancel_) {
    cancel_->ClearCallback();
  }
  services_.correlator->Release(id_);
  LOG_SESSION_TRACE("Exchange {} closed", id_);
}

// ============================================================================
// InboundSessionFactory
// ============================================================================

InboundSessionFactory::InboundSessionFactory(ProcessingContextPtr base_context,
                                             ExchangeServices services)
    : base_context_(std::move(base_context)), services_(services) {
  if (!base_context_) {
    throw std::invalid_argument("InboundSessionFactory requires a base context");
  }
}

std::unique_ptr<Exchange> InboundSessionFactory::Open(PeerInfo peer,
                                                      ExchangeOptions options) {
  const ExchangeId id = next_id_.fetch_add(1);
  return std::make_unique<Exchange>(id, std::move(peer), base_context_,
                                    services_, std::move(options),
                                    base_context_->settings().response_timeout);
}

} // namespace session
} // namespace custody
