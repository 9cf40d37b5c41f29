// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/response_correlator.hpp"
#include "util/logging.hpp"

namespace custody {
namespace session {

bool ResponseCorrelator::Open(ExchangeId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.emplace(id, std::make_shared<Slot>()).second;
}

bool ResponseCorrelator::Arm(ExchangeId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(id);
  if (it == slots_.end()) {
    return false;
  }
  Slot &slot = *it->second;
  if (slot.cancelled || slot.armed || slot.served) {
    return false;
  }
  slot.armed = true;
  return true;
}

bool ResponseCorrelator::Deliver(ExchangeId id, Payload payload) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it != slots_.end()) {
      slot = it->second;
    }
    if (!slot || !slot->armed || slot->cancelled || slot->served) {
      dropped_.fetch_add(1);
      LOG_SESSION_DEBUG("Dropping reply for exchange {} ({} bytes): no waiter",
                        id, PayloadSize(payload));
      return false;
    }
    slot->payload = std::move(payload);
    slot->served = true;
  }
  slot->cv.notify_one();
  LOG_SESSION_TRACE("Reply delivered to exchange {}", id);
  return true;
}

std::optional<Payload> ResponseCorrelator::Wait(ExchangeId id,
                                                std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = slots_.find(id);
  if (it == slots_.end()) {
    return std::nullopt;
  }
  // Keep the slot alive while waiting even if Release() erases it
  std::shared_ptr<Slot> slot = it->second;

  if (slot->cancelled) {
    return std::nullopt;
  }
  if (!slot->armed || slot->waiting) {
    LOG_SESSION_WARN("Exchange {}: wait refused ({})", id,
                     slot->waiting ? "already waiting" : "not armed");
    return std::nullopt;
  }

  slot->waiting = true;
  slot->cv.wait_for(lock, timeout, [&] {
    return slot->payload.has_value() || slot->cancelled;
  });

  // A cancelled wait behaves like a timeout, even if a reply raced in
  std::optional<Payload> result;
  if (slot->payload && !slot->cancelled) {
    result = std::move(slot->payload);
    delivered_.fetch_add(1);
  } else if (slot->payload) {
    dropped_.fetch_add(1);
  }
  slot->payload.reset();
  // No further deliveries after the wait returns
  slot->waiting = false;
  slot->armed = false;
  return result;
}

void ResponseCorrelator::Cancel(ExchangeId id) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
      return;
    }
    slot = it->second;
    slot->cancelled = true;
    slot->armed = false;
  }
  slot->cv.notify_all();
  LOG_SESSION_DEBUG("Exchange {} cancelled", id);
}

void ResponseCorrelator::Release(ExchangeId id) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
      return;
    }
    slot = std::move(it->second);
    slots_.erase(it);
    slot->cancelled = true;
    slot->armed = false;
    if (slot->payload) {
      // Accepted but never handed to a waiter
      slot->payload.reset();
      dropped_.fetch_add(1);
    }
  }
  slot->cv.notify_all();
}

bool ResponseCorrelator::IsArmed(ExchangeId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(id);
  return it != slots_.end() && it->second->armed;
}

size_t ResponseCorrelator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

} // namespace session
} // namespace custody
