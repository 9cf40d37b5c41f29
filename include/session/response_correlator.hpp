// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/message.hpp"
#include "session/payload.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace custody {
namespace session {

/**
 * ResponseCorrelator - hands one reply from the downstream dispatcher to the
 * exchange that waits for it
 *
 * Slot lifecycle (one slot per exchange):
 *
 *   Open(id)     exchange created; deliveries are still refused
 *   Arm(id)      receipt asked for a direct response; the exchange is now
 *                committed to waiting and counts as a present waiter
 *   Deliver()    accepted once per armed slot, buffered until Wait() takes it
 *   Wait()       returns the payload, or nullopt on timeout / cancellation;
 *                the slot is disarmed on return either way
 *   Release(id)  exchange closed; the slot is erased
 *
 * Deliver() only ever takes the registry mutex; it never waits for the
 * consumer. Payloads for slots that are missing, unarmed, cancelled, already
 * served or released are dropped and Deliver() returns false, so a late
 * producer cannot leak memory into a closed exchange.
 *
 * Thread-safety: all methods may be called from any thread.
 */
class ResponseCorrelator {
public:
  ResponseCorrelator() = default;

  ResponseCorrelator(const ResponseCorrelator &) = delete;
  ResponseCorrelator &operator=(const ResponseCorrelator &) = delete;

  // Create the slot for a new exchange. False if id is already registered.
  bool Open(ExchangeId id);

  // Start accepting a delivery for id. False if the slot is missing,
  // cancelled or was already armed.
  bool Arm(ExchangeId id);

  /**
   * notifyResponseReady: offer the reply for exchange id
   *
   * @return true iff the exchange is (or is about to be) waiting and took
   *         the payload; false if it was dropped
   */
  bool Deliver(ExchangeId id, Payload payload);

  /**
   * Block until a payload is delivered, the wait is cancelled, or timeout
   * elapses. Only one wait per slot; a concurrent second wait, or a wait on
   * an unarmed slot, returns nullopt immediately.
   */
  std::optional<Payload> Wait(ExchangeId id, std::chrono::milliseconds timeout);

  // Wake the waiter (if any) without a payload and refuse further deliveries.
  // Unknown ids are ignored.
  void Cancel(ExchangeId id);

  // Erase the slot. Any buffered, unconsumed payload is discarded.
  void Release(ExchangeId id);

  bool IsArmed(ExchangeId id) const;

  // Registered slots (open exchanges)
  size_t PendingCount() const;

  // Replies handed to a waiter by Wait()
  uint64_t DeliveredCount() const { return delivered_.load(); }
  // Replies refused by Deliver() or accepted and then discarded
  uint64_t DroppedCount() const { return dropped_.load(); }

private:
  struct Slot {
    bool armed = false;
    bool waiting = false;
    bool cancelled = false;
    bool served = false; // a payload was accepted
    std::optional<Payload> payload;
    std::condition_variable cv;
  };

  mutable std::mutex mutex_;
  std::unordered_map<ExchangeId, std::shared_ptr<Slot>> slots_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace session
} // namespace custody
