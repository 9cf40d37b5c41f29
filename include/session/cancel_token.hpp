// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace custody {
namespace session {

/**
 * CancelToken - one-shot cancellation shared between a transport
 * connection and the exchange it is serving
 *
 * The connection calls Cancel() when the peer goes away; the exchange
 * installs a callback that wakes its response wait. Cancel() is idempotent
 * and runs the callback at most once. A callback installed after
 * cancellation runs immediately on the installing thread.
 *
 * The callback is invoked without the token's lock held.
 */
class CancelToken {
public:
  using Callback = std::function<void()>;

  static std::shared_ptr<CancelToken> Create() {
    return std::make_shared<CancelToken>();
  }

  void Cancel();

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Replace the callback. Runs it now if already cancelled.
  void SetCallback(Callback callback);

  // Remove the callback (e.g. when the exchange closes)
  void ClearCallback();

private:
  mutable std::mutex mutex_;
  std::atomic<bool> cancelled_{false};
  Callback callback_;
};

} // namespace session
} // namespace custody
