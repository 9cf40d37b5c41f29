// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/cancel_token.hpp"

namespace custody {
namespace session {

void CancelToken::Cancel() {
  Callback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    callback = std::move(callback_);
    callback_ = nullptr;
  }
  if (callback) {
    callback();
  }
}

void CancelToken::SetCallback(Callback callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      callback_ = std::move(callback);
      return;
    }
  }
  if (callback) {
    callback();
  }
}

void CancelToken::ClearCallback() {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = nullptr;
}

} // namespace session
} // namespace custody
