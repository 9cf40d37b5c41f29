// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/tenant.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <unordered_map>

namespace custody {
namespace session {

/**
 * TenantContextCache - the only long-lived shared mutable state of the ingress
 *
 * Opens each tenant store at most once and hands every exchange the same
 * TenantContext. Concurrent first opens of one tenant race on the map entry:
 * the first caller installs a pending slot and opens the store outside the
 * lock; everyone else waits on that slot and reuses its result.
 *
 * A failed open is never cached. Callers that were waiting on it receive
 * the same TenantResolutionError; the next call retries the open.
 */
class TenantContextCache {
public:
  explicit TenantContextCache(TenantStore &store);

  TenantContextCache(const TenantContextCache &) = delete;
  TenantContextCache &operator=(const TenantContextCache &) = delete;

  /**
   * Cached context for id, opening the store on first use
   * @throws TenantResolutionError (from the store) if the open fails
   */
  TenantContextPtr GetOrOpen(const TenantId &id);

  // True once id has been opened successfully
  bool Contains(const TenantId &id) const;

  // Number of successfully opened tenants
  size_t Size() const;

  // Drop a tenant and close its store; the next GetOrOpen() opens it again
  bool Evict(const TenantId &id);

  // Store opens attempted so far (successful or not)
  uint64_t OpenCount() const { return open_count_.load(); }

private:
  // Forget a failed open so the next caller retries
  void Abandon(const TenantId &id, std::promise<TenantContextPtr> &promise,
               std::exception_ptr error);

  TenantStore &store_;

  mutable std::mutex mutex_;
  // Ready entries and entries still being opened by their first caller
  std::unordered_map<TenantId, std::shared_future<TenantContextPtr>> entries_;

  std::atomic<uint64_t> open_count_{0};
};

} // namespace session
} // namespace custody
