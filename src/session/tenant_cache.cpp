// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/tenant_cache.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"
#include <chrono>

namespace custody {
namespace session {

namespace {

bool IsReady(const std::shared_future<TenantContextPtr> &f) {
  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

TenantContextCache::TenantContextCache(TenantStore &store) : store_(store) {}

TenantContextPtr TenantContextCache::GetOrOpen(const TenantId &id) {
  std::promise<TenantContextPtr> promise;
  std::shared_future<TenantContextPtr> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
      pending = it->second;
    } else {
      entries_.emplace(id, promise.get_future().share());
    }
  }

  if (pending.valid()) {
    // Another exchange opened (or is opening) this tenant
    return pending.get();
  }

  // First opener: open outside the lock so other tenants are not blocked
  open_count_.fetch_add(1);
  LOG_TENANT_DEBUG("Opening tenant store for '{}'", id);
  try {
    TenantContextPtr tenant = store_.Open(id);
    if (!tenant) {
      throw TenantResolutionError("tenant store returned no context for '" + id + "'");
    }
    promise.set_value(tenant);
    LOG_TENANT_INFO("Tenant '{}' opened", id);
    return tenant;
  } catch (const TenantResolutionError &e) {
    LOG_TENANT_WARN("Failed to open tenant '{}': {}", id, e.what());
    Abandon(id, promise, std::current_exception());
    throw;
  } catch (const std::exception &e) {
    // Any store failure is a resolution failure for the exchange
    LOG_TENANT_WARN("Failed to open tenant '{}': {}", id, e.what());
    TenantResolutionError error("cannot open tenant '" + id + "': " + e.what());
    Abandon(id, promise, std::make_exception_ptr(error));
    throw error;
  }
}

void TenantContextCache::Abandon(const TenantId &id,
                                 std::promise<TenantContextPtr> &promise,
                                 std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
  }
  // Waiters that joined this attempt see the same error
  promise.set_exception(error);
}

bool TenantContextCache::Contains(const TenantId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it != entries_.end() && IsReady(it->second);
}

size_t TenantContextCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t ready = 0;
  for (const auto &[id, entry] : entries_) {
    if (IsReady(entry)) {
      ++ready;
    }
  }
  return ready;
}

bool TenantContextCache::Evict(const TenantId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end() || !IsReady(it->second)) {
    return false;
  }
  entries_.erase(it);
  // Still under the lock, so a new open for id cannot start before this close
  if (!store_.Close(id)) {
    LOG_TENANT_WARN("Tenant store for '{}' was not open at eviction", id);
  }
  LOG_TENANT_DEBUG("Evicted tenant '{}' from context cache", id);
  return true;
}

} // namespace session
} // namespace custody
