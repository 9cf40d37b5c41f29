// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/context.hpp"
#include "session/tenant_cache.hpp"
#include <vector>

namespace custody {
namespace session {

/**
 * ContextSwitcher - (base context, tenant id) -> tenant-scoped context
 *
 * The base context is never modified. The tenant store is opened (once, via
 * the cache) only after the tenant has been selected, so no exchange gains
 * access to a store before routing has decided it should.
 */
class ContextSwitcher {
public:
  explicit ContextSwitcher(TenantContextCache &cache);

  /**
   * @throws TenantResolutionError if the tenant is unknown or its store
   *         cannot be opened
   */
  ProcessingContextPtr Switch(const ProcessingContextPtr &base,
                              const TenantId &tenant_id);

  TenantId Select(const std::vector<TenantId> &candidates,
                  TenantSelectionPolicy policy) const;

  TenantContextCache &cache() { return cache_; }

private:
  TenantContextCache &cache_;
};

} // namespace session
} // namespace custody
