// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/context_switcher.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"

namespace custody {
namespace session {

ContextSwitcher::ContextSwitcher(TenantContextCache &cache) : cache_(cache) {}

ProcessingContextPtr ContextSwitcher::Switch(const ProcessingContextPtr &base,
                                             const TenantId &tenant_id) {
  if (!base) {
    throw std::invalid_argument("ContextSwitcher::Switch requires a base context");
  }
  if (tenant_id.empty()) {
    throw TenantResolutionError("empty tenant id");
  }

  TenantContextPtr tenant = cache_.GetOrOpen(tenant_id);
  LOG_TENANT_TRACE("Switching context {} -> {}", base->Scope(), tenant->id);
  return base->WithTenant(std::move(tenant));
}

TenantId ContextSwitcher::Select(const std::vector<TenantId> &candidates,
                                 TenantSelectionPolicy policy) const {
  TenantId chosen = SelectTenant(candidates, policy);
  if (candidates.size() > 1) {
    LOG_TENANT_DEBUG("Message resolved to {} tenants, policy '{}' chose '{}'",
                     candidates.size(), TenantSelectionPolicyName(policy),
                     chosen);
  }
  return chosen;
}

} // namespace session
} // namespace custody
