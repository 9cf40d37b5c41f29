// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/tenant.hpp"
#include "session/errors.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>

namespace custody {
namespace session {

std::optional<TenantSelectionPolicy>
ParseTenantSelectionPolicy(const std::string &name) {
  const std::string lowered = util::ToLower(util::Trim(name));
  if (lowered == "first") {
    return TenantSelectionPolicy::FIRST;
  }
  if (lowered == "lowest") {
    return TenantSelectionPolicy::LOWEST;
  }
  if (lowered == "sole") {
    return TenantSelectionPolicy::SOLE;
  }
  return std::nullopt;
}

const char *TenantSelectionPolicyName(TenantSelectionPolicy policy) {
  switch (policy) {
  case TenantSelectionPolicy::FIRST:
    return "first";
  case TenantSelectionPolicy::LOWEST:
    return "lowest";
  case TenantSelectionPolicy::SOLE:
    return "sole";
  }
  return "unknown";
}

TenantId SelectTenant(const std::vector<TenantId> &candidates,
                      TenantSelectionPolicy policy) {
  if (candidates.empty()) {
    throw TenantResolutionError("no tenant matches the inbound message");
  }

  switch (policy) {
  case TenantSelectionPolicy::FIRST:
    return candidates.front();
  case TenantSelectionPolicy::LOWEST:
    return *std::min_element(candidates.begin(), candidates.end());
  case TenantSelectionPolicy::SOLE: {
    // The same tenant listed twice (two of its keys) is not ambiguous
    const TenantId &first = candidates.front();
    bool ambiguous = std::any_of(candidates.begin(), candidates.end(),
                                 [&](const TenantId &id) { return id != first; });
    if (ambiguous) {
      throw TenantResolutionError("message addresses " +
                                  std::to_string(candidates.size()) +
                                  " tenants; refusing to pick one");
    }
    return first;
  }
  }
  return candidates.front();
}

} // namespace session
} // namespace custody
