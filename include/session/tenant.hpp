// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/payload.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace custody {
namespace session {

using TenantId = std::string;

/**
 * TenantContext - configuration and key scope of one tenant ("wallet")
 *
 * Owned and cached by the tenant subsystem (TenantContextCache). Exchanges
 * only borrow it through their ProcessingContext for their own lifetime.
 * Immutable once opened.
 */
struct TenantContext {
  TenantId id;
  std::string label;
  std::filesystem::path store_path;
  std::chrono::system_clock::time_point opened_at;
};

using TenantContextPtr = std::shared_ptr<const TenantContext>;

/**
 * TenantResolver - maps inbound bytes to candidate tenants
 *
 * Must not open any tenant store: resolution only names candidates.
 * Implementations must be safe to call from concurrent exchanges.
 */
class TenantResolver {
public:
  virtual ~TenantResolver() = default;

  // Candidate tenant ids in resolver order. Empty if none match.
  virtual std::vector<TenantId> Resolve(const Payload &raw) = 0;
};

/**
 * TenantStore - opens a tenant's persistent store
 *
 * Called only through TenantContextCache, which guarantees a single open per
 * tenant. Throws TenantResolutionError if the tenant is unknown, its
 * credentials are missing, or its store cannot be opened (e.g. locked).
 */
class TenantStore {
public:
  virtual ~TenantStore() = default;

  virtual TenantContextPtr Open(const TenantId &id) = 0;

  // Release what Open() acquired. Returns false if id was not open.
  virtual bool Close(const TenantId &id) = 0;
};

/**
 * Rule for choosing one tenant when a message resolves to several
 *
 * FIRST  - resolver order (first recipient wins)
 * LOWEST - lexicographically smallest id, independent of recipient order
 * SOLE   - refuse ambiguous messages
 */
enum class TenantSelectionPolicy { FIRST, LOWEST, SOLE };

std::optional<TenantSelectionPolicy>
ParseTenantSelectionPolicy(const std::string &name);

const char *TenantSelectionPolicyName(TenantSelectionPolicy policy);

/**
 * Pick the tenant for an exchange from the resolver's candidates
 *
 * @throws TenantResolutionError if candidates is empty, or if it holds more
 *         than one distinct id under SOLE
 */
TenantId SelectTenant(const std::vector<TenantId> &candidates,
                      TenantSelectionPolicy policy);

} // namespace session
} // namespace custody
