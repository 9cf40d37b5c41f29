// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/tenant.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace custody {
namespace wallet {

// One tenant as declared in the configuration file
struct TenantConfig {
  session::TenantId id;
  std::string label;
  std::string key; // store credential; an empty key cannot be opened
};

/**
 * DirectoryTenantStore - TenantStore backed by one directory per tenant
 *
 * Layout:
 *   <datadir>/wallets/<id>/.lock        exclusive while the store is open
 *   <datadir>/wallets/<id>/tenant.json  id, label, last open time
 *
 * Open() is not idempotent by itself; callers go through
 * TenantContextCache, which guarantees a single open per tenant.
 */
class DirectoryTenantStore : public session::TenantStore {
public:
  DirectoryTenantStore(std::filesystem::path datadir,
                       std::vector<TenantConfig> tenants);
  ~DirectoryTenantStore() override;

  DirectoryTenantStore(const DirectoryTenantStore &) = delete;
  DirectoryTenantStore &operator=(const DirectoryTenantStore &) = delete;

  /**
   * @throws TenantResolutionError for an unknown tenant, a missing key, or a
   *         store locked by another process
   */
  session::TenantContextPtr Open(const session::TenantId &id) override;

  // Release the lock on a tenant store. Returns false if it was not open.
  bool Close(const session::TenantId &id) override;

  bool IsOpen(const session::TenantId &id) const;
  size_t TenantCount() const { return tenants_.size(); }
  std::filesystem::path StorePath(const session::TenantId &id) const;

  /**
   * Parse the "tenants" array of the configuration document
   *
   *   "tenants": [ { "id": "acme", "label": "Acme Corp", "key": "..." } ]
   *
   * A missing array yields no tenants.
   * @throws ConfigError on malformed entries or duplicate / unsafe ids
   */
  static std::vector<TenantConfig> TenantsFromJson(const nlohmann::json &doc);

  // Ids must be usable as a single path component
  static bool IsValidTenantId(const std::string &id);

private:
  const std::filesystem::path wallets_dir_;
  std::unordered_map<session::TenantId, TenantConfig> tenants_;

  mutable std::mutex mutex_;
  std::set<session::TenantId> open_;
};

} // namespace wallet
} // namespace custody
