// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/directory_tenant_store.hpp"
#include "session/errors.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>

namespace custody {
namespace wallet {

namespace {

constexpr const char *LOCK_FILE = ".lock";
constexpr const char *METADATA_FILE = "tenant.json";
constexpr size_t MAX_TENANT_ID_LENGTH = 64;

} // namespace

DirectoryTenantStore::DirectoryTenantStore(std::filesystem::path datadir,
                                           std::vector<TenantConfig> tenants)
    : wallets_dir_(std::move(datadir) / "wallets") {
  for (auto &tenant : tenants) {
    if (!IsValidTenantId(tenant.id)) {
      throw ConfigError("invalid tenant id: '" + tenant.id + "'");
    }
    auto id = tenant.id;
    if (!tenants_.emplace(id, std::move(tenant)).second) {
      throw ConfigError("duplicate tenant id: " + id);
    }
  }
  LOG_TENANT_INFO("Tenant store at {} ({} tenants declared)",
                  wallets_dir_.string(), tenants_.size());
}

DirectoryTenantStore::~DirectoryTenantStore() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &id : open_) {
    util::UnlockDirectory(wallets_dir_ / id, LOCK_FILE);
  }
  open_.clear();
}

bool DirectoryTenantStore::IsValidTenantId(const std::string &id) {
  if (id.empty() || id.size() > MAX_TENANT_ID_LENGTH || id.front() == '.') {
    return false;
  }
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::filesystem::path DirectoryTenantStore::StorePath(const session::TenantId &id) const {
  return wallets_dir_ / id;
}

bool DirectoryTenantStore::IsOpen(const session::TenantId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_.count(id) > 0;
}

session::TenantContextPtr DirectoryTenantStore::Open(const session::TenantId &id) {
  auto it = tenants_.find(id);
  if (it == tenants_.end()) {
    throw TenantResolutionError("unknown tenant: " + id);
  }
  const TenantConfig &config = it->second;
  if (config.key.empty()) {
    throw TenantResolutionError("no credentials configured for tenant " + id);
  }

  const auto path = StorePath(id);
  if (!util::ensure_directory(path)) {
    throw TenantResolutionError("cannot create store directory " + path.string());
  }

  std::string reason;
  switch (util::LockDirectory(path, LOCK_FILE, false, &reason)) {
  case util::LockResult::Success:
    break;
  case util::LockResult::ErrorLock:
    throw TenantResolutionError("store for tenant " + id +
                                " is locked by another process");
  case util::LockResult::ErrorWrite:
    throw TenantResolutionError("cannot lock store for tenant " + id + ": " + reason);
  }

  auto context = std::make_shared<session::TenantContext>();
  context->id = id;
  context->label = config.label.empty() ? id : config.label;
  context->store_path = path;
  context->opened_at = util::GetSystemTime();

  nlohmann::json metadata = {
      {"id", context->id},
      {"label", context->label},
      {"opened_at", util::FormatISO8601(util::GetTime())},
  };
  if (!util::atomic_write_file(path / METADATA_FILE, metadata.dump(2) + "\n")) {
    // Metadata is informational; the store itself is usable
    LOG_TENANT_WARN("Failed to write {} for tenant {}", METADATA_FILE, id);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_.insert(id);
  }
  LOG_TENANT_INFO("Opened store for tenant {} at {}", id, path.string());
  return context;
}

bool DirectoryTenantStore::Close(const session::TenantId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_.erase(id) == 0) {
    return false;
  }
  util::UnlockDirectory(StorePath(id), LOCK_FILE);
  LOG_TENANT_DEBUG("Closed store for tenant {}", id);
  return true;
}

std::vector<TenantConfig> DirectoryTenantStore::TenantsFromJson(const nlohmann::json &doc) {
  std::vector<TenantConfig> tenants;
  if (!doc.is_object() || !doc.contains("tenants")) {
    return tenants;
  }

  const auto &list = doc["tenants"];
  if (!list.is_array()) {
    throw ConfigError("tenants must be an array");
  }

  for (const auto &entry : list) {
    if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
      throw ConfigError("each tenant needs a string id");
    }
    TenantConfig tenant;
    tenant.id = entry["id"].get<std::string>();
    if (!IsValidTenantId(tenant.id)) {
      throw ConfigError("invalid tenant id: '" + tenant.id + "'");
    }
    if (entry.contains("label") && !entry["label"].is_string()) {
      throw ConfigError("tenant " + tenant.id + ": label must be a string");
    }
    if (entry.contains("key") && !entry["key"].is_string()) {
      throw ConfigError("tenant " + tenant.id + ": key must be a string");
    }
    tenant.label = entry.value("label", "");
    tenant.key = entry.value("key", "");
    for (const auto &existing : tenants) {
      if (existing.id == tenant.id) {
        throw ConfigError("duplicate tenant id: " + tenant.id);
      }
    }
    tenants.push_back(std::move(tenant));
  }
  return tenants;
}

} // namespace wallet
} // namespace custody
