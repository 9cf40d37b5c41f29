// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/tenant.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace custody {
namespace session {

// Accepted ranges for values that also come from the command line
constexpr int64_t MAX_RESPONSE_TIMEOUT_MS = 3600 * 1000;
constexpr size_t MAX_EXCHANGE_THREADS = 1024;

// Process-wide settings shared by every exchange. Loaded once at startup
// and never modified afterwards.
struct Settings {
  // Route each inbound message to a tenant before unpacking it
  bool tenant_routing = false;

  TenantSelectionPolicy tenant_selection = TenantSelectionPolicy::FIRST;

  // Upper bound on a direct-response wait (unbounded waits are not allowed)
  std::chrono::milliseconds response_timeout{30000};

  // Largest accepted inbound body in bytes (0 = transport default)
  size_t max_message_size = 0;

  std::string label = "custody";
};

/**
 * Parse the "settings" object of the configuration file
 *
 * {
 *   "label": "custody",
 *   "tenant_routing": true,
 *   "tenant_selection": "first" | "lowest" | "sole",
 *   "response_timeout_ms": 30000,
 *   "max_message_size": 4194304
 * }
 *
 * Absent keys keep their defaults.
 * @throws ConfigError on wrong types or out-of-range values
 */
Settings SettingsFromJson(const nlohmann::json &j);

/**
 * Read a JSON configuration document
 *
 * @return the parsed document, or null JSON when the file does not exist
 * @throws ConfigError if the file cannot be read or is not valid JSON
 */
nlohmann::json ReadConfigDocument(const std::filesystem::path &path);

// Non-negative JSON integer as uint64_t, whether stored signed or unsigned
std::optional<uint64_t> JsonUnsigned(const nlohmann::json &v);

/**
 * Read the top-level "exchange_threads" key of the configuration document
 *
 * @return the worker count, or nullopt when the key is absent
 * @throws ConfigError unless the value is an integer in 1..MAX_EXCHANGE_THREADS
 */
std::optional<size_t> ExchangeThreadsFromJson(const nlohmann::json &doc);

// SettingsFromJson(ReadConfigDocument(path))
Settings LoadSettings(const std::filesystem::path &path);

class ProcessingContext;
using ProcessingContextPtr = std::shared_ptr<const ProcessingContext>;

/**
 * ProcessingContext - everything an exchange needs to process one message
 *
 * Immutable value. The process-wide default context has no tenant; tenant
 * routing derives a new context with WithTenant() and leaves the default
 * untouched, so concurrent exchanges never observe each other's tenant.
 */
class ProcessingContext {
public:
  explicit ProcessingContext(std::shared_ptr<const Settings> settings,
                             TenantContextPtr tenant = nullptr);

  static ProcessingContextPtr Create(Settings settings);

  const Settings &settings() const { return *settings_; }
  const std::shared_ptr<const Settings> &settings_ptr() const {
    return settings_;
  }

  const TenantContextPtr &tenant() const { return tenant_; }
  bool HasTenant() const { return tenant_ != nullptr; }

  // Tenant id, or "default" for the process-wide context
  std::string Scope() const;

  // New context bound to tenant; shares this context's settings
  ProcessingContextPtr WithTenant(TenantContextPtr tenant) const;

private:
  std::shared_ptr<const Settings> settings_;
  TenantContextPtr tenant_;
};

} // namespace session
} // namespace custody
