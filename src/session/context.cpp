// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/context.hpp"
#include "session/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace custody {
namespace session {

namespace {

// Largest body we are willing to buffer for a single exchange
constexpr uint64_t MAX_MESSAGE_SIZE_LIMIT = 64ull * 1024 * 1024;

} // namespace

std::optional<uint64_t> JsonUnsigned(const nlohmann::json &v) {
  if (!v.is_number_integer()) {
    return std::nullopt;
  }
  if (v.is_number_unsigned()) {
    return v.get<uint64_t>();
  }
  const int64_t i = v.get<int64_t>();
  if (i < 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(i);
}

Settings SettingsFromJson(const nlohmann::json &j) {
  Settings settings;
  if (j.is_null()) {
    return settings;
  }
  if (!j.is_object()) {
    throw ConfigError("settings must be a JSON object");
  }

  if (j.contains("label")) {
    if (!j["label"].is_string()) {
      throw ConfigError("settings.label must be a string");
    }
    settings.label = j["label"].get<std::string>();
  }

  if (j.contains("tenant_routing")) {
    if (!j["tenant_routing"].is_boolean()) {
      throw ConfigError("settings.tenant_routing must be a boolean");
    }
    settings.tenant_routing = j["tenant_routing"].get<bool>();
  }

  if (j.contains("tenant_selection")) {
    if (!j["tenant_selection"].is_string()) {
      throw ConfigError("settings.tenant_selection must be a string");
    }
    const auto name = j["tenant_selection"].get<std::string>();
    auto policy = ParseTenantSelectionPolicy(name);
    if (!policy) {
      throw ConfigError("unknown tenant selection policy: " + name);
    }
    settings.tenant_selection = *policy;
  }

  if (j.contains("response_timeout_ms")) {
    auto v = JsonUnsigned(j["response_timeout_ms"]);
    if (!v || *v == 0 || *v > static_cast<uint64_t>(MAX_RESPONSE_TIMEOUT_MS)) {
      throw ConfigError("settings.response_timeout_ms must be an integer in 1.." +
                        std::to_string(MAX_RESPONSE_TIMEOUT_MS));
    }
    settings.response_timeout =
        std::chrono::milliseconds(static_cast<int64_t>(*v));
  }

  if (j.contains("max_message_size")) {
    auto v = JsonUnsigned(j["max_message_size"]);
    if (!v || *v > MAX_MESSAGE_SIZE_LIMIT) {
      throw ConfigError("settings.max_message_size must be an integer <= " +
                        std::to_string(MAX_MESSAGE_SIZE_LIMIT));
    }
    settings.max_message_size = static_cast<size_t>(*v);
  }

  return settings;
}

std::optional<size_t> ExchangeThreadsFromJson(const nlohmann::json &doc) {
  if (!doc.is_object() || !doc.contains("exchange_threads")) {
    return std::nullopt;
  }
  auto v = JsonUnsigned(doc["exchange_threads"]);
  if (!v || *v == 0 || *v > MAX_EXCHANGE_THREADS) {
    throw ConfigError("exchange_threads must be an integer in 1.." +
                      std::to_string(MAX_EXCHANGE_THREADS));
  }
  return static_cast<size_t>(*v);
}

nlohmann::json ReadConfigDocument(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_DEBUG("No configuration file at {}, using defaults", path.string());
    return nullptr;
  }

  auto contents = util::read_file_string(path);
  if (!contents) {
    throw ConfigError("cannot read configuration file " + path.string());
  }

  try {
    return nlohmann::json::parse(*contents);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigError("malformed configuration file " + path.string() + ": " +
                      e.what());
  }
}

Settings LoadSettings(const std::filesystem::path &path) {
  return SettingsFromJson(ReadConfigDocument(path));
}

ProcessingContext::ProcessingContext(std::shared_ptr<const Settings> settings,
                                     TenantContextPtr tenant)
    : settings_(std::move(settings)), tenant_(std::move(tenant)) {
  if (!settings_) {
    throw std::invalid_argument("ProcessingContext requires settings");
  }
}

ProcessingContextPtr ProcessingContext::Create(Settings settings) {
  return std::make_shared<const ProcessingContext>(
      std::make_shared<const Settings>(std::move(settings)));
}

std::string ProcessingContext::Scope() const {
  return tenant_ ? tenant_->id : std::string("default");
}

ProcessingContextPtr ProcessingContext::WithTenant(TenantContextPtr tenant) const {
  return std::make_shared<const ProcessingContext>(settings_, std::move(tenant));
}

} // namespace session
} // namespace custody
