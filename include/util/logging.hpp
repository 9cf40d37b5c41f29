// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace custody {
namespace util {

/**
 * Logging facade over spdlog
 *
 * Every subsystem logs through a named component logger so that operators
 * can raise verbosity for one area (e.g. --debug=session) without drowning
 * in transport noise.
 *
 * Components: default, network, session, tenant, app
 *
 * Thread-safety: All methods are thread-safe. Initialization runs exactly
 * once (std::call_once); the logger table is guarded by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call has an effect.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "custody.log");

  /**
   * Flush and drop all loggers. Logging after Shutdown() falls back to a
   * silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for a component. Unknown names map to "default".
   * Auto-initializes with defaults when called before Initialize().
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level for every component
  static void SetLogLevel(const std::string &level);

  // Set log level for one component; returns false for unknown components
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names accepted by SetComponentLevel (and by --debug on the command line)
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace custody

#define LOG_TRACE(...)                                                         \
  custody::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  custody::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  custody::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  custody::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  custody::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Transport / listener
#define LOG_NET_TRACE(...)                                                     \
  custody::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  custody::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  custody::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  custody::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  custody::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

// Exchange sessions and response correlation
#define LOG_SESSION_TRACE(...)                                                 \
  custody::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...)                                                 \
  custody::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...)                                                  \
  custody::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...)                                                  \
  custody::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)
#define LOG_SESSION_ERROR(...)                                                 \
  custody::util::LogManager::GetLogger("session")->error(__VA_ARGS__)

// Tenant resolution, tenant stores, context cache
#define LOG_TENANT_TRACE(...)                                                  \
  custody::util::LogManager::GetLogger("tenant")->trace(__VA_ARGS__)
#define LOG_TENANT_DEBUG(...)                                                  \
  custody::util::LogManager::GetLogger("tenant")->debug(__VA_ARGS__)
#define LOG_TENANT_INFO(...)                                                   \
  custody::util::LogManager::GetLogger("tenant")->info(__VA_ARGS__)
#define LOG_TENANT_WARN(...)                                                   \
  custody::util::LogManager::GetLogger("tenant")->warn(__VA_ARGS__)
#define LOG_TENANT_ERROR(...)                                                  \
  custody::util::LogManager::GetLogger("tenant")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  custody::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  custody::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  custody::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
