// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "messaging/plaintext_unpacker.hpp"
#include "messaging/trust_ping_responder.hpp"
#include "network/http_transport.hpp"
#include "session/context_switcher.hpp"
#include "session/exchange.hpp"
#include "session/inbound_handler.hpp"
#include "session/response_correlator.hpp"
#include "session/tenant_cache.hpp"
#include "util/files.hpp"
#include "wallet/directory_tenant_store.hpp"
#include "wallet/recipient_tenant_resolver.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace custody {
namespace app {

// Application configuration
//
// Optional fields are command-line overrides; when unset the value comes
// from the configuration file, then from the built-in default.
struct AppConfig {
  std::filesystem::path datadir;

  // Empty = <datadir>/custody.json
  std::filesystem::path config_file;

  // Listener
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<size_t> exchange_threads;

  // Session settings
  std::optional<bool> tenant_routing;
  std::optional<std::chrono::milliseconds> response_timeout;
  std::optional<size_t> max_message_size;

  size_t responder_threads = 1;

  AppConfig() : datadir(util::get_default_datadir()) {}

  std::filesystem::path ConfigFilePath() const {
    return config_file.empty() ? datadir / "custody.json" : config_file;
  }
};

// Application - wires the ingress node together and owns its lifecycle
//
//   initialize()  lock datadir, load configuration, build components
//   start()       bind the listener, install signal handlers
//   wait_for_shutdown() / stop()
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  const session::ProcessingContextPtr &base_context() const { return base_context_; }
  session::InboundMessageHandler &handler() { return *handler_; }
  wallet::RecipientTenantResolver &tenant_resolver() { return *resolver_; }
  network::HttpInboundTransport &transport() { return *transport_; }

  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  bool datadir_locked_{false};

  // Loaded configuration document (null when there is no file)
  nlohmann::json config_doc_;
  session::ProcessingContextPtr base_context_;

  // Components, in dependency order (destroyed in reverse)
  std::unique_ptr<wallet::DirectoryTenantStore> tenant_store_;
  std::unique_ptr<session::TenantContextCache> tenant_cache_;
  std::unique_ptr<session::ContextSwitcher> context_switcher_;
  std::unique_ptr<wallet::RecipientTenantResolver> resolver_;
  std::unique_ptr<messaging::PlaintextUnpacker> unpacker_;
  std::unique_ptr<session::ResponseCorrelator> correlator_;
  std::unique_ptr<messaging::TrustPingResponder> responder_;
  std::unique_ptr<session::InboundSessionFactory> factory_;
  std::unique_ptr<session::InboundMessageHandler> handler_;
  std::unique_ptr<network::HttpInboundTransport> transport_;

  // Initialization steps
  bool init_datadir();
  bool load_config();
  bool init_tenants();
  bool init_session();
  bool init_transport();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace custody
