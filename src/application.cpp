// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "session/errors.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace custody {
namespace app {

Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  // Components go before the datadir lock is released
  transport_.reset();
  handler_.reset();
  factory_.reset();
  responder_.reset();
  tenant_store_.reset();
  if (datadir_locked_) {
    util::UnlockDirectory(config_.datadir, ".lock");
  }
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing custodyd...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!load_config()) {
    LOG_APP_ERROR("Failed to load configuration");
    return false;
  }

  const bool routing = base_context_->settings().tenant_routing;
  std::cout << GetStartupBanner(routing ? "multi-tenant (routing on)"
                                        : "single-tenant",
                                routing)
            << std::flush;

  if (!init_tenants()) {
    LOG_APP_ERROR("Failed to initialize tenant stores");
    return false;
  }

  if (!init_session()) {
    LOG_APP_ERROR("Failed to initialize session layer");
    return false;
  }

  if (!init_transport()) {
    LOG_APP_ERROR("Failed to initialize transport");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting custodyd...");
  setup_signal_handlers();

  try {
    transport_->Start();
  } catch (const TransportSetupError &e) {
    LOG_APP_ERROR("{}", e.what());
    return false;
  }

  running_ = true;
  LOG_APP_INFO("custodyd started ({}://{}:{})", transport_->Scheme(),
           config_.host.value_or("0.0.0.0"), transport_->ListeningPort());
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down custodyd...");
  running_ = false;

  // Listener first: no new exchanges, waiting ones are cancelled
  if (transport_) {
    transport_->Stop();
  }
  if (responder_) {
    responder_->Stop();
  }

  if (handler_) {
    LOG_APP_INFO("Handled {} exchanges ({} replies, {} parse failures, {} tenant failures)",
             handler_->ExchangesHandled(), handler_->RepliesSent(),
             handler_->ParseFailures(), handler_->ResolutionFailures());
  }
  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Cannot create data directory {}", config_.datadir.string());
    return false;
  }

  std::string reason;
  switch (util::LockDirectory(config_.datadir, ".lock", false, &reason)) {
  case util::LockResult::Success:
    datadir_locked_ = true;
    return true;
  case util::LockResult::ErrorLock:
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. custodyd is "
              "probably already running.",
              config_.datadir.string());
    return false;
  case util::LockResult::ErrorWrite:
    LOG_APP_ERROR("Cannot write to data directory {}: {}", config_.datadir.string(),
              reason);
    return false;
  }
  return false;
}

bool Application::load_config() {
  const auto path = config_.ConfigFilePath();
  try {
    config_doc_ = session::ReadConfigDocument(path);
    session::Settings settings = session::SettingsFromJson(config_doc_);

    if (config_.tenant_routing) {
      settings.tenant_routing = *config_.tenant_routing;
    }
    if (config_.response_timeout) {
      settings.response_timeout = *config_.response_timeout;
    }
    if (config_.max_message_size) {
      settings.max_message_size = *config_.max_message_size;
    }

    LOG_APP_INFO("Settings: tenant_routing={}, tenant_selection={}, "
             "response_timeout={}ms, max_message_size={}",
             settings.tenant_routing,
             session::TenantSelectionPolicyName(settings.tenant_selection),
             settings.response_timeout.count(), settings.max_message_size);

    base_context_ = session::ProcessingContext::Create(std::move(settings));
  } catch (const ConfigError &e) {
    LOG_APP_ERROR("{}: {}", path.string(), e.what());
    return false;
  }
  return true;
}

bool Application::init_tenants() {
  try {
    auto tenants = wallet::DirectoryTenantStore::TenantsFromJson(config_doc_);
    tenant_store_ = std::make_unique<wallet::DirectoryTenantStore>(
        config_.datadir, std::move(tenants));
  } catch (const ConfigError &e) {
    LOG_APP_ERROR("Invalid tenant configuration: {}", e.what());
    return false;
  }

  tenant_cache_ = std::make_unique<session::TenantContextCache>(*tenant_store_);
  context_switcher_ = std::make_unique<session::ContextSwitcher>(*tenant_cache_);
  resolver_ = std::make_unique<wallet::RecipientTenantResolver>();

  // "routes": { "<recipient verkey>": "<tenant id>" }
  if (config_doc_.is_object() && config_doc_.contains("routes")) {
    const auto &routes = config_doc_["routes"];
    if (!routes.is_object()) {
      LOG_APP_ERROR("routes must be an object of verkey -> tenant id");
      return false;
    }
    for (const auto &[verkey, tenant] : routes.items()) {
      if (!tenant.is_string()) {
        LOG_APP_ERROR("route for {} must name a tenant id", verkey);
        return false;
      }
      resolver_->AddRoute(verkey, tenant.get<std::string>());
    }
  }

  if (base_context_->settings().tenant_routing && tenant_store_->TenantCount() == 0) {
    LOG_APP_WARN("Tenant routing is enabled but no tenants are configured; "
             "every message will be rejected");
  }
  LOG_APP_INFO("{} tenants, {} recipient routes", tenant_store_->TenantCount(),
           resolver_->RouteCount());
  return true;
}

bool Application::init_session() {
  unpacker_ = std::make_unique<messaging::PlaintextUnpacker>();
  correlator_ = std::make_unique<session::ResponseCorrelator>();
  responder_ = std::make_unique<messaging::TrustPingResponder>(
      *correlator_, config_.responder_threads);

  session::ExchangeServices services;
  services.tenant_resolver = resolver_.get();
  services.context_switcher = context_switcher_.get();
  services.unpacker = unpacker_.get();
  services.router = responder_.get();
  services.correlator = correlator_.get();

  factory_ = std::make_unique<session::InboundSessionFactory>(base_context_, services);
  handler_ = std::make_unique<session::InboundMessageHandler>(*factory_);
  return true;
}

bool Application::init_transport() {
  network::HttpTransportConfig http;
  try {
    if (config_doc_.is_object()) {
      http.host = config_doc_.value("host", http.host);
      if (config_doc_.contains("port")) {
        auto port = session::JsonUnsigned(config_doc_["port"]);
        if (!port || *port == 0 || *port > 65535) {
          LOG_APP_ERROR("Invalid listener configuration: port must be 1-65535");
          return false;
        }
        http.port = static_cast<uint16_t>(*port);
      }
      if (auto threads = session::ExchangeThreadsFromJson(config_doc_)) {
        http.exchange_threads = *threads;
      }
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_APP_ERROR("Invalid listener configuration: {}", e.what());
    return false;
  } catch (const ConfigError &e) {
    LOG_APP_ERROR("Invalid listener configuration: {}", e.what());
    return false;
  }

  if (config_.host) {
    http.host = *config_.host;
  }
  if (config_.port) {
    http.port = *config_.port;
  }
  if (config_.exchange_threads) {
    http.exchange_threads = *config_.exchange_threads;
  }
  http.max_message_size = base_context_->settings().max_message_size;

  transport_ = std::make_unique<network::HttpInboundTransport>(http, *handler_);
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // write() is async-signal-safe, std::cout is not
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace custody
