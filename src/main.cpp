// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "network/http_transport.hpp"
#include "session/context.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and early errors before logger initialized

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>            Data directory (default: ~/.custody)\n"
      << "  --config=<file>             Configuration file (default: <datadir>/custody.json)\n"
      << "  --host=<addr>               Listen address (default: 0.0.0.0)\n"
      << "  --port=<port>               Listen port (default: 8020)\n"
      << "  --exchange-threads=<n>      Concurrent exchanges (default: 8)\n"
      << "  --response-timeout=<ms>     Direct response wait (default: 30000)\n"
      << "  --max-message-size=<bytes>  Inbound body limit (default: 4194304)\n"
      << "  --tenant-routing=<0|1>      Route messages to tenant stores\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, session, tenant, app, all\n"
      << "                       Can be comma-separated: --debug=session,tenant\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// "--name=value" -> value when arg starts with prefix "--name="
bool match_option(const std::string &arg, const char *prefix, std::string &value) {
  const std::string p(prefix);
  if (arg.compare(0, p.size(), p) != 0) {
    return false;
  }
  value = arg.substr(p.size());
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace custody;

  try {
    app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    std::string value;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (match_option(arg, "--datadir=", value)) {
        config.datadir = value;
      } else if (match_option(arg, "--config=", value)) {
        config.config_file = value;
      } else if (match_option(arg, "--host=", value)) {
        config.host = value;
      } else if (match_option(arg, "--port=", value)) {
        auto port = util::SafeParsePort(value);
        if (!port) {
          std::cerr << "Error: Invalid port number: " << value << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.port = *port;
      } else if (match_option(arg, "--exchange-threads=", value)) {
        auto threads = util::SafeParseInt(value, 1, static_cast<int>(session::MAX_EXCHANGE_THREADS));
        if (!threads) {
          std::cerr << "Error: Invalid exchange thread count: " << value << std::endl;
          return 1;
        }
        config.exchange_threads = static_cast<size_t>(*threads);
      } else if (match_option(arg, "--response-timeout=", value)) {
        auto ms = util::SafeParseInt64(value, 1, session::MAX_RESPONSE_TIMEOUT_MS);
        if (!ms) {
          std::cerr << "Error: Invalid response timeout: " << value << std::endl;
          std::cerr << "Timeout must be between 1 and 3600000 ms" << std::endl;
          return 1;
        }
        config.response_timeout = std::chrono::milliseconds(*ms);
      } else if (match_option(arg, "--max-message-size=", value)) {
        auto bytes = util::SafeParseInt64(value, 0, 64ll * 1024 * 1024);
        if (!bytes) {
          std::cerr << "Error: Invalid message size limit: " << value << std::endl;
          return 1;
        }
        config.max_message_size = static_cast<size_t>(*bytes);
      } else if (match_option(arg, "--tenant-routing=", value)) {
        auto flag = util::SafeParseInt(value, 0, 1);
        if (!flag) {
          std::cerr << "Error: --tenant-routing takes 0 or 1" << std::endl;
          return 1;
        }
        config.tenant_routing = *flag == 1;
      } else if (arg == "--tenant-routing") {
        config.tenant_routing = true;
      } else if (match_option(arg, "--loglevel=", value)) {
        log_level = value;
      } else if (match_option(arg, "--debug=", value)) {
        for (auto &component : util::SplitList(value, ',')) {
          debug_components.push_back(std::move(component));
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (!util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir
                << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "custody.log").string();
    util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        util::LogManager::SetComponentLevel("network", "trace");
      } else if (!util::LogManager::SetComponentLevel(component, "trace")) {
        LOG_WARN("Unknown log component '{}'", component);
      }
    }

    // Nested scope: the application (and every thread it owns) is gone
    // before the logger shuts down
    {
      app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
