// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace custody {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Value of the HTTP Server header, e.g. "custody/0.3.0"
inline std::string GetServerString() { return "custody/" + GetVersionString(); }

inline std::string GetFullVersionString() {
  return "custodyd version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";   // single-tenant
constexpr const char *YELLOW = "\033[1;33m"; // tenant routing
} // namespace colors

// Startup banner; `mode` is shown on the second line ("single-tenant", ...)
inline std::string GetStartupBanner(const std::string &mode, bool tenant_routing) {
  const char *color = tenant_routing ? colors::YELLOW : colors::CYAN;

  auto line = [](const std::string &label, const std::string &value) {
    std::string text = "║  " + label + value;
    // Box interior is 63 columns; "║  " counts as 3
    size_t used = 3 + label.size() + value.size();
    size_t padding = used < 64 ? 64 - used : 0;
    return text + std::string(padding, ' ') + "║\n";
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "╔═══════════════════════════════════════════════════════════════╗\n";
  banner += line("", "custodyd - multi-tenant agent ingress");
  banner += "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("Version: ", GetVersionString());
  banner += line("Mode:    ", mode);
  banner += "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("", GetCopyrightString());
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace custody
