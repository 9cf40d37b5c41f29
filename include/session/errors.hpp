// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace custody {

/**
 * Error taxonomy
 *
 * TransportSetupError   - listener could not start (bind failure). Fatal,
 *                         reported to the operator, never retried.
 * MessageParseError     - inbound bytes could not be decoded/authenticated.
 *                         Client fault; the exchange closes with 400.
 * TenantResolutionError - no usable tenant for the message (unknown,
 *                         ambiguous, locked store, missing credentials).
 *                         Server fault; the exchange closes with 500 and
 *                         never reaches Receive().
 * ConfigError           - invalid configuration at startup.
 *
 * A response-wait timeout is not an error: it is a normal outcome.
 */

class TransportSetupError : public std::runtime_error {
public:
  explicit TransportSetupError(const std::string &what)
      : std::runtime_error(what) {}
};

class MessageParseError : public std::runtime_error {
public:
  explicit MessageParseError(const std::string &what)
      : std::runtime_error(what) {}
};

class TenantResolutionError : public std::runtime_error {
public:
  explicit TenantResolutionError(const std::string &what)
      : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace custody
