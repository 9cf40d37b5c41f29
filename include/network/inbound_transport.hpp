// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

namespace custody {
namespace network {

// InboundTransport - a listener that feeds inbound exchanges to the node.
// Implementations own their sockets and threads; the exchange logic lives in
// session::InboundMessageHandler.
class InboundTransport {
public:
  virtual ~InboundTransport() = default;

  // Bind and begin accepting. Throws TransportSetupError if the listener
  // cannot be set up (address in use, bad host, ...).
  virtual void Start() = 0;

  // Stop accepting and tear down open connections. Idempotent.
  virtual void Stop() = 0;

  virtual bool IsRunning() const = 0;

  // "http", ...
  virtual const char *Scheme() const = 0;
};

} // namespace network
} // namespace custody
