// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/tenant.hpp"
#include "util/threadsafe_containers.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace custody {
namespace wallet {

/**
 * RecipientTenantResolver - maps the recipient keys of an inbound message
 * to the tenants that own them
 *
 * Packed envelope:  base64url(protected).recipients[].header.kid
 * Plaintext:        ~routing.recipient_keys[]
 *
 * Candidates keep recipient order, without duplicates. Keys with no route
 * and messages that cannot be read yield no candidates (never throws).
 * Routes may change while exchanges are in flight.
 */
class RecipientTenantResolver : public session::TenantResolver {
public:
  RecipientTenantResolver() = default;

  std::vector<session::TenantId> Resolve(const session::Payload &raw) override;

  // Returns false if an existing route was replaced
  bool AddRoute(const std::string &verkey, const session::TenantId &tenant);
  bool RemoveRoute(const std::string &verkey);
  size_t RouteCount() const { return routes_.Size(); }

  // Recipient keys named by the message, in order (exposed for tests)
  static std::vector<std::string> RecipientKeys(const session::Payload &raw);

private:
  util::ThreadSafeMap<std::string, session::TenantId, std::unordered_map> routes_;
};

} // namespace wallet
} // namespace custody
