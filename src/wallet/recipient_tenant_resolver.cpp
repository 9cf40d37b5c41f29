// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/recipient_tenant_resolver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace custody {
namespace wallet {

namespace {

void CollectKids(const nlohmann::json &recipients, std::vector<std::string> &out) {
  if (!recipients.is_array()) {
    return;
  }
  for (const auto &recipient : recipients) {
    if (!recipient.is_object()) {
      continue;
    }
    auto header = recipient.find("header");
    if (header == recipient.end() || !header->is_object()) {
      continue;
    }
    auto kid = header->find("kid");
    if (kid != header->end() && kid->is_string()) {
      out.push_back(kid->get<std::string>());
    }
  }
}

} // namespace

std::vector<std::string>
RecipientTenantResolver::RecipientKeys(const session::Payload &raw) {
  std::vector<std::string> keys;

  nlohmann::json doc = nlohmann::json::parse(session::PayloadView(raw), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return keys;
  }

  auto prot = doc.find("protected");
  if (prot != doc.end() && prot->is_string()) {
    auto decoded = util::Base64UrlDecode(prot->get<std::string>());
    if (!decoded) {
      LOG_TENANT_DEBUG("protected header is not valid base64url");
      return keys;
    }
    nlohmann::json header =
        nlohmann::json::parse(decoded->begin(), decoded->end(), nullptr, false);
    if (header.is_discarded() || !header.is_object()) {
      return keys;
    }
    auto recipients = header.find("recipients");
    if (recipients != header.end()) {
      CollectKids(*recipients, keys);
    }
    return keys;
  }

  auto routing = doc.find("~routing");
  if (routing != doc.end() && routing->is_object()) {
    auto list = routing->find("recipient_keys");
    if (list != routing->end() && list->is_array()) {
      for (const auto &key : *list) {
        if (key.is_string()) {
          keys.push_back(key.get<std::string>());
        }
      }
    }
  }
  return keys;
}

std::vector<session::TenantId>
RecipientTenantResolver::Resolve(const session::Payload &raw) {
  std::vector<session::TenantId> tenants;
  for (const auto &verkey : RecipientKeys(raw)) {
    auto tenant = routes_.Get(verkey);
    if (!tenant) {
      LOG_TENANT_TRACE("no route for recipient {}", verkey);
      continue;
    }
    if (std::find(tenants.begin(), tenants.end(), *tenant) == tenants.end()) {
      tenants.push_back(std::move(*tenant));
    }
  }
  LOG_TENANT_DEBUG("resolved {} candidate tenant(s)", tenants.size());
  return tenants;
}

bool RecipientTenantResolver::AddRoute(const std::string &verkey,
                                       const session::TenantId &tenant) {
  bool added = routes_.Insert(verkey, tenant);
  LOG_TENANT_DEBUG("route {} -> {}{}", verkey, tenant, added ? "" : " (replaced)");
  return added;
}

bool RecipientTenantResolver::RemoveRoute(const std::string &verkey) {
  return routes_.Erase(verkey);
}

} // namespace wallet
} // namespace custody
