// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/payload.hpp"
#include "util/string_parsing.hpp"

namespace custody {
namespace session {

size_t PayloadSize(const Payload &payload) {
  return std::visit([](const auto &p) { return p.size(); }, payload);
}

std::string_view PayloadView(const Payload &payload) {
  if (const auto *text = std::get_if<std::string>(&payload)) {
    return *text;
  }
  const auto &bytes = std::get<Bytes>(payload);
  return std::string_view(reinterpret_cast<const char *>(bytes.data()),
                          bytes.size());
}

const char *ReplyContentType(const Payload &payload) {
  return IsText(payload) ? content_type::JSON : content_type::AGENT_WIRE;
}

Payload ClassifyBody(std::string_view type_header, std::string body) {
  if (util::MediaType(type_header) == content_type::JSON) {
    return Payload{std::move(body)};
  }
  return Payload{Bytes(body.begin(), body.end())};
}

} // namespace session
} // namespace custody
