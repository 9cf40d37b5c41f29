// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace custody {
namespace session {

using Bytes = std::vector<uint8_t>;

// Wire body or reply: opaque bytes, or structured text (JSON).
// Inbound bodies are passed through unmodified in whichever form the
// transport read them.
using Payload = std::variant<Bytes, std::string>;

namespace content_type {
constexpr const char *JSON = "application/json";
constexpr const char *AGENT_WIRE = "application/ssi-agent-wire";
} // namespace content_type

inline bool IsText(const Payload &payload) {
  return std::holds_alternative<std::string>(payload);
}

size_t PayloadSize(const Payload &payload);

// View of the payload's bytes regardless of alternative.
std::string_view PayloadView(const Payload &payload);

// Content type a reply of this runtime type is tagged with
const char *ReplyContentType(const Payload &payload);

/**
 * Interpret an inbound body according to its Content-Type header:
 * application/json (parameters ignored, case-insensitive) is read as text,
 * everything else as opaque bytes.
 */
Payload ClassifyBody(std::string_view type_header, std::string body);

} // namespace session
} // namespace custody
