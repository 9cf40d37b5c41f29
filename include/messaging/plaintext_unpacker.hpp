// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/message.hpp"

namespace custody {
namespace messaging {

/**
 * PlaintextUnpacker - MessageUnpacker for plaintext DIDComm v1 JSON
 *
 * Reads the decorators the ingress path cares about:
 *   @id, @type, ~thread.thid, ~transport.return_route
 *
 * Packed (encrypted) envelopes are rejected with MessageParseError; this
 * node carries no key material for them.
 */
class PlaintextUnpacker : public session::MessageUnpacker {
public:
  session::ParsedMessage Unpack(const session::Payload &raw,
                                const session::ProcessingContext &context) override;

  // "none" | "all" | "thread"; anything else maps to NONE
  static session::DirectResponseMode ParseReturnRoute(const std::string &value);
};

} // namespace messaging
} // namespace custody
