// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "messaging/plaintext_unpacker.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace custody {
namespace messaging {

using session::DirectResponseMode;

namespace {

std::string StringField(const nlohmann::json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

} // namespace

DirectResponseMode PlaintextUnpacker::ParseReturnRoute(const std::string &value) {
  if (value == "all") {
    return DirectResponseMode::ALL;
  }
  if (value == "thread") {
    return DirectResponseMode::THREAD;
  }
  return DirectResponseMode::NONE;
}

session::ParsedMessage
PlaintextUnpacker::Unpack(const session::Payload &raw,
                          const session::ProcessingContext &context) {
  std::string_view text = session::PayloadView(raw);
  if (text.empty()) {
    throw MessageParseError("empty message");
  }

  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    throw MessageParseError("message is not valid JSON");
  }
  if (!doc.is_object()) {
    throw MessageParseError("message must be a JSON object");
  }
  if (doc.contains("protected") && doc.contains("ciphertext")) {
    throw MessageParseError("packed envelopes are not supported");
  }

  session::ParsedMessage message;
  session::MessageReceipt &receipt = message.receipt;
  receipt.message_type = StringField(doc, "@type");
  if (receipt.message_type.empty()) {
    throw MessageParseError("message has no @type");
  }
  receipt.message_id = StringField(doc, "@id");

  receipt.thread_id = receipt.message_id;
  auto thread = doc.find("~thread");
  if (thread != doc.end() && thread->is_object()) {
    std::string thid = StringField(*thread, "thid");
    if (!thid.empty()) {
      receipt.thread_id = std::move(thid);
    }
  }

  auto transport = doc.find("~transport");
  if (transport != doc.end() && transport->is_object()) {
    receipt.direct_response_mode =
        ParseReturnRoute(StringField(*transport, "return_route"));
    if (receipt.direct_response_mode == DirectResponseMode::THREAD) {
      receipt.direct_response_thread = StringField(*transport, "return_route_thread");
      if (receipt.direct_response_thread.empty()) {
        receipt.direct_response_thread = receipt.thread_id;
      }
    }
  }
  receipt.direct_response_requested =
      receipt.direct_response_mode != DirectResponseMode::NONE;

  auto routing = doc.find("~routing");
  if (routing != doc.end() && routing->is_object()) {
    auto keys = routing->find("recipient_keys");
    if (keys != routing->end() && keys->is_array() && !keys->empty() &&
        keys->front().is_string()) {
      receipt.recipient_verkey = keys->front().get<std::string>();
    }
  }

  receipt.tenant_scope = context.Scope();
  receipt.received_at = util::GetSystemTime();
  message.body = std::move(doc);

  LOG_TRACE("Unpacked {} (id={}, {} bytes)", receipt.message_type,
            receipt.message_id, text.size());
  return message;
}

} // namespace messaging
} // namespace custody
