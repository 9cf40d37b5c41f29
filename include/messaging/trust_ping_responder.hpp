// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/message.hpp"
#include "session/response_correlator.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace custody {
namespace messaging {

/**
 * TrustPingResponder - InboundMessageRouter answering trust pings
 *
 * Replies are produced on the responder's own worker pool and handed back
 * through the ResponseCorrelator, like any asynchronous dispatcher would.
 * A ping gets a ping_response when it asks for one (response_requested is
 * absent or true) and the exchange requested a direct response. Every
 * other message is logged and dropped.
 */
class TrustPingResponder : public session::InboundMessageRouter {
public:
  TrustPingResponder(session::ResponseCorrelator &correlator,
                     size_t num_threads = 1);
  ~TrustPingResponder() override;

  void Route(const session::ParsedMessage &message,
             const session::ReplyTarget &target) override;

  // Stop accepting messages and finish queued replies. Idempotent.
  void Stop();

  uint64_t PingsReceived() const { return pings_received_.load(); }
  uint64_t ResponsesDelivered() const { return responses_delivered_.load(); }
  uint64_t MessagesDropped() const { return messages_dropped_.load(); }

  static bool IsTrustPing(const std::string &message_type);

  // ping_response answering `ping` (JSON text)
  static std::string BuildPingResponse(const session::ParsedMessage &ping);

private:
  session::ResponseCorrelator &correlator_;
  util::ThreadPool pool_;
  std::atomic<bool> stopped_{false};

  std::atomic<uint64_t> pings_received_{0};
  std::atomic<uint64_t> responses_delivered_{0};
  std::atomic<uint64_t> messages_dropped_{0};
};

} // namespace messaging
} // namespace custody
