// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/inbound_transport.hpp"
#include "session/cancel_token.hpp"
#include "session/inbound_handler.hpp"
#include "util/threadpool.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace custody {
namespace network {

// Body limit applied when max_message_size is 0
constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

struct HttpTransportConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8020; // 0 binds an ephemeral port
  size_t io_threads = 1;
  size_t exchange_threads = 8;
  size_t max_pending_exchanges = 0; // 0 = unbounded queue
  size_t max_message_size = 0;      // 0 = DEFAULT_MAX_MESSAGE_SIZE
};

/**
 * HttpInboundTransport - HTTP/1.1 ingress endpoint (Boost.Beast)
 *
 *   POST /   inbound agent message, one exchange per request
 *   GET  /   invitation probe (?c_i=...)
 *
 * Sockets are served by the io threads; exchanges run on a separate worker
 * pool because AwaitResponse() blocks for up to the response timeout. While
 * an exchange runs, its connection watches the socket and cancels the
 * exchange if the peer goes away.
 */
class HttpInboundTransport : public InboundTransport {
public:
  HttpInboundTransport(HttpTransportConfig config,
                       session::InboundMessageHandler &handler);
  ~HttpInboundTransport() override;

  HttpInboundTransport(const HttpInboundTransport &) = delete;
  HttpInboundTransport &operator=(const HttpInboundTransport &) = delete;

  void Start() override;
  void Stop() override;
  bool IsRunning() const override { return running_.load(); }
  const char *Scheme() const override { return "http"; }

  // Bound port (useful with port 0), or 0 when not listening
  uint16_t ListeningPort() const { return listen_port_.load(); }

  size_t MaxMessageSize() const;
  uint64_t ConnectionsAccepted() const { return connections_accepted_.load(); }
  size_t InflightExchanges() const { return inflight_.Size(); }

private:
  friend class HttpConnection;

  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // Run on the exchange pool; false when the pool refused the task
  bool dispatch_exchange(std::function<void()> task);

  // In-flight exchanges are cancelled on Stop()
  uint64_t track_exchange(std::shared_ptr<session::CancelToken> token);
  void untrack_exchange(uint64_t key);

  const HttpTransportConfig config_;
  session::InboundMessageHandler &handler_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> io_threads_;
  std::unique_ptr<util::ThreadPool> exchange_pool_;

  util::ThreadSafeMap<uint64_t, std::shared_ptr<session::CancelToken>> inflight_;
  std::atomic<uint64_t> next_inflight_key_{1};

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> listen_port_{0};
  std::atomic<uint64_t> connections_accepted_{0};
};

} // namespace network
} // namespace custody
