// Copyright (c) 2025 The Unicity Foundation
// HTTP ingress endpoint using Boost.Beast over boost::asio

#include "network/http_transport.hpp"
#include "session/context.hpp"
#include "session/errors.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <optional>

namespace custody {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// Header allowance on top of the body limit when buffering a pipelined request
constexpr size_t MAX_PIPELINED_HEADER_BYTES = 16 * 1024;

session::InboundResponse PlainResponse(unsigned status, const std::string &reason) {
  session::InboundResponse response;
  response.status = status;
  response.content_type = "text/plain; charset=utf-8";
  response.body = std::to_string(status) + ": " + reason;
  return response;
}

} // namespace

// ============================================================================
// HttpConnection
// ============================================================================

/**
 * HttpConnection - one accepted socket, served request by request
 *
 * All socket work happens on the connection strand. At most one exchange
 * is in flight per connection; the next request is read only after its
 * response has been written.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
  HttpConnection(HttpInboundTransport &transport, tcp::socket socket)
      : transport_(transport), socket_(std::move(socket)),
        strand_(socket_.get_executor()) {
    boost::system::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) {
      remote_ = ep.address().to_string();
      remote_port_ = ep.port();
    }
  }

  void start() {
    boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->do_read(); });
  }

private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(transport_.MaxMessageSize());
    http::async_read(socket_, buffer_, *parser_,
                     boost::asio::bind_executor(
                         strand_, [self = shared_from_this()](beast::error_code ec, size_t) {
                           self->on_read(ec);
                         }));
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      do_close();
      return;
    }
    if (ec == http::error::body_limit) {
      LOG_NET_DEBUG("request from {} exceeds {} bytes", remote_,
                    transport_.MaxMessageSize());
      keep_alive_ = false;
      write_response(PlainResponse(413, "Request Entity Too Large"));
      return;
    }
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        LOG_NET_TRACE("read error from {}:{}: {}", remote_, remote_port_, ec.message());
      }
      do_close();
      return;
    }
    handle_request(parser_->release());
  }

  void handle_request(http::request<http::string_body> req) {
    version_ = req.version();
    keep_alive_ = req.keep_alive();

    std::string target(req.target());
    auto qpos = target.find('?');
    std::string path = target.substr(0, qpos);
    std::string query = qpos == std::string::npos ? "" : target.substr(qpos + 1);

    if (path != "/") {
      write_response(PlainResponse(404, "Not Found"));
      return;
    }

    switch (req.method()) {
    case http::verb::get:
      write_response(transport_.handler_.HandleInvitation(query));
      return;
    case http::verb::post:
      begin_exchange(req);
      return;
    default:
      write_response(PlainResponse(405, "Method Not Allowed"));
      return;
    }
  }

  void begin_exchange(http::request<http::string_body> &req) {
    session::InboundRequest request;
    request.content_type = std::string(req[http::field::content_type]);
    request.body = std::move(req.body());
    request.peer.host = std::string(req[http::field::host]);
    request.peer.remote = remote_;

    cancel_ = session::CancelToken::Create();
    request.cancel = cancel_;
    inflight_key_ = transport_.track_exchange(cancel_);
    exchange_active_ = true;

    auto self = shared_from_this();
    bool accepted = transport_.dispatch_exchange(
        [self, request = std::move(request)]() mutable {
          session::InboundResponse response;
          try {
            response = self->transport_.handler_.HandleMessage(std::move(request));
          } catch (const std::exception &e) {
            LOG_NET_ERROR("exchange from {} failed: {}", self->remote_, e.what());
            response = PlainResponse(500, "Internal Server Error");
          }
          boost::asio::post(self->strand_, [self, response = std::move(response)]() mutable {
            self->finish_exchange(std::move(response));
          });
        });

    if (!accepted) {
      LOG_NET_WARN("exchange pool saturated, rejecting request from {}", remote_);
      exchange_active_ = false;
      transport_.untrack_exchange(inflight_key_);
      cancel_.reset();
      write_response(PlainResponse(503, "Service Unavailable"));
      return;
    }

    watch_socket();
  }

  // Readable while no read is pending means EOF, a reset, or pipelined data.
  // Pipelined bytes are moved into buffer_, where the next do_read() parses
  // them, and the wait is re-armed so a later disconnect is still seen.
  void watch_socket() {
    socket_.async_wait(tcp::socket::wait_read,
                       boost::asio::bind_executor(
                           strand_, [self = shared_from_this()](beast::error_code ec) {
                             self->on_watch(ec);
                           }));
  }

  void on_watch(beast::error_code ec) {
    if (!exchange_active_ || ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (!ec) {
      size_t n = socket_.available(ec);
      if (!ec && n == 0) {
        ec = boost::asio::error::eof;
      } else if (!ec) {
        if (buffer_.size() + n > MaxPipelinedBytes()) {
          // Enough of the next request is buffered; stop watching until it is read
          LOG_NET_TRACE("peer {}:{} pipelined {} bytes, no longer watching",
                        remote_, remote_port_, buffer_.size() + n);
          return;
        }
        n = socket_.read_some(buffer_.prepare(n), ec);
        if (!ec) {
          buffer_.commit(n);
          watch_socket();
          return;
        }
      }
    }
    LOG_NET_DEBUG("peer {}:{} went away during exchange ({})", remote_,
                  remote_port_, ec.message());
    if (cancel_) {
      cancel_->Cancel();
    }
  }

  size_t MaxPipelinedBytes() const {
    return transport_.MaxMessageSize() + MAX_PIPELINED_HEADER_BYTES;
  }

  void finish_exchange(session::InboundResponse response) {
    exchange_active_ = false;
    transport_.untrack_exchange(inflight_key_);
    boost::system::error_code ignored;
    socket_.cancel(ignored); // ends watch_socket()

    bool cancelled = cancel_ && cancel_->IsCancelled();
    cancel_.reset();
    if (cancelled) {
      do_close();
      return;
    }
    write_response(std::move(response));
  }

  void write_response(session::InboundResponse response) {
    auto res = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(response.status), version_);
    res->set(http::field::server, GetServerString());
    if (!response.content_type.empty()) {
      res->set(http::field::content_type, response.content_type);
    }
    if (response.status == 405) {
      res->set(http::field::allow, "GET, POST");
    }
    res->keep_alive(keep_alive_);
    res->body() = std::move(response.body);
    res->prepare_payload();

    http::async_write(socket_, *res,
                      boost::asio::bind_executor(
                          strand_, [self = shared_from_this(), res](beast::error_code ec, size_t) {
                            if (ec) {
                              LOG_NET_TRACE("write error to {}: {}", self->remote_, ec.message());
                              self->do_close();
                              return;
                            }
                            if (res->need_eof()) {
                              self->do_close();
                              return;
                            }
                            self->do_read();
                          }));
  }

  void do_close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  HttpInboundTransport &transport_;
  tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;

  std::string remote_;
  uint16_t remote_port_ = 0;
  unsigned version_ = 11;
  bool keep_alive_ = true;

  std::shared_ptr<session::CancelToken> cancel_;
  uint64_t inflight_key_ = 0;
  bool exchange_active_ = false;
};

// ============================================================================
// HttpInboundTransport
// ============================================================================

HttpInboundTransport::HttpInboundTransport(HttpTransportConfig config,
                                           session::InboundMessageHandler &handler)
    : config_(std::move(config)), handler_(handler) {}

HttpInboundTransport::~HttpInboundTransport() { Stop(); }

size_t HttpInboundTransport::MaxMessageSize() const {
  return config_.max_message_size ? config_.max_message_size
                                  : DEFAULT_MAX_MESSAGE_SIZE;
}

void HttpInboundTransport::Start() {
  if (running_) {
    LOG_NET_TRACE("http transport already running");
    return;
  }

  if (config_.exchange_threads == 0 ||
      config_.exchange_threads > session::MAX_EXCHANGE_THREADS) {
    throw TransportSetupError("exchange_threads must be in 1.." +
                              std::to_string(session::MAX_EXCHANGE_THREADS));
  }

  io_context_ = std::make_unique<boost::asio::io_context>();
  try {
    tcp::resolver resolver(*io_context_);
    auto results = resolver.resolve(config_.host, std::to_string(config_.port),
                                    tcp::resolver::passive);
    tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    listen_port_ = acceptor_->local_endpoint().port();
  } catch (const boost::system::system_error &e) {
    acceptor_.reset();
    io_context_.reset();
    throw TransportSetupError("Unable to start webserver with host '" + config_.host +
                              "' and port '" + std::to_string(config_.port) +
                              "': " + e.what());
  }

  exchange_pool_ = std::make_unique<util::ThreadPool>(
      config_.exchange_threads, config_.max_pending_exchanges, "exchange");

  running_ = true;
  start_accept();

  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  size_t threads = config_.io_threads ? config_.io_threads : 1;
  for (size_t i = 0; i < threads; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }

  LOG_NET_INFO("Listening on http://{}:{} ({} exchange workers, body limit {} bytes)",
               config_.host, listen_port_.load(), exchange_pool_->size(),
               MaxMessageSize());
}

void HttpInboundTransport::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }

  // Waiting exchanges see a cancellation, not the full response timeout
  for (uint64_t key : inflight_.GetKeys()) {
    auto token = inflight_.Get(key);
    if (token && *token) {
      (*token)->Cancel();
    }
  }

  if (exchange_pool_) {
    exchange_pool_->shutdown();
    exchange_pool_->wait_for_completion();
  }

  work_guard_.reset();
  io_context_->stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  acceptor_.reset();
  exchange_pool_.reset();
  io_context_.reset();
  inflight_.Clear();
  listen_port_ = 0;
  LOG_NET_INFO("http transport stopped");
}

void HttpInboundTransport::start_accept() {
  if (!running_ || !acceptor_) {
    return;
  }
  acceptor_->async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        handle_accept(ec, std::move(socket));
      });
}

void HttpInboundTransport::handle_accept(const boost::system::error_code &ec,
                                         tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    LOG_NET_TRACE("accept error: {}", ec.message());
  } else {
    connections_accepted_.fetch_add(1);
    std::make_shared<HttpConnection>(*this, std::move(socket))->start();
  }
  start_accept();
}

bool HttpInboundTransport::dispatch_exchange(std::function<void()> task) {
  if (!running_ || !exchange_pool_) {
    return false;
  }
  return exchange_pool_->TryPost(std::move(task));
}

uint64_t HttpInboundTransport::track_exchange(std::shared_ptr<session::CancelToken> token) {
  uint64_t key = next_inflight_key_.fetch_add(1);
  inflight_.Insert(key, std::move(token));
  return key;
}

void HttpInboundTransport::untrack_exchange(uint64_t key) { inflight_.Erase(key); }

} // namespace network
} // namespace custody
