// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_transport.hpp"

#include "network/errors.hpp"
#include "util/logging.hpp"

#include <cassert>

namespace meshwire {
namespace network {

// ============================================================================
// TcpConnection
// ============================================================================

std::atomic<uint64_t> TcpConnection::next_id_{1};

TcpConnectionPtr TcpConnection::create_outbound(asio::io_context& io_context, const std::string& host, uint16_t port,
                                                const Options& options, Callbacks callbacks,
                                                ConnectCallback on_connect) {
  auto conn = TcpConnectionPtr(new TcpConnection(io_context, false, options, std::move(callbacks)));
  conn->remote_addr_ = host;
  conn->remote_port_ = port;
  // Defer do_connect onto the strand so shared_from_this() is safe
  asio::post(conn->strand_, [conn, cb = std::move(on_connect)]() mutable { conn->do_connect(std::move(cb)); });
  return conn;
}

TcpConnectionPtr TcpConnection::create_inbound(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                               const Options& options, Callbacks callbacks) {
  auto conn = TcpConnectionPtr(new TcpConnection(io_context, true, options, std::move(callbacks)));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  asio::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = CanonicalHost(remote_ep.address());
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
  return conn;
}

TcpConnection::TcpConnection(asio::io_context& io_context, bool is_inbound, const Options& options,
                             Callbacks callbacks)
    : io_context_(io_context), socket_(io_context), strand_(io_context.get_executor()), is_inbound_(is_inbound),
      id_(next_id_++), options_(options), frame_callback_(std::move(callbacks.on_frame)),
      disconnect_callback_(std::move(callbacks.on_disconnect)),
      connect_timer_(std::make_unique<asio::steady_timer>(io_context)) {}

TcpConnection::~TcpConnection() {}

void TcpConnection::do_connect(ConnectCallback callback) {
  if (closed_)
    return;

  auto finish = [this](bool ok, const ConnectCallback& cb) {
    connect_done_ = true;
    if (connect_timer_)
      (void)connect_timer_->cancel();
    if (cb) {
      try {
        cb(ok);
      } catch (const std::exception& e) {
        LOG_NET_TRACE("exception in connect callback for {}:{}: {}", remote_addr_, remote_port_, e.what());
      }
    }
  };

  auto timeout = options_.connect_timeout;
  if (timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(timeout);
    auto timeout_handler = [this, self = shared_from_this(), callback, finish](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || connect_done_) {
        return;
      }
      LOG_NET_DEBUG("connect timeout to {}:{}", remote_addr_, remote_port_);
      if (resolver_)
        resolver_->cancel();
      asio::error_code ignored;
      socket_.cancel(ignored);
      finish(false, callback);
      deliver_disconnect_once();
      close_impl();
    };
    connect_timer_->async_wait(asio::bind_executor(strand_, timeout_handler));
  }

  resolver_ = std::make_shared<asio::ip::tcp::resolver>(io_context_);

  auto resolve_handler = [this, self = shared_from_this(), callback, finish](
                             const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (connect_done_ || closed_)
      return;

    if (ec) {
      LOG_NET_DEBUG("failed to resolve {}: {}", remote_addr_, ec.message());
      finish(false, callback);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    auto connect_handler = [this, self, callback, finish](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
      if (connect_done_ || closed_)
        return;

      if (ec) {
        LOG_NET_DEBUG("failed to connect to {}:{}: {}", remote_addr_, remote_port_, ec.message());
        finish(false, callback);
        deliver_disconnect_once();
        close_impl();
        return;
      }

      open_ = true;

      // Best-effort socket options
      asio::error_code opt_ec;
      socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);
      socket_.set_option(asio::socket_base::keep_alive(true), opt_ec);

      finish(true, callback);
      if (!open_)
        return;

      start_read_impl();

      // Flush frames queued while connecting
      if (!send_queue_.empty() && !writing_) {
        writing_ = true;
        do_write_impl();
      }
    };

    asio::async_connect(socket_, results, asio::bind_executor(strand_, connect_handler));
  };

  resolver_->async_resolve(remote_addr_, std::to_string(remote_port_), asio::bind_executor(strand_, resolve_handler));
}

void TcpConnection::start() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void TcpConnection::start_read_impl() {
  if (!open_)
    return;

  assert(strand_.running_in_this_thread());

  auto buf = std::make_shared<std::vector<uint8_t>>(READ_CHUNK_SIZE);

  auto read_handler = [this, self = shared_from_this(), buf](const asio::error_code& ec, size_t bytes_transferred) {
    if (!open_) {
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_, ec.message());
      }
      deliver_disconnect_once();
      close_impl();
      return;
    }

    recv_buffer_.insert(recv_buffer_.end(), buf->begin(), buf->begin() + bytes_transferred);
    process_frames_impl();

    // A frame callback or a framing violation may have closed us
    if (!open_)
      return;

    start_read_impl();
  };

  socket_.async_read_some(asio::buffer(*buf), asio::bind_executor(strand_, read_handler));
}

void TcpConnection::process_frames_impl() {
  assert(strand_.running_in_this_thread());

  size_t offset = 0;
  while (open_) {
    const size_t available = recv_buffer_.size() - offset;
    if (available < protocol::FRAME_HEADER_SIZE)
      break;

    const uint32_t length = ReadFrameLength(recv_buffer_.data() + offset);
    if (length == 0 || length > options_.max_frame_size) {
      LOG_NET_WARN_RL("invalid frame length {} from {}:{} (limit {}), closing connection", length, remote_addr_,
                      remote_port_, options_.max_frame_size);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    if (available - protocol::FRAME_HEADER_SIZE < length)
      break;

    const auto body_begin = recv_buffer_.begin() + static_cast<std::ptrdiff_t>(offset + protocol::FRAME_HEADER_SIZE);
    std::vector<uint8_t> body(body_begin, body_begin + length);
    offset += protocol::FRAME_HEADER_SIZE + length;

    if (frame_callback_) {
      FrameCallback saved_frame_cb = frame_callback_;
      try {
        saved_frame_cb(shared_from_this(), body);
      } catch (const std::exception& e) {
        LOG_NET_ERROR_RL("exception in frame callback from {}:{}: {}", remote_addr_, remote_port_, e.what());
      }
    }
  }

  if (!open_)
    return;  // close_impl() already released the buffer

  recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
}

// Returns false only if the connection is already closed at call time. Queue
// overflow is detected on the strand and closes the connection; the caller
// learns of that through the disconnect callback.
bool TcpConnection::send(const std::vector<uint8_t>& data) {
  if (closed_)
    return false;

  // Copy before posting: the caller may release its buffer immediately
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (closed_)
      return;

    if (send_queue_bytes_ + payload->size() > options_.send_queue_limit) {
      LOG_NET_WARN_RL("send queue overflow to {}:{} ({} + {} bytes > {}), disconnecting", remote_addr_, remote_port_,
                      send_queue_bytes_, payload->size(), options_.send_queue_limit);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    // While connecting the queue is flushed by the connect handler
    if (open_ && !writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void TcpConnection::do_write_impl() {
  if (!open_)
    return;

  assert(strand_.running_in_this_thread());

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  auto write_handler = [this, self = shared_from_this(), data_ptr](const asio::error_code& ec, size_t) {
    if (!open_)
      return;

    if (ec) {
      LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_, ec.message());
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_bytes_ -= data_ptr->size();
    send_queue_.pop();

    if (!send_queue_.empty()) {
      do_write_impl();
    } else {
      writing_ = false;
    }
  };

  asio::async_write(socket_, asio::buffer(*data_ptr), asio::bind_executor(strand_, write_handler));
}

void TcpConnection::deliver_disconnect_once() {
  assert(strand_.running_in_this_thread());

  if (disconnect_delivered_)
    return;
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering the strand
    asio::post(io_context_, [cb = std::move(saved_disconnect_cb), self = shared_from_this()]() {
      try {
        cb(self);
      } catch (const std::exception& e) {
        LOG_NET_TRACE("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void TcpConnection::close() {
  asio::dispatch(strand_, [this, self = shared_from_this()]() { close_impl(); });
}

void TcpConnection::close_impl() {
  assert(strand_.running_in_this_thread());

  if (closed_.exchange(true))
    return;
  open_ = false;

  // Cancel outstanding I/O: pending handlers complete with operation_aborted
  // and release their shared_ptr to us.
  {
    asio::ip::tcp::socket socket_to_cancel(std::move(socket_));
    asio::error_code cancel_ec;
    socket_to_cancel.cancel(cancel_ec);
  }

  frame_callback_ = {};
  disconnect_callback_ = {};

  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }

  resolver_.reset();

  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_ = false;
  recv_buffer_.clear();
  recv_buffer_.shrink_to_fit();
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(asio::io_context& io_context, const Config& config,
                           std::shared_ptr<PeerIdentityTable> peers)
    : io_context_(io_context), config_(config),
      peers_(peers ? std::move(peers) : std::make_shared<PeerIdentityTable>()) {}

TcpTransport::~TcpTransport() {
  Stop();
}

uint16_t TcpTransport::advertised_port() const {
  return config_.advertised_port != 0 ? config_.advertised_port : listen_port_.load();
}

TcpConnection::Options TcpTransport::connection_options() const {
  TcpConnection::Options options;
  options.max_frame_size = config_.max_package_size;
  options.send_queue_limit = config_.send_queue_limit;
  options.connect_timeout = config_.connect_timeout;
  return options;
}

TcpConnection::Callbacks TcpTransport::connection_callbacks() {
  std::weak_ptr<TcpTransport> weak = weak_from_this();
  TcpConnection::Callbacks callbacks;
  callbacks.on_frame = [weak](const TcpConnectionPtr& conn, const std::vector<uint8_t>& body) {
    if (auto self = weak.lock())
      self->handle_frame(conn, body);
  };
  callbacks.on_disconnect = [weak](const TcpConnectionPtr& conn) {
    if (auto self = weak.lock())
      self->handle_disconnect(conn);
  };
  return callbacks;
}

bool TcpTransport::Listen(uint16_t port, PackageCallback callback) {
  std::lock_guard<std::mutex> acceptor_lock(acceptor_mutex_);
  if (acceptor_ || !running_) {
    LOG_NET_TRACE("already listening or stopped");
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
  }

  try {
    using tcp = asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    } catch (const std::exception&) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    }

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listen_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("tcp transport listening on port {}", listen_port_.load());
    start_accept_locked();
    return true;
  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to listen on tcp port {}: {}", port, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void TcpTransport::start_accept() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  start_accept_locked();
}

void TcpTransport::start_accept_locked() {
  // Stop() may have closed the acceptor while an accept handler was running
  if (!acceptor_ || !running_)
    return;

  std::weak_ptr<TcpTransport> weak = weak_from_this();
  acceptor_->async_accept([weak](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (auto self = weak.lock())
      self->handle_accept(ec, std::move(socket));
  });
}

void TcpTransport::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != asio::error::operation_aborted && running_) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  asio::error_code opt_ec;
  socket.set_option(asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(asio::socket_base::keep_alive(true), opt_ec);

  auto conn = TcpConnection::create_inbound(io_context_, std::move(socket), connection_options(),
                                            connection_callbacks());
  LOG_NET_DEBUG("connection from {} accepted", conn->remote().ToString());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      conn->close();
      return;
    }
    inbound_[conn->remote()] = conn;
  }
  conn->start();

  start_accept();
}

void TcpTransport::handle_frame(const TcpConnectionPtr& conn, const std::vector<uint8_t>& body) {
  Package pkg;
  try {
    pkg = DecodePackage(body.data(), body.size(), config_.max_package_size);
  } catch (const DecodeError& e) {
    LOG_NET_WARN_RL("undecodable package from {}, closing connection: {}", conn->remote().ToString(), e.what());
    conn->close();
    return;
  }

  // Inbound peers reach us from an ephemeral port: record the nym pair. An
  // outbound connection already points at the peer's listening endpoint.
  const Address sender = conn->is_inbound() ? peers_->Resolve(conn->remote(), pkg.metadata.advertised_port)
                                            : Address(conn->remote_address(), pkg.metadata.advertised_port);

  LOG_NET_TRACE("read {} from {} ({})", pkg.ToString(), sender.ToString(), conn->remote().ToString());

  PackageCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = callback_;
  }
  if (!callback)
    return;

  std::optional<Message> reply;
  try {
    reply = callback(pkg, sender);
  } catch (const std::exception& e) {
    LOG_NET_ERROR_RL("package callback failed for {}: {}", pkg.ToString(), e.what());
    return;
  }

  if (!reply)
    return;
  if (!pkg.metadata.session_id) {
    LOG_NET_DEBUG("not replying to uncorrelated {}", pkg.ToString());
    return;
  }

  try {
    Send(sender, MakeReplyPackage(pkg, *reply, advertised_port()));
  } catch (const NetworkError& e) {
    LOG_NET_WARN_RL("failed to reply to {}: {}", sender.ToString(), e.what());
  }
}

void TcpTransport::handle_disconnect(const TcpConnectionPtr& conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& table = conn->is_inbound() ? inbound_ : outbound_;
  auto it = table.find(conn->remote());
  if (it != table.end() && it->second == conn) {
    table.erase(it);
    LOG_NET_DEBUG("{} connection to {} closed", conn->is_inbound() ? "inbound" : "outbound",
                  conn->remote().ToString());
    // The ephemeral nym dies with its connection
    if (conn->is_inbound())
      peers_->RemoveEphemeral(conn->remote());
  }
}

TcpConnectionPtr TcpTransport::connection_for(const Address& recipient) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto out = outbound_.find(recipient);
  if (out != outbound_.end()) {
    if (!out->second->is_closed())
      return out->second;
    outbound_.erase(out);
  }

  if (auto ephemeral = peers_->EphemeralFor(recipient)) {
    auto in = inbound_.find(*ephemeral);
    if (in != inbound_.end() && !in->second->is_closed())
      return in->second;
  }

  auto conn = TcpConnection::create_outbound(
      io_context_, recipient.host, recipient.port, connection_options(), connection_callbacks(),
      [recipient](bool ok) {
        if (ok) {
          LOG_NET_DEBUG("connected to {}", recipient.ToString());
        } else {
          LOG_NET_DEBUG("could not connect to {}", recipient.ToString());
        }
      });
  outbound_[recipient] = conn;
  return conn;
}

void TcpTransport::Send(const Address& recipient, const Package& pkg) {
  const auto frame = EncodeFrame(EncodePackage(pkg, config_.max_package_size));

  if (!running_) {
    LOG_NET_DEBUG("transport stopped, dropping {} to {}", pkg.ToString(), recipient.ToString());
    return;
  }

  auto conn = connection_for(recipient);
  if (!conn->send(frame)) {
    // Closed between lookup and send: dial once more
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = outbound_.find(recipient);
      if (it != outbound_.end() && it->second == conn)
        outbound_.erase(it);
    }
    conn = connection_for(recipient);
    if (!conn->send(frame)) {
      LOG_NET_WARN_RL("could not queue {} to {}", pkg.ToString(), recipient.ToString());
      return;
    }
  }
  LOG_NET_TRACE("sent {} to {}", pkg.ToString(), recipient.ToString());
}

size_t TcpTransport::inbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inbound_.size();
}

size_t TcpTransport::outbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outbound_.size();
}

void TcpTransport::Stop() {
  {
    std::lock_guard<std::mutex> acceptor_lock(acceptor_mutex_);
    running_ = false;
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    listen_port_ = 0;
  }

  std::unordered_map<Address, TcpConnectionPtr> inbound;
  std::unordered_map<Address, TcpConnectionPtr> outbound;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound.swap(inbound_);
    outbound.swap(outbound_);
    callback_ = {};
  }
  for (auto& [addr, conn] : inbound)
    conn->close();
  for (auto& [addr, conn] : outbound)
    conn->close();
}

}  // namespace network
}  // namespace meshwire
