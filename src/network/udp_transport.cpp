// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/udp_transport.hpp"

#include "network/errors.hpp"
#include "util/logging.hpp"

namespace meshwire {
namespace network {

UdpTransport::UdpTransport(asio::io_context& io_context, const Config& config,
                           std::shared_ptr<PeerIdentityTable> peers)
    : io_context_(io_context), config_(config),
      peers_(peers ? std::move(peers) : std::make_shared<PeerIdentityTable>()) {}

UdpTransport::~UdpTransport() {
  Stop();
}

uint16_t UdpTransport::advertised_port() const {
  return config_.advertised_port != 0 ? config_.advertised_port : listen_port_.load();
}

bool UdpTransport::Listen(uint16_t port, PackageCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (recv_socket_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  try {
    using udp = asio::ip::udp;
    auto socket = std::make_unique<udp::socket>(io_context_);
    socket->open(udp::v4());
    socket->set_option(udp::socket::reuse_address(true));
    socket->bind(udp::endpoint(udp::v4(), port));

    asio::error_code ec;
    auto ep = socket->local_endpoint(ec);
    listen_port_ = ec ? 0 : ep.port();

    recv_socket_ = std::move(socket);
    recv_buffer_.assign(config_.max_package_size + 1, 0);
    callback_ = std::move(callback);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to listen on udp port {}: {}", port, e.what());
    return false;
  }

  LOG_NET_INFO("udp transport listening on port {}", listen_port_.load());
  start_receive();
  return true;
}

// Caller holds callback_mutex_ or runs on the io thread that owns the receive
void UdpTransport::start_receive() {
  if (!recv_socket_ || !running_)
    return;

  std::weak_ptr<UdpTransport> weak = weak_from_this();
  recv_socket_->async_receive_from(
      asio::buffer(recv_buffer_), recv_from_, [weak](const asio::error_code& ec, size_t bytes) {
        auto self = weak.lock();
        if (!self)
          return;

        if (ec) {
          if (ec == asio::error::operation_aborted || !self->running_)
            return;
          LOG_NET_TRACE("udp receive error: {}", ec.message());
        } else if (bytes > self->config_.max_package_size) {
          LOG_NET_WARN_RL("dropping oversized datagram from {} (limit {})",
                          Address(CanonicalHost(self->recv_from_.address()), self->recv_from_.port()).ToString(),
                          self->config_.max_package_size);
        } else {
          self->handle_datagram(self->recv_from_, self->recv_buffer_.data(), bytes);
        }

        std::lock_guard<std::mutex> lock(self->callback_mutex_);
        self->start_receive();
      });
}

void UdpTransport::handle_datagram(const asio::ip::udp::endpoint& from, const uint8_t* data, size_t size) {
  const Address transport_peer(CanonicalHost(from.address()), from.port());

  Package pkg;
  try {
    pkg = DecodePackage(data, size, config_.max_package_size);
  } catch (const DecodeError& e) {
    LOG_NET_WARN_RL("dropping undecodable datagram from {}: {}", transport_peer.ToString(), e.what());
    return;
  }

  const Address sender = peers_->Resolve(transport_peer, pkg.metadata.advertised_port);
  LOG_NET_TRACE("read {} from {} ({})", pkg.ToString(), sender.ToString(), transport_peer.ToString());

  PackageCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
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

bool UdpTransport::resolve_endpoint(const Address& recipient, asio::ip::udp::endpoint& out) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(recipient.host, ec);
  if (!ec) {
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      ip = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
    }
    if (!ip.is_v4()) {
      LOG_NET_DEBUG("udp transport cannot reach IPv6 address {}", recipient.ToString());
      return false;
    }
    out = asio::ip::udp::endpoint(ip, recipient.port);
    return true;
  }

  asio::ip::udp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(asio::ip::udp::v4(), recipient.host, std::to_string(recipient.port), ec);
  if (ec || endpoints.empty()) {
    LOG_NET_DEBUG("failed to resolve {}: {}", recipient.host, ec ? ec.message() : "no addresses");
    return false;
  }
  out = *endpoints.begin();
  return true;
}

void UdpTransport::Send(const Address& recipient, const Package& pkg) {
  const auto bytes = EncodePackage(pkg, config_.max_package_size);

  if (!running_) {
    LOG_NET_DEBUG("transport stopped, dropping {} to {}", pkg.ToString(), recipient.ToString());
    return;
  }

  asio::ip::udp::endpoint endpoint;
  if (!resolve_endpoint(recipient, endpoint)) {
    LOG_NET_WARN_RL("dropping {}: cannot resolve {}", pkg.ToString(), recipient.ToString());
    return;
  }

  std::lock_guard<std::mutex> lock(send_mutex_);
  asio::error_code ec;
  if (!send_socket_) {
    auto socket = std::make_unique<asio::ip::udp::socket>(io_context_);
    socket->open(asio::ip::udp::v4(), ec);
    if (ec) {
      LOG_NET_ERROR("failed to open udp send socket: {}", ec.message());
      return;
    }
    send_socket_ = std::move(socket);
  }

  send_socket_->send_to(asio::buffer(bytes), endpoint, 0, ec);
  if (ec) {
    LOG_NET_WARN_RL("failed to send {} to {}: {}", pkg.ToString(), recipient.ToString(), ec.message());
    return;
  }
  LOG_NET_TRACE("sent {} ({} bytes) to {}", pkg.ToString(), bytes.size(), recipient.ToString());
}

void UdpTransport::Stop() {
  running_ = false;

  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (recv_socket_) {
      asio::error_code ec;
      recv_socket_->close(ec);
      recv_socket_.reset();
    }
    callback_ = {};
  }
  listen_port_ = 0;

  std::lock_guard<std::mutex> lock(send_mutex_);
  if (send_socket_) {
    asio::error_code ec;
    send_socket_->close(ec);
    send_socket_.reset();
  }
}

}  // namespace network
}  // namespace meshwire
