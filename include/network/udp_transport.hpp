// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>

#include <asio.hpp>

namespace meshwire {
namespace network {

// UdpTransport - connectionless Transport binding, one package per datagram
//
// The receive socket is bound to the listening port; sends go through a
// separate unbound socket, so peers observe an ephemeral source port and rely
// on the advertised port in package metadata. IPv4 only.
//
// Uses an external io_context; the owner runs it. Must be owned by a shared_ptr.
class UdpTransport : public Transport, public std::enable_shared_from_this<UdpTransport> {
public:
  struct Config {
    size_t max_package_size{protocol::DEFAULT_UDP_MAX_PACKAGE_SIZE};
    uint16_t advertised_port{0};  // 0 = listening port
  };

  UdpTransport(asio::io_context& io_context, const Config& config,
               std::shared_ptr<PeerIdentityTable> peers = nullptr);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  // Transport interface
  bool Listen(uint16_t port, PackageCallback callback) override;
  void Send(const Address& recipient, const Package& pkg) override;
  void Stop() override;
  uint16_t listening_port() const override { return listen_port_; }
  uint16_t advertised_port() const override;
  size_t max_package_size() const override { return config_.max_package_size; }
  TransportKind kind() const override { return TransportKind::UDP; }
  PeerIdentityTable& peers() override { return *peers_; }

private:
  void start_receive();
  void handle_datagram(const asio::ip::udp::endpoint& from, const uint8_t* data, size_t size);
  bool resolve_endpoint(const Address& recipient, asio::ip::udp::endpoint& out);

  asio::io_context& io_context_;
  const Config config_;
  std::shared_ptr<PeerIdentityTable> peers_;
  std::atomic<bool> running_{true};

  // Receive side (io_context threads; one outstanding receive at a time)
  std::unique_ptr<asio::ip::udp::socket> recv_socket_;
  asio::ip::udp::endpoint recv_from_;
  std::vector<uint8_t> recv_buffer_;  // max_package_size + 1 to detect oversized datagrams
  std::atomic<uint16_t> listen_port_{0};

  std::mutex callback_mutex_;
  PackageCallback callback_;

  // Send side
  std::mutex send_mutex_;
  std::unique_ptr<asio::ip::udp::socket> send_socket_;
};

}  // namespace network
}  // namespace meshwire
