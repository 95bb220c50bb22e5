// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>

#include <asio.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>

namespace meshwire {

// Forward declaration for test access
namespace test {
class TcpTransportTestAccess;
}  // namespace test

namespace network {

// TcpConnection - one TCP socket carrying length-prefixed package frames.
// All socket state lives on a strand; the public methods may be called from any thread.
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
  using ConnectCallback = std::function<void(bool success)>;
  using FrameCallback = std::function<void(const std::shared_ptr<TcpConnection>&, const std::vector<uint8_t>&)>;
  using DisconnectCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;

  struct Options {
    size_t max_frame_size{protocol::DEFAULT_TCP_MAX_PACKAGE_SIZE};
    size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_SIZE};
    std::chrono::milliseconds connect_timeout{protocol::DEFAULT_CONNECT_TIMEOUT};
  };

  struct Callbacks {
    FrameCallback on_frame;
    DisconnectCallback on_disconnect;
  };

  // Create outbound connection. Frames sent before the connect completes are
  // queued and flushed once it succeeds; reading starts automatically.
  static std::shared_ptr<TcpConnection> create_outbound(asio::io_context& io_context, const std::string& host,
                                                        uint16_t port, const Options& options, Callbacks callbacks,
                                                        ConnectCallback on_connect);

  // Create inbound connection (already connected socket). Call start() to begin reading.
  static std::shared_ptr<TcpConnection> create_inbound(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                                       const Options& options, Callbacks callbacks);

  ~TcpConnection();

  // Non-copyable, non-movable (connections are not reusable)
  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;
  TcpConnection(TcpConnection&&) = delete;
  TcpConnection& operator=(TcpConnection&&) = delete;

  void start();

  // Queue bytes for writing. Returns false only if the connection is already closed.
  bool send(const std::vector<uint8_t>& data);

  void close();

  // Connected and not closed
  bool is_open() const { return open_; }
  // Closed for good (a connecting socket is neither open nor closed)
  bool is_closed() const { return closed_; }

  bool is_inbound() const { return is_inbound_; }
  uint64_t id() const { return id_; }

  // Dialed endpoint (outbound) or source endpoint (inbound); fixed at creation
  const std::string& remote_address() const { return remote_addr_; }
  uint16_t remote_port() const { return remote_port_; }
  Address remote() const { return Address(remote_addr_, remote_port_); }

private:
  TcpConnection(asio::io_context& io_context, bool is_inbound, const Options& options, Callbacks callbacks);

  void do_connect(ConnectCallback callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void process_frames_impl();
  void do_write_impl();
  void close_impl();
  void deliver_disconnect_once();

  asio::io_context& io_context_;
  asio::ip::tcp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  const bool is_inbound_;
  const uint64_t id_;
  const Options options_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_ after construction)
  FrameCallback frame_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_ = false;

  // Bytes received but not yet assembled into a frame (strand_ only)
  std::vector<uint8_t> recv_buffer_;
  static constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

  // Connect timeout and state. The timer is destroyed in close_impl() so its
  // destructor runs while the io_context is still alive.
  std::unique_ptr<asio::steady_timer> connect_timer_;
  bool connect_done_{false};
  std::shared_ptr<asio::ip::tcp::resolver> resolver_;

  std::atomic<bool> open_{false};
  std::atomic<bool> closed_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// TcpTransport - connection-oriented Transport binding
//
// Uses an external io_context; the owner runs it. Must be owned by a
// shared_ptr (callbacks hold weak references to the transport).
//
// Connection reuse: outbound connections are cached by the dialed Address;
// inbound ones by their ephemeral source Address. A write to a peer prefers
// an open outbound connection, then the inbound connection the peer identity
// table maps to it, and only then dials.
class TcpTransport : public Transport, public std::enable_shared_from_this<TcpTransport> {
public:
  struct Config {
    size_t max_package_size{protocol::DEFAULT_TCP_MAX_PACKAGE_SIZE};
    uint16_t advertised_port{0};  // 0 = listening port
    std::chrono::milliseconds connect_timeout{protocol::DEFAULT_CONNECT_TIMEOUT};
    size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_SIZE};
  };

  // The io_context must outlive this transport. `peers` may be shared with the node
  // (nullptr = private table).
  TcpTransport(asio::io_context& io_context, const Config& config,
               std::shared_ptr<PeerIdentityTable> peers = nullptr);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  // Transport interface
  bool Listen(uint16_t port, PackageCallback callback) override;
  void Send(const Address& recipient, const Package& pkg) override;
  void Stop() override;
  uint16_t listening_port() const override { return listen_port_; }
  uint16_t advertised_port() const override;
  size_t max_package_size() const override { return config_.max_package_size; }
  TransportKind kind() const override { return TransportKind::TCP; }
  PeerIdentityTable& peers() override { return *peers_; }

  size_t inbound_count() const;
  size_t outbound_count() const;

private:
  friend class test::TcpTransportTestAccess;

  void start_accept();
  void start_accept_locked();  // caller holds acceptor_mutex_
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);
  void handle_frame(const TcpConnectionPtr& conn, const std::vector<uint8_t>& body);
  void handle_disconnect(const TcpConnectionPtr& conn);

  TcpConnection::Options connection_options() const;
  TcpConnection::Callbacks connection_callbacks();

  // Find a reusable connection to `recipient` or dial a new one
  TcpConnectionPtr connection_for(const Address& recipient);

  asio::io_context& io_context_;
  const Config config_;
  std::shared_ptr<PeerIdentityTable> peers_;
  std::atomic<bool> running_{true};

  std::mutex acceptor_mutex_;  // guards acceptor_ against Stop() from a non-io thread
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::atomic<uint16_t> listen_port_{0};

  mutable std::mutex mutex_;  // guards callback_ and both connection maps
  PackageCallback callback_;
  std::unordered_map<Address, TcpConnectionPtr> outbound_;  // by dialed address
  std::unordered_map<Address, TcpConnectionPtr> inbound_;   // by ephemeral address
};

}  // namespace network
}  // namespace meshwire
