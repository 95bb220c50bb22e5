// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/message.hpp"
#include "network/peer_identity.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>

namespace meshwire {
namespace network {

enum class TransportKind { TCP, UDP };

const char* TransportKindName(TransportKind kind);

// Inbound package handler. `sender` is the remapped (advertised) address.
// A returned Message is sent back to `sender` in the same session.
using PackageCallback = std::function<std::optional<Message>(const Package& pkg, const Address& sender)>;

/**
 * Transport - framed package delivery over one channel kind
 *
 * Bindings: TcpTransport (connection-oriented, length-prefixed frames) and
 * UdpTransport (one package per datagram). Both enforce the same maximum
 * compressed package size on send and receive, remap senders through the
 * shared PeerIdentityTable, and never let a bad frame stop the receive loop.
 *
 * Callbacks run on io_context threads. They must return promptly: slow work
 * belongs on another executor.
 */
class Transport {
public:
  virtual ~Transport() = default;

  // Bind `port` (0 = ephemeral) and start receiving. Returns false if binding fails
  // or the transport is already listening.
  virtual bool Listen(uint16_t port, PackageCallback callback) = 0;

  // Encode, check the size limit and write to the peer's channel.
  // Throws PackageTooLargeError (nothing is written) or NetworkError if the
  // package cannot be encoded. Delivery failures are logged, not raised.
  virtual void Send(const Address& recipient, const Package& pkg) = 0;

  // Close the listener and all channels. Idempotent.
  virtual void Stop() = 0;

  // Bound listening port (0 if not listening)
  virtual uint16_t listening_port() const = 0;

  // Port stamped into reply packages (configured override, else listening port)
  virtual uint16_t advertised_port() const = 0;

  virtual size_t max_package_size() const = 0;
  virtual TransportKind kind() const = 0;
  virtual PeerIdentityTable& peers() = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

// Largest envelope a receiver with this package limit will inflate
size_t MaxInflatedSize(size_t max_package_size);

// Serialize + compress, enforcing the limit on both the compressed size and
// the inflated envelope size. Throws PackageTooLargeError.
std::vector<uint8_t> EncodePackage(const Package& pkg, size_t max_package_size);

// Inverse of EncodePackage. Oversized input and bad contents throw DecodeError.
Package DecodePackage(const uint8_t* data, size_t size, size_t max_package_size);

// Prefix `body` with its length (uint32 big-endian)
std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& body);

// Read the length from a frame header of protocol::FRAME_HEADER_SIZE bytes
uint32_t ReadFrameLength(const uint8_t* header);

// Response to `request` carrying `reply`, tagged with the same session id
Package MakeReplyPackage(const Package& request, const Message& reply, uint16_t advertised_port);

// Textual host for an endpoint address; v4-mapped IPv6 is reported as IPv4
std::string CanonicalHost(const asio::ip::address& address);

}  // namespace network
}  // namespace meshwire
