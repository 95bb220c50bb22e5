// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/transport.hpp"

#include "network/errors.hpp"
#include "network/protocol.hpp"

namespace meshwire {
namespace network {

const char* TransportKindName(TransportKind kind) {
  switch (kind) {
  case TransportKind::TCP:
    return "tcp";
  case TransportKind::UDP:
    return "udp";
  }
  return "tcp";
}

size_t MaxInflatedSize(size_t max_package_size) {
  return max_package_size * protocol::MAX_DECOMPRESSION_RATIO;
}

std::vector<uint8_t> EncodePackage(const Package& pkg, size_t max_package_size) {
  // Receivers refuse envelopes that inflate past this bound; refuse them here too
  const auto envelope = pkg.EncodeEnvelope();
  if (envelope.size() > MaxInflatedSize(max_package_size)) {
    throw PackageTooLargeError(envelope.size(), MaxInflatedSize(max_package_size));
  }

  auto bytes = Package::CompressEnvelope(envelope);
  if (bytes.size() > max_package_size) {
    throw PackageTooLargeError(bytes.size(), max_package_size);
  }
  return bytes;
}

Package DecodePackage(const uint8_t* data, size_t size, size_t max_package_size) {
  if (size > max_package_size) {
    throw DecodeError("package of " + std::to_string(size) + " bytes exceeds limit of " +
                      std::to_string(max_package_size));
  }
  return Package::Deserialize(data, size, MaxInflatedSize(max_package_size));
}

std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& body) {
  std::vector<uint8_t> frame;
  frame.reserve(protocol::FRAME_HEADER_SIZE + body.size());
  const auto len = static_cast<uint32_t>(body.size());
  frame.push_back(static_cast<uint8_t>(len >> 24));
  frame.push_back(static_cast<uint8_t>(len >> 16));
  frame.push_back(static_cast<uint8_t>(len >> 8));
  frame.push_back(static_cast<uint8_t>(len));
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

uint32_t ReadFrameLength(const uint8_t* header) {
  return (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
         (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
}

Package MakeReplyPackage(const Package& request, const Message& reply, uint16_t advertised_port) {
  PackageMetadata metadata;
  metadata.advertised_port = advertised_port;
  metadata.session_id = request.metadata.session_id;
  metadata.stage = PackageStage::RESPONSE;
  return Package(reply.Serialize(), metadata);
}

std::string CanonicalHost(const asio::ip::address& address) {
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6()).to_string();
  }
  return address.to_string();
}

}  // namespace network
}  // namespace meshwire
