// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace meshwire {
namespace network {

// Logical endpoint of a peer: host plus the port it listens on (its
// advertised port). Transport-level endpoints use the same type, carrying
// the ephemeral source port instead.
struct Address {
  std::string host;
  uint16_t port{0};

  Address() = default;
  Address(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  bool operator==(const Address& other) const = default;
  auto operator<=>(const Address& other) const = default;

  // "host:port", with IPv6 hosts bracketed
  std::string ToString() const;

  // Parse "host:port" or "[v6]:port". Returns nullopt on malformed input or port 0.
  static std::optional<Address> Parse(const std::string& text);
};

}  // namespace network
}  // namespace meshwire

template <>
struct std::hash<meshwire::network::Address> {
  size_t operator()(const meshwire::network::Address& addr) const noexcept {
    size_t h = std::hash<std::string>{}(addr.host);
    return h ^ (std::hash<uint16_t>{}(addr.port) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};
