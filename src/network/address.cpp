// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address.hpp"

#include <charconv>

namespace meshwire {
namespace network {

std::string Address::ToString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::optional<Address> Address::Parse(const std::string& text) {
  std::string host;
  std::string port_str;

  if (!text.empty() && text.front() == '[') {
    auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      return std::nullopt;
    }
    host = text.substr(1, close - 1);
    port_str = text.substr(close + 2);
  } else {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || text.find(':') != colon) {
      return std::nullopt;
    }
    host = text.substr(0, colon);
    port_str = text.substr(colon + 1);
  }

  if (host.empty() || port_str.empty() || host.find_first_of("[]") != std::string::npos) {
    return std::nullopt;
  }

  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
  if (ec != std::errc() || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535) {
    return std::nullopt;
  }
  return Address(std::move(host), static_cast<uint16_t>(value));
}

}  // namespace network
}  // namespace meshwire
