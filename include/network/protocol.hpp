// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace meshwire {
namespace protocol {

// Wire format has no in-band version; peers must run compatible builds.

// Stream framing: every compressed package is preceded by its length
constexpr size_t FRAME_HEADER_SIZE = 4;  // uint32, big-endian

// ============================================================================
// PACKAGE SIZE LIMITS (compressed envelope, excluding frame header)
// ============================================================================

// One package per datagram; kept below common path MTUs
constexpr size_t DEFAULT_UDP_MAX_PACKAGE_SIZE = 1024;
constexpr size_t DEFAULT_TCP_MAX_PACKAGE_SIZE = 10 * 1024;

// Hard ceiling for any configured limit
constexpr size_t MAX_PACKAGE_SIZE_LIMIT = 16 * 1024 * 1024;

// Upper bound on the inflated envelope relative to the configured package limit.
// Protects receivers from decompression bombs.
constexpr size_t MAX_DECOMPRESSION_RATIO = 64;

// Send queue limit per TCP connection
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 1024 * 1024;

// ============================================================================
// TIMEOUTS
// ============================================================================

constexpr std::chrono::milliseconds DEFAULT_RESPONSE_TIMEOUT{std::chrono::seconds(5)};
constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(5)};
// Longer waits are clamped; steady_clock::now() + milliseconds::max() overflows
constexpr std::chrono::milliseconds MAX_RESPONSE_TIMEOUT{std::chrono::hours(24)};

// ============================================================================
// THREADING
// ============================================================================

constexpr size_t DEFAULT_IO_THREADS = 1;
constexpr size_t DEFAULT_HANDLER_THREADS = 2;

}  // namespace protocol
}  // namespace meshwire
