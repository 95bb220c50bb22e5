// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshwire {
namespace util {

class CompressionError : public std::runtime_error {
public:
  explicit CompressionError(const std::string& what) : std::runtime_error(what) {}
};

// Size of the uncompressed-length prefix carried in front of every deflate stream
constexpr size_t COMPRESSION_HEADER_SIZE = 4;

// Deflate `data` (zlib format, fastest level). Output layout:
//   [uint32 big-endian uncompressed length][zlib stream]
// Throws CompressionError if zlib fails.
std::vector<uint8_t> Compress(const std::vector<uint8_t>& data);

// Inverse of Compress(). Rejects declared sizes above max_output before allocating.
// Throws CompressionError on truncated, corrupt or oversized input.
std::vector<uint8_t> Decompress(const uint8_t* data, size_t size, size_t max_output);
std::vector<uint8_t> Decompress(const std::vector<uint8_t>& data, size_t max_output);

}  // namespace util
}  // namespace meshwire
