// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/compression.hpp"

#include <limits>

#include <zlib.h>

namespace meshwire {
namespace util {

std::vector<uint8_t> Compress(const std::vector<uint8_t>& data) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    throw CompressionError("input too large to compress");
  }

  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<uint8_t> out(COMPRESSION_HEADER_SIZE + bound);

  const auto len = static_cast<uint32_t>(data.size());
  out[0] = static_cast<uint8_t>(len >> 24);
  out[1] = static_cast<uint8_t>(len >> 16);
  out[2] = static_cast<uint8_t>(len >> 8);
  out[3] = static_cast<uint8_t>(len);

  int rc = compress2(out.data() + COMPRESSION_HEADER_SIZE, &bound, data.data(), static_cast<uLong>(data.size()),
                     Z_BEST_SPEED);
  if (rc != Z_OK) {
    throw CompressionError("deflate failed: " + std::to_string(rc));
  }
  out.resize(COMPRESSION_HEADER_SIZE + bound);
  return out;
}

std::vector<uint8_t> Decompress(const uint8_t* data, size_t size, size_t max_output) {
  if (size < COMPRESSION_HEADER_SIZE) {
    throw CompressionError("truncated compression header");
  }

  const size_t declared = (static_cast<size_t>(data[0]) << 24) | (static_cast<size_t>(data[1]) << 16) |
                          (static_cast<size_t>(data[2]) << 8) | static_cast<size_t>(data[3]);
  if (declared > max_output) {
    throw CompressionError("declared size " + std::to_string(declared) + " exceeds limit " +
                           std::to_string(max_output));
  }

  std::vector<uint8_t> out(declared);
  uLongf out_len = static_cast<uLongf>(declared);
  // uncompress() rejects a null destination even for empty output
  uint8_t empty_sink = 0;
  int rc = uncompress(declared == 0 ? &empty_sink : out.data(), &out_len, data + COMPRESSION_HEADER_SIZE,
                      static_cast<uLong>(size - COMPRESSION_HEADER_SIZE));
  if (rc != Z_OK) {
    throw CompressionError("inflate failed: " + std::to_string(rc));
  }
  if (out_len != declared) {
    throw CompressionError("inflated size mismatch");
  }
  return out;
}

std::vector<uint8_t> Decompress(const std::vector<uint8_t>& data, size_t max_output) {
  return Decompress(data.data(), data.size(), max_output);
}

}  // namespace util
}  // namespace meshwire
