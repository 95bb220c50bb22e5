// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace meshwire {
namespace network {

// Base for every error raised by the messaging engine
class NetworkError : public std::runtime_error {
public:
  explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed, corrupt or undecodable package or payload.
// Receive paths drop the package and keep going.
class DecodeError : public NetworkError {
public:
  explicit DecodeError(const std::string& what) : NetworkError(what) {}
};

// Compressed package exceeds the transport limit. Raised to the sender; nothing is written.
class PackageTooLargeError : public NetworkError {
public:
  PackageTooLargeError(size_t size, size_t limit)
      : NetworkError("package of " + std::to_string(size) + " bytes exceeds limit of " + std::to_string(limit) +
                     " bytes"),
        size_(size), limit_(limit) {}

  size_t size() const { return size_; }
  size_t limit() const { return limit_; }

private:
  size_t size_;
  size_t limit_;
};

// (topic, type) registered twice
class DuplicateHandlerError : public NetworkError {
public:
  DuplicateHandlerError(const std::string& topic, const std::string& type)
      : NetworkError("handler already registered for " + topic + "/" + type) {}
};

// No handler for an inbound (topic, type)
class UnknownHandlerError : public NetworkError {
public:
  UnknownHandlerError(const std::string& topic, const std::string& type)
      : NetworkError("no handler registered for " + topic + "/" + type) {}
};

// Attempt to advance a CONSUMED or INACTIVE session
class InvalidSessionStateError : public NetworkError {
public:
  explicit InvalidSessionStateError(const std::string& what) : NetworkError(what) {}
};

// No response arrived for a request before its deadline
class ResponseTimeoutError : public NetworkError {
public:
  explicit ResponseTimeoutError(uint64_t session_id)
      : NetworkError("no response for session " + std::to_string(session_id)), session_id_(session_id) {}

  uint64_t session_id() const { return session_id_; }

private:
  uint64_t session_id_;
};

// Correlation slot missing (never created, or already evicted/consumed)
class UnknownSessionError : public NetworkError {
public:
  explicit UnknownSessionError(uint64_t session_id)
      : NetworkError("unknown session " + std::to_string(session_id)), session_id_(session_id) {}

  uint64_t session_id() const { return session_id_; }

private:
  uint64_t session_id_;
};

}  // namespace network
}  // namespace meshwire
