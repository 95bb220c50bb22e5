// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshwire {
namespace network {

// Correlation slot for one outstanding request. Filled at most once.
class PendingResponse {
public:
  PendingResponse(Session session, std::string expected_type)
      : session_(std::move(session)), expected_type_(std::move(expected_type)) {}

  SessionId session_id() const { return session_.id(); }
  const std::string& expected_type() const { return expected_type_; }

  SessionStage stage() const;
  bool is_resolved() const;
  std::optional<std::vector<uint8_t>> payload() const;

private:
  friend class SessionManager;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Session session_;
  std::string expected_type_;
  std::optional<std::vector<uint8_t>> payload_;
};

using PendingResponsePtr = std::shared_ptr<PendingResponse>;

/**
 * SessionManager - request/response correlation
 *
 * Owns the pending-response table. Each slot carries its own condition
 * variable, so a waiter is woken the moment its response is resolved, and
 * resolution from the receive path never blocks on other sessions.
 *
 * Requester-side session lifecycle:
 *   CreateSession (REQUEST) -> RegisterPending -> Resolve (RESPONSE)
 *     -> AwaitResponse returns (CONSUMED, slot removed)
 *   AwaitResponse deadline -> slot evicted, ResponseTimeoutError
 *
 * Thread-safety: all methods are thread-safe.
 */
class SessionManager {
public:
  SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // New REQUEST session; id is uniform over [1, 2^64) and unique among pending slots
  Session CreateSession();

  // New INACTIVE session for fire-and-forget sends (id 0)
  Session CreateInactiveSession() const;

  // Insert a correlation slot for a REQUEST session.
  // Throws InvalidSessionStateError if the session is not in REQUEST stage
  // or a slot with the same id already exists.
  PendingResponsePtr RegisterPending(const Session& session, std::string expected_type = {});

  // Fill the slot for `id`. Returns false (and logs) if the slot is unknown,
  // e.g. evicted by a timeout, or already resolved.
  bool Resolve(SessionId id, std::vector<uint8_t> payload);

  // Block the calling thread until the slot for `id` is resolved or `timeout`
  // elapses. The slot is removed either way. Timeouts above
  // protocol::MAX_RESPONSE_TIMEOUT are clamped to it.
  // Throws UnknownSessionError if no slot exists, ResponseTimeoutError on timeout.
  std::vector<uint8_t> AwaitResponse(SessionId id, std::chrono::milliseconds timeout);

  // Drop a slot without waiting (e.g. the request could not be sent)
  bool Remove(SessionId id);

  bool HasPending(SessionId id) const;
  size_t PendingCount() const;

private:
  PendingResponsePtr Find(SessionId id) const;

  mutable std::mutex mutex_;
  std::unordered_map<SessionId, PendingResponsePtr> pending_;
  std::mt19937_64 rng_;
};

}  // namespace network
}  // namespace meshwire
