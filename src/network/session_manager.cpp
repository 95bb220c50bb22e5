// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/session_manager.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <limits>

namespace meshwire {
namespace network {

// ============================================================================
// PendingResponse
// ============================================================================

SessionStage PendingResponse::stage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.stage();
}

bool PendingResponse::is_resolved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return payload_.has_value();
}

std::optional<std::vector<uint8_t>> PendingResponse::payload() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return payload_;
}

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager() : rng_(std::random_device{}()) {}

Session SessionManager::CreateSession() {
  std::uniform_int_distribution<SessionId> dist(1, std::numeric_limits<SessionId>::max());

  std::lock_guard<std::mutex> lock(mutex_);
  SessionId id = dist(rng_);
  while (pending_.count(id) != 0) {
    LOG_SESSION_DEBUG("session id {} collides with a pending request, regenerating", id);
    id = dist(rng_);
  }
  return Session(id, SessionStage::REQUEST);
}

Session SessionManager::CreateInactiveSession() const {
  return Session(0, SessionStage::INACTIVE);
}

PendingResponsePtr SessionManager::RegisterPending(const Session& session, std::string expected_type) {
  if (session.stage() != SessionStage::REQUEST) {
    throw InvalidSessionStateError("cannot await a response in " + std::string(SessionStageName(session.stage())) +
                                   " session " + std::to_string(session.id()));
  }

  auto slot = std::make_shared<PendingResponse>(session, std::move(expected_type));

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = pending_.emplace(session.id(), slot);
  if (!inserted) {
    throw InvalidSessionStateError("session " + std::to_string(session.id()) + " is already pending");
  }
  LOG_SESSION_TRACE("registered pending response for session {}", session.id());
  return slot;
}

PendingResponsePtr SessionManager::Find(SessionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  return it == pending_.end() ? nullptr : it->second;
}

bool SessionManager::Resolve(SessionId id, std::vector<uint8_t> payload) {
  auto slot = Find(id);
  if (!slot) {
    // Normal when the response lost the race against a timeout
    LOG_SESSION_WARN_RL("dropping response for unknown session {}", id);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(slot->mutex_);
    if (slot->payload_) {
      LOG_SESSION_WARN_RL("session {} already resolved, ignoring duplicate response", id);
      return false;
    }
    slot->session_.ProcessLifecycle();  // REQUEST -> RESPONSE
    slot->payload_ = std::move(payload);
  }
  slot->cv_.notify_all();

  LOG_SESSION_TRACE("resolved session {}", id);
  return true;
}

std::vector<uint8_t> SessionManager::AwaitResponse(SessionId id, std::chrono::milliseconds timeout) {
  auto slot = Find(id);
  if (!slot) {
    throw UnknownSessionError(id);
  }

  timeout = std::min(timeout, protocol::MAX_RESPONSE_TIMEOUT);

  std::optional<std::vector<uint8_t>> result;
  {
    std::unique_lock<std::mutex> lock(slot->mutex_);
    if (slot->cv_.wait_for(lock, timeout, [&slot] { return slot->payload_.has_value(); })) {
      slot->session_.ProcessLifecycle();  // RESPONSE -> CONSUMED
      result = std::move(slot->payload_);
    }
  }

  Remove(id);

  if (!result) {
    LOG_SESSION_DEBUG("session {} timed out after {} ms", id, timeout.count());
    throw ResponseTimeoutError(id);
  }
  return std::move(*result);
}

bool SessionManager::Remove(SessionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.erase(id) > 0;
}

bool SessionManager::HasPending(SessionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(id) != 0;
}

size_t SessionManager::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace network
}  // namespace meshwire
