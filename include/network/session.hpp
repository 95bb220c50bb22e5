// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"

#include <string>

namespace meshwire {
namespace network {

// REQUEST -> RESPONSE -> CONSUMED, or INACTIVE from creation.
// CONSUMED and INACTIVE are terminal.
enum class SessionStage { REQUEST, RESPONSE, CONSUMED, INACTIVE };

const char* SessionStageName(SessionStage stage);

// Correlation token joining an outbound request to its inbound response.
// Fire-and-forget sends use an INACTIVE session with id 0.
class Session {
public:
  explicit Session(SessionId id, SessionStage stage = SessionStage::REQUEST) : id_(id), stage_(stage) {}

  // Rebuild the session view of an inbound package
  static Session FromMetadata(const PackageMetadata& metadata);

  SessionId id() const { return id_; }
  SessionStage stage() const { return stage_; }
  bool is_terminal() const { return stage_ == SessionStage::CONSUMED || stage_ == SessionStage::INACTIVE; }

  // Advance one stage. Throws InvalidSessionStateError from a terminal stage.
  void ProcessLifecycle();

  // Stage to put on the wire for a package sent in this session.
  // Throws InvalidSessionStateError for CONSUMED.
  PackageStage wire_stage() const;

  bool operator==(const Session& other) const = default;

private:
  SessionId id_;
  SessionStage stage_;
};

}  // namespace network
}  // namespace meshwire
