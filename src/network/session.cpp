// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/session.hpp"

namespace meshwire {
namespace network {

const char* SessionStageName(SessionStage stage) {
  switch (stage) {
  case SessionStage::REQUEST:
    return "REQUEST";
  case SessionStage::RESPONSE:
    return "RESPONSE";
  case SessionStage::CONSUMED:
    return "CONSUMED";
  case SessionStage::INACTIVE:
    return "INACTIVE";
  }
  return "INACTIVE";
}

Session Session::FromMetadata(const PackageMetadata& metadata) {
  switch (metadata.stage) {
  case PackageStage::REQUEST:
    return Session(metadata.session_id.value_or(0), SessionStage::REQUEST);
  case PackageStage::RESPONSE:
    return Session(metadata.session_id.value_or(0), SessionStage::RESPONSE);
  case PackageStage::INACTIVE:
    break;
  }
  return Session(0, SessionStage::INACTIVE);
}

void Session::ProcessLifecycle() {
  switch (stage_) {
  case SessionStage::REQUEST:
    stage_ = SessionStage::RESPONSE;
    return;
  case SessionStage::RESPONSE:
    stage_ = SessionStage::CONSUMED;
    return;
  case SessionStage::CONSUMED:
    throw InvalidSessionStateError("session " + std::to_string(id_) + " is already consumed");
  case SessionStage::INACTIVE:
    throw InvalidSessionStateError("session " + std::to_string(id_) + " is inactive");
  }
}

PackageStage Session::wire_stage() const {
  switch (stage_) {
  case SessionStage::REQUEST:
    return PackageStage::REQUEST;
  case SessionStage::RESPONSE:
    return PackageStage::RESPONSE;
  case SessionStage::INACTIVE:
    return PackageStage::INACTIVE;
  case SessionStage::CONSUMED:
    break;
  }
  throw InvalidSessionStateError("session " + std::to_string(id_) + " is consumed and cannot send");
}

}  // namespace network
}  // namespace meshwire
