// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "util/compression.hpp"

namespace meshwire {
namespace network {

using json = nlohmann::json;

const char* PackageStageName(PackageStage stage) {
  switch (stage) {
  case PackageStage::REQUEST:
    return "REQUEST";
  case PackageStage::RESPONSE:
    return "RESPONSE";
  case PackageStage::INACTIVE:
    return "INACTIVE";
  }
  return "INACTIVE";
}

std::optional<PackageStage> ParsePackageStage(const std::string& name) {
  if (name == "REQUEST")
    return PackageStage::REQUEST;
  if (name == "RESPONSE")
    return PackageStage::RESPONSE;
  if (name == "INACTIVE")
    return PackageStage::INACTIVE;
  return std::nullopt;
}

// ============================================================================
// Message / SerializedMessage
// ============================================================================

SerializedMessage Message::Serialize() const {
  if (!payload) {
    return SerializedMessage(topic, type, {});
  }

  std::string text;
  try {
    text = payload->dump();
  } catch (const json::exception& e) {
    throw NetworkError("cannot encode payload of " + topic + "/" + type + ": " + e.what());
  }
  return SerializedMessage(topic, type, std::vector<uint8_t>(text.begin(), text.end()));
}

Message SerializedMessage::Deserialize() const {
  if (payload.empty()) {
    return Message(topic, type, std::nullopt);
  }

  try {
    return Message(topic, type, json::parse(payload.begin(), payload.end()));
  } catch (const json::exception& e) {
    throw DecodeError("malformed payload for " + topic + "/" + type + ": " + e.what());
  }
}

// ============================================================================
// Package
// ============================================================================

std::vector<uint8_t> Package::EncodeEnvelope() const {
  json envelope;
  envelope["message"] = {
      {"topic", message.topic},
      {"type", message.type},
      {"payload", json::binary(message.payload)},
  };
  envelope["metadata"] = {
      {"port", metadata.advertised_port},
      {"session", metadata.session_id ? json(*metadata.session_id) : json(nullptr)},
      {"stage", PackageStageName(metadata.stage)},
  };
  return json::to_cbor(envelope);
}

std::vector<uint8_t> Package::CompressEnvelope(const std::vector<uint8_t>& envelope) {
  try {
    return util::Compress(envelope);
  } catch (const util::CompressionError& e) {
    throw NetworkError(std::string("cannot compress package: ") + e.what());
  }
}

std::vector<uint8_t> Package::Serialize() const {
  return CompressEnvelope(EncodeEnvelope());
}

Package Package::Deserialize(const uint8_t* data, size_t size, size_t max_inflated) {
  std::vector<uint8_t> raw;
  try {
    raw = util::Decompress(data, size, max_inflated);
  } catch (const util::CompressionError& e) {
    throw DecodeError(std::string("cannot decompress package: ") + e.what());
  }

  try {
    const json envelope = json::from_cbor(raw);
    const json& msg = envelope.at("message");
    const json& meta = envelope.at("metadata");

    Package pkg;
    pkg.message.topic = msg.at("topic").get<std::string>();
    pkg.message.type = msg.at("type").get<std::string>();

    const json& payload = msg.at("payload");
    if (!payload.is_binary()) {
      throw DecodeError("payload is not a byte string");
    }
    pkg.message.payload = payload.get_binary();

    const json& port = meta.at("port");
    if (!port.is_number_unsigned() || port.get<uint64_t>() > 65535) {
      throw DecodeError("advertised port out of range");
    }
    pkg.metadata.advertised_port = port.get<uint16_t>();
    const json& session = meta.at("session");
    if (!session.is_null()) {
      if (!session.is_number_unsigned()) {
        throw DecodeError("session id is not an unsigned integer");
      }
      pkg.metadata.session_id = session.get<SessionId>();
    }

    auto stage = ParsePackageStage(meta.at("stage").get<std::string>());
    if (!stage) {
      throw DecodeError("unknown session stage");
    }
    pkg.metadata.stage = *stage;

    if (pkg.metadata.stage != PackageStage::INACTIVE && !pkg.metadata.session_id) {
      throw DecodeError("correlated package without session id");
    }
    return pkg;
  } catch (const json::exception& e) {
    throw DecodeError(std::string("malformed package: ") + e.what());
  }
}

Package Package::Deserialize(const std::vector<uint8_t>& data, size_t max_inflated) {
  return Deserialize(data.data(), data.size(), max_inflated);
}

std::string Package::ToString() const {
  std::string out = "[Package " + message.topic + "/" + message.type + " " + PackageStageName(metadata.stage);
  if (metadata.session_id) {
    out += " session=" + std::to_string(*metadata.session_id);
  }
  out += " port=" + std::to_string(metadata.advertised_port) + " payload=" + std::to_string(message.payload.size()) +
         "B]";
  return out;
}

}  // namespace network
}  // namespace meshwire
