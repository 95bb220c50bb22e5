// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace meshwire {
namespace network {

using SessionId = uint64_t;

// Correlation stage carried on the wire
enum class PackageStage { REQUEST, RESPONSE, INACTIVE };

const char* PackageStageName(PackageStage stage);
std::optional<PackageStage> ParsePackageStage(const std::string& name);

class SerializedMessage;

/**
 * Message - user-facing unit of communication
 *
 * Topic is the protocol namespace ("KAD"), type the message kind within it
 * ("FIND_NODE"). The payload is any JSON-representable value, or absent.
 * Types with nlohmann to_json/from_json overloads can be sent directly:
 *
 *   auto msg = Message::Make("KAD", "PING", PingPayload{...});
 */
class Message {
public:
  std::string topic;
  std::string type;
  std::optional<nlohmann::json> payload;

  Message() = default;
  Message(std::string topic, std::string type, std::optional<nlohmann::json> payload = std::nullopt)
      : topic(std::move(topic)), type(std::move(type)), payload(std::move(payload)) {}

  template <typename T>
  static Message Make(std::string topic, std::string type, const T& value) {
    return Message(std::move(topic), std::move(type), nlohmann::json(value));
  }

  // Payload to bytes (JSON text). An absent payload becomes a zero-length payload.
  // Throws NetworkError if the payload cannot be encoded (e.g. invalid UTF-8).
  SerializedMessage Serialize() const;

  bool operator==(const Message& other) const = default;
};

// Wire form of Message; the payload is kept as raw bytes until a handler asks for it
class SerializedMessage {
public:
  std::string topic;
  std::string type;
  std::vector<uint8_t> payload;

  SerializedMessage() = default;
  SerializedMessage(std::string topic, std::string type, std::vector<uint8_t> payload)
      : topic(std::move(topic)), type(std::move(type)), payload(std::move(payload)) {}

  bool has_payload() const { return !payload.empty(); }

  // Decode the payload as a generic JSON value. A zero-length payload yields
  // an absent payload without invoking the decoder. Throws DecodeError.
  Message Deserialize() const;

  // Decode the payload as T. Returns nullopt for a zero-length payload.
  // Throws DecodeError if the bytes are not JSON or do not convert to T.
  template <typename T>
  std::optional<T> DeserializeAs() const {
    auto message = Deserialize();
    if (!message.payload) {
      return std::nullopt;
    }
    try {
      return message.payload->template get<T>();
    } catch (const nlohmann::json::exception& e) {
      throw DecodeError(std::string("payload of ") + topic + "/" + type + " has unexpected shape: " + e.what());
    }
  }

  bool operator==(const SerializedMessage& other) const = default;
};

// Out-of-band routing/correlation data
struct PackageMetadata {
  uint16_t advertised_port{0};
  std::optional<SessionId> session_id;
  PackageStage stage{PackageStage::INACTIVE};

  bool operator==(const PackageMetadata& other) const = default;
};

/**
 * Package - the unit placed on the wire
 *
 * Encoding: CBOR map {"message": {"topic", "type", "payload": bytes},
 * "metadata": {"port", "session", "stage"}}, then deflated (util::Compress).
 * Receivers inflate first, then decode the structure.
 */
class Package {
public:
  SerializedMessage message;
  PackageMetadata metadata;

  Package() = default;
  Package(SerializedMessage message, PackageMetadata metadata)
      : message(std::move(message)), metadata(std::move(metadata)) {}

  // Encode + compress. Throws NetworkError if encoding fails.
  std::vector<uint8_t> Serialize() const;

  // CBOR envelope before compression; its size is what receivers bound on inflate
  std::vector<uint8_t> EncodeEnvelope() const;

  // Compress an envelope produced by EncodeEnvelope(). Throws NetworkError.
  static std::vector<uint8_t> CompressEnvelope(const std::vector<uint8_t>& envelope);

  // Decompress + decode. max_inflated bounds the decompressed size.
  // Throws DecodeError on any malformed input.
  static Package Deserialize(const uint8_t* data, size_t size, size_t max_inflated);
  static Package Deserialize(const std::vector<uint8_t>& data, size_t max_inflated);

  // Short human-readable description for logs (no payload bytes)
  std::string ToString() const;

  bool operator==(const Package& other) const = default;
};

}  // namespace network
}  // namespace meshwire
