// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/handler.hpp"
#include "network/node.hpp"
#include "util/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace {

using meshwire::network::Address;
using meshwire::network::ArgKind;
using meshwire::network::MakeHandler;
using meshwire::network::Message;
using meshwire::network::Node;

const char* const DEMO_TOPIC = "DEMO";

struct Ping {
  std::string text;
  uint64_t nonce{0};
};

struct Pong {
  std::string text;
  uint64_t nonce{0};
  std::string seen_as;  // how the responder sees the requester
};

void to_json(nlohmann::json& j, const Ping& p) {
  j = nlohmann::json{{"text", p.text}, {"nonce", p.nonce}};
}

void from_json(const nlohmann::json& j, Ping& p) {
  j.at("text").get_to(p.text);
  j.at("nonce").get_to(p.nonce);
}

void to_json(nlohmann::json& j, const Pong& p) {
  j = nlohmann::json{{"text", p.text}, {"nonce", p.nonce}, {"seen_as", p.seen_as}};
}

void from_json(const nlohmann::json& j, Pong& p) {
  j.at("text").get_to(p.text);
  j.at("nonce").get_to(p.nonce);
  j.at("seen_as").get_to(p.seen_as);
}

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) {
  g_shutdown_requested = true;
}

void PrintUsage(const char* program_name) {
  std::cout << "meshwire demo node\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --transport=<tcp|udp>    Transport binding (default: tcp)\n"
            << "  --port=<port>            Listening port (default: ephemeral)\n"
            << "  --advertise=<port>       Advertised port (default: listening port)\n"
            << "  --timeout=<ms>           Response timeout (default: 5000)\n"
            << "  --peer=<host:port>       Send a DEMO/PING to this peer and print the reply\n"
            << "  --once                   Exit after the ping instead of serving\n"
            << "  --loglevel=<level>       trace, debug, info, warn, error, off (default: info)\n"
            << "  --help                   Show this help message\n"
            << std::endl;
}

bool ParseUint(const std::string& text, uint64_t max, uint64_t& out) {
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(text, &pos);
    if (pos != text.size() || value > max) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void RegisterDemoProtocol(Node& node) {
  node.RegisterHandler(DEMO_TOPIC, "PING",
                       MakeHandler<ArgKind::Payload, ArgKind::Sender>([](const Ping& ping, const Address& from) {
                         LOG_INFO("PING '{}' from {}", ping.text, from.ToString());
                         return Pong{"PONG", ping.nonce, from.ToString()};
                       }));

  node.RegisterHandler(DEMO_TOPIC, "ECHO",
                       MakeHandler<ArgKind::Payload>([](const std::optional<nlohmann::json>& payload) {
                         return payload;
                       }));
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    Node::Config config;
    std::string log_level = "info";
    std::optional<Address> peer;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      uint64_t value = 0;

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--transport=tcp") {
        config.transport = meshwire::network::TransportKind::TCP;
      } else if (arg == "--transport=udp") {
        config.transport = meshwire::network::TransportKind::UDP;
      } else if (arg.starts_with("--port=")) {
        if (!ParseUint(arg.substr(7), 65535, value)) {
          std::cerr << "Error: invalid port: " << arg.substr(7) << "\n";
          return 1;
        }
        config.listen_port = static_cast<uint16_t>(value);
      } else if (arg.starts_with("--advertise=")) {
        if (!ParseUint(arg.substr(12), 65535, value)) {
          std::cerr << "Error: invalid port: " << arg.substr(12) << "\n";
          return 1;
        }
        config.advertised_port = static_cast<uint16_t>(value);
      } else if (arg.starts_with("--timeout=")) {
        if (!ParseUint(arg.substr(10), 3600 * 1000, value) || value == 0) {
          std::cerr << "Error: invalid timeout: " << arg.substr(10) << "\n";
          return 1;
        }
        config.response_timeout = std::chrono::milliseconds(value);
      } else if (arg.starts_with("--peer=")) {
        peer = Address::Parse(arg.substr(7));
        if (!peer) {
          std::cerr << "Error: invalid peer address: " << arg.substr(7) << "\n";
          return 1;
        }
      } else if (arg == "--once") {
        once = true;
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else {
        std::cerr << "Error: unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    meshwire::util::LogManager::Initialize(log_level);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    Node node(config);
    RegisterDemoProtocol(node);

    if (!node.Listen()) {
      std::cerr << "Error: failed to listen on port " << config.listen_port << "\n";
      return 1;
    }
    std::cout << "Listening on port " << node.listening_port() << " ("
              << meshwire::network::TransportKindName(config.transport) << ")" << std::endl;

    int exit_code = 0;
    if (peer) {
      try {
        auto pong = node.SendAndReceive<Pong>(*peer, Message::Make(DEMO_TOPIC, "PING", Ping{"PING", 42}));
        std::cout << pong.text << " (nonce " << pong.nonce << ", seen as " << pong.seen_as << ")" << std::endl;
      } catch (const meshwire::network::NetworkError& e) {
        std::cerr << "Error: ping to " << peer->ToString() << " failed: " << e.what() << "\n";
        exit_code = 1;
      }
    }

    if (!once) {
      while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }

    node.Stop();
    meshwire::util::LogManager::Shutdown();
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
