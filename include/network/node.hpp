// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/handler.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/peer_identity.hpp"
#include "network/protocol.hpp"
#include "network/session_manager.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace meshwire {
namespace network {

/**
 * Node - messaging façade
 *
 * Composes one Transport binding, the PeerIdentityTable, the SessionManager
 * and the MessageDispatcher:
 *
 *   Send / SendAndReceive -> before-send hooks -> Transport
 *   Transport -> after-receive hooks -> MessageDispatcher -> handler pool
 *
 * Threads: `io_threads` run the io_context (socket I/O, decoding, dispatch);
 * handlers run on a separate pool of `handler_threads`. SendAndReceive blocks
 * only its calling thread.
 *
 * Register handlers before Listen(). A stopped node cannot be restarted.
 */
class Node {
public:
  struct Config {
    TransportKind transport{TransportKind::TCP};
    uint16_t listen_port{0};      // 0 = ephemeral
    uint16_t advertised_port{0};  // 0 = bound listening port
    size_t max_package_size{0};   // 0 = binding default
    std::chrono::milliseconds response_timeout{protocol::DEFAULT_RESPONSE_TIMEOUT};
    size_t io_threads{protocol::DEFAULT_IO_THREADS};
    size_t handler_threads{protocol::DEFAULT_HANDLER_THREADS};
    std::chrono::milliseconds connect_timeout{protocol::DEFAULT_CONNECT_TIMEOUT};
    size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_SIZE};
  };

  // Inspect or rewrite a package; runs synchronously on the sending or receiving thread
  using PackageHook = std::function<void(Package& pkg)>;

  explicit Node(const Config& config = Config{});
  ~Node();

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Bind the transport and start the io threads. Returns false if binding
  // fails or the node is already listening or stopped.
  bool Listen();

  // Close the transport, join the io threads and drain the handler pool. Idempotent.
  void Stop();

  // Throws DuplicateHandlerError or std::invalid_argument (see MessageDispatcher)
  void RegisterHandler(const std::string& topic, const std::string& type, HandlerFn fn, ArgumentShape shape);
  void RegisterHandler(const std::string& topic, const std::string& type, TypedHandler handler);

  // Fire-and-forget (INACTIVE session). Throws PackageTooLargeError; delivery
  // failures are not reported.
  void Send(const Address& recipient, const Message& message);

  // Send in a new REQUEST session and block until the correlated response
  // arrives. Returns the reply payload (nullopt if the reply carried none).
  // Throws ResponseTimeoutError, PackageTooLargeError or DecodeError.
  // A zero timeout uses Config::response_timeout. Responses are only received
  // once the node is listening.
  std::optional<nlohmann::json> SendAndReceiveJson(const Address& recipient, const Message& message,
                                                   std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

  // SendAndReceiveJson converted to T. With T = std::optional<U> an empty
  // reply yields nullopt; otherwise an empty reply raises DecodeError.
  template <typename T>
  T SendAndReceive(const Address& recipient, const Message& message,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
    auto reply = SendAndReceiveJson(recipient, message, timeout);
    if constexpr (detail::is_optional<T>::value) {
      if (!reply) {
        return std::nullopt;
      }
      return detail::ConvertPayload<typename T::value_type>(*reply);
    } else {
      if (!reply) {
        throw DecodeError("response to " + message.topic + "/" + message.type + " carries no payload");
      }
      return detail::ConvertPayload<T>(*reply);
    }
  }

  // Global hooks run first, then the hook for the package's topic (if any).
  // Passing an empty hook clears it.
  void SetBeforeSendHook(PackageHook hook);
  void SetAfterReceiveHook(PackageHook hook);
  void SetBeforeSendHook(const std::string& topic, PackageHook hook);
  void SetAfterReceiveHook(const std::string& topic, PackageHook hook);

  uint16_t listening_port() const;
  uint16_t advertised_port() const;
  const Config& config() const { return config_; }

  SessionManager& sessions() { return sessions_; }
  PeerIdentityTable& peers() { return *peers_; }
  MessageDispatcher& dispatcher() { return dispatcher_; }

private:
  void StartIoThreads();

  // Run before-send hooks and hand the package to the transport
  void SendPackage(const Address& recipient, Package pkg);

  // Transport callback (io thread): after-receive hooks, then dispatch.
  // Replies go out through the dispatcher's reply sink, never synchronously.
  std::optional<Message> OnPackage(const Package& pkg, const Address& sender);

  void RunHooks(const PackageHook& global, const std::map<std::string, PackageHook>& by_topic, Package& pkg) const;

  const Config config_;

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;
  asio::thread_pool handler_pool_;

  SessionManager sessions_;
  std::shared_ptr<PeerIdentityTable> peers_;
  MessageDispatcher dispatcher_;
  TransportPtr transport_;

  std::mutex state_mutex_;  // guards io thread startup, listening_ and stopped_
  bool listening_{false};
  bool stopped_{false};

  mutable std::mutex hooks_mutex_;
  PackageHook before_send_;
  PackageHook after_receive_;
  std::map<std::string, PackageHook> before_send_by_topic_;
  std::map<std::string, PackageHook> after_receive_by_topic_;
};

}  // namespace network
}  // namespace meshwire
