// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef MESHWIRE_NETWORK_MESSAGE_DISPATCHER_HPP
#define MESHWIRE_NETWORK_MESSAGE_DISPATCHER_HPP

#include "network/address.hpp"
#include "network/handler.hpp"
#include "network/message.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace meshwire {
namespace network {

class SessionManager;

/**
 * MessageDispatcher - topic/type routing via handler registry
 *
 * Design:
 * - Protocols register one handler per (topic, type) before the node listens
 * - Thread-safe registration and dispatch
 * - Handlers never run on the receive path: Dispatch() hands them to the
 *   task runner and returns
 *
 * Session handling per inbound package stage:
 * - REQUEST:  handler runs; a returned payload advances the session to
 *             RESPONSE and is sent back through the reply sink
 * - RESPONSE: no handler lookup; the payload resolves the pending slot in
 *             the SessionManager (the waiter moves it to CONSUMED)
 * - INACTIVE: handler runs; its return value is discarded
 *
 * Usage:
 *   MessageDispatcher dispatcher(sessions, runner, reply_sink);
 *   dispatcher.RegisterHandler("KAD", "PING",
 *       MakeHandler<ArgKind::Payload>([](const Ping& p) { return Pong{p.nonce}; }));
 *   dispatcher.Dispatch(pkg, sender);
 */
class MessageDispatcher {
public:
  // Runs a handler task; must not block the caller
  using TaskRunner = std::function<void(std::function<void()>)>;

  // Sends `reply` to `recipient` as the response to `request`
  using ReplySink = std::function<void(const Address& recipient, const Package& request, const Message& reply)>;

  MessageDispatcher(SessionManager& sessions, TaskRunner runner, ReplySink reply_sink);
  ~MessageDispatcher() = default;

  // Non-copyable
  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  // Register the handler for (topic, type). Thread-safe.
  // Throws DuplicateHandlerError if one exists, std::invalid_argument for an
  // empty fn or a shape listing a kind twice.
  void RegisterHandler(const std::string& topic, const std::string& type, HandlerFn fn, ArgumentShape shape);
  void RegisterHandler(const std::string& topic, const std::string& type, TypedHandler handler);

  // Unregister handler (for testing/cleanup). Returns true if one was removed.
  bool UnregisterHandler(const std::string& topic, const std::string& type);

  // Route an inbound package. Returns true if a handler task was scheduled or
  // a pending response resolved; false if the package was dropped.
  bool Dispatch(const Package& pkg, const Address& sender);

  bool HasHandler(const std::string& topic, const std::string& type) const;

  // Sorted "topic/type" keys (for diagnostics)
  std::vector<std::string> GetRegisteredHandlers() const;

private:
  struct HandlerEntry {
    std::string topic;
    std::string type;
    HandlerFn fn;
    ArgumentShape shape;
  };

  using HandlerKey = std::pair<std::string, std::string>;

  // Handler task body: build arguments, invoke, reply
  void RunHandler(const HandlerEntry& entry, const Package& pkg, const Address& sender);

  SessionManager& sessions_;
  TaskRunner runner_;
  ReplySink reply_sink_;

  mutable std::mutex mutex_;
  std::map<HandlerKey, HandlerEntry> handlers_;
};

}  // namespace network
}  // namespace meshwire

#endif  // MESHWIRE_NETWORK_MESSAGE_DISPATCHER_HPP
