// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"

#include "network/errors.hpp"
#include "network/session_manager.hpp"
#include "util/logging.hpp"

#include <memory>

namespace meshwire {
namespace network {

MessageDispatcher::MessageDispatcher(SessionManager& sessions, TaskRunner runner, ReplySink reply_sink)
    : sessions_(sessions), runner_(std::move(runner)), reply_sink_(std::move(reply_sink)) {
  if (!runner_) {
    throw std::invalid_argument("MessageDispatcher requires a task runner");
  }
}

void MessageDispatcher::RegisterHandler(const std::string& topic, const std::string& type, HandlerFn fn,
                                        ArgumentShape shape) {
  if (!fn) {
    throw std::invalid_argument("empty handler for " + topic + "/" + type);
  }
  ValidateShape(shape);

  std::lock_guard<std::mutex> lock(mutex_);
  auto key = HandlerKey(topic, type);
  if (handlers_.count(key)) {
    throw DuplicateHandlerError(topic, type);
  }
  LOG_DISPATCH_DEBUG("registered handler {}/{} {}", topic, type, ShapeToString(shape));
  handlers_.emplace(std::move(key), HandlerEntry{topic, type, std::move(fn), std::move(shape)});
}

void MessageDispatcher::RegisterHandler(const std::string& topic, const std::string& type, TypedHandler handler) {
  RegisterHandler(topic, type, std::move(handler.fn), std::move(handler.shape));
}

bool MessageDispatcher::UnregisterHandler(const std::string& topic, const std::string& type) {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.erase(HandlerKey(topic, type)) > 0;
}

bool MessageDispatcher::HasHandler(const std::string& topic, const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(HandlerKey(topic, type)) > 0;
}

std::vector<std::string> MessageDispatcher::GetRegisteredHandlers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(handlers_.size());
  // std::map iterates in key order
  for (const auto& [key, entry] : handlers_) {
    keys.push_back(key.first + "/" + key.second);
  }
  return keys;
}

bool MessageDispatcher::Dispatch(const Package& pkg, const Address& sender) {
  const auto& metadata = pkg.metadata;

  if (metadata.stage == PackageStage::RESPONSE) {
    if (!metadata.session_id) {
      LOG_DISPATCH_WARN_RL("response from {} without session id dropped", sender.ToString());
      return false;
    }
    return sessions_.Resolve(*metadata.session_id, pkg.message.payload);
  }

  std::shared_ptr<const HandlerEntry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(HandlerKey(pkg.message.topic, pkg.message.type));
    if (it != handlers_.end()) {
      entry = std::make_shared<const HandlerEntry>(it->second);
    }
  }

  if (!entry) {
    LOG_DISPATCH_WARN_RL("{} from {}: {}", pkg.ToString(), sender.ToString(),
                         UnknownHandlerError(pkg.message.topic, pkg.message.type).what());
    return false;
  }

  LOG_DISPATCH_TRACE("dispatching {} from {}", pkg.ToString(), sender.ToString());
  runner_([this, entry, pkg, sender]() { RunHandler(*entry, pkg, sender); });
  return true;
}

void MessageDispatcher::RunHandler(const HandlerEntry& entry, const Package& pkg, const Address& sender) {
  try {
    Session session = Session::FromMetadata(pkg.metadata);

    std::vector<HandlerArgument> args;
    args.reserve(entry.shape.size());
    for (ArgKind kind : entry.shape) {
      switch (kind) {
      case ArgKind::Payload:
        // Decoded only for handlers that ask for it
        args.emplace_back(pkg.message.Deserialize().payload);
        break;
      case ArgKind::Sender:
        args.emplace_back(sender);
        break;
      case ArgKind::Session:
        args.emplace_back(session);
        break;
      }
    }

    std::optional<nlohmann::json> result = entry.fn(args);

    if (session.stage() != SessionStage::REQUEST) {
      if (result) {
        LOG_DISPATCH_TRACE("discarding return value of {}/{} for {} session", entry.topic, entry.type,
                           SessionStageName(session.stage()));
      }
      return;
    }
    if (!result) {
      LOG_DISPATCH_DEBUG("{}/{} produced no reply for session {}", entry.topic, entry.type, session.id());
      return;
    }

    session.ProcessLifecycle();
    if (reply_sink_) {
      reply_sink_(sender, pkg, Message(entry.topic, entry.type, std::move(result)));
    }
  } catch (const DecodeError& e) {
    LOG_DISPATCH_WARN_RL("dropping {} from {}: {}", pkg.ToString(), sender.ToString(), e.what());
  } catch (const std::exception& e) {
    LOG_DISPATCH_ERROR_RL("handler {}/{} failed for {}: {}", entry.topic, entry.type, sender.ToString(), e.what());
  } catch (...) {
    // Handler threads must survive whatever user code throws
    LOG_DISPATCH_ERROR_RL("handler {}/{} failed for {}: unknown exception", entry.topic, entry.type,
                          sender.ToString());
  }
}

}  // namespace network
}  // namespace meshwire
