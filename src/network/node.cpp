// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node.hpp"

#include "network/errors.hpp"
#include "network/tcp_transport.hpp"
#include "network/udp_transport.hpp"
#include "util/logging.hpp"

#include <algorithm>

#include <asio/post.hpp>

namespace meshwire {
namespace network {

namespace {

size_t EffectiveMaxPackageSize(const Node::Config& config) {
  if (config.max_package_size != 0) {
    return std::min(config.max_package_size, protocol::MAX_PACKAGE_SIZE_LIMIT);
  }
  return config.transport == TransportKind::UDP ? protocol::DEFAULT_UDP_MAX_PACKAGE_SIZE
                                                : protocol::DEFAULT_TCP_MAX_PACKAGE_SIZE;
}

}  // namespace

Node::Node(const Config& config)
    : config_(config), handler_pool_(std::max<size_t>(1, config.handler_threads)),
      peers_(std::make_shared<PeerIdentityTable>()),
      dispatcher_(
          sessions_, [this](std::function<void()> task) { asio::post(handler_pool_, std::move(task)); },
          [this](const Address& recipient, const Package& request, const Message& reply) {
            SendPackage(recipient, MakeReplyPackage(request, reply, transport_->advertised_port()));
          }) {
  const size_t max_size = EffectiveMaxPackageSize(config_);

  if (config_.transport == TransportKind::UDP) {
    UdpTransport::Config udp_config;
    udp_config.max_package_size = max_size;
    udp_config.advertised_port = config_.advertised_port;
    transport_ = std::make_shared<UdpTransport>(io_context_, udp_config, peers_);
  } else {
    TcpTransport::Config tcp_config;
    tcp_config.max_package_size = max_size;
    tcp_config.advertised_port = config_.advertised_port;
    tcp_config.connect_timeout = config_.connect_timeout;
    tcp_config.send_queue_limit = config_.send_queue_limit;
    transport_ = std::make_shared<TcpTransport>(io_context_, tcp_config, peers_);
  }
}

Node::~Node() {
  Stop();
}

void Node::StartIoThreads() {
  // Caller holds state_mutex_
  if (work_guard_ || stopped_)
    return;

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));

  const size_t threads = std::max<size_t>(1, config_.io_threads);
  for (size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }
}

bool Node::Listen() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (listening_ || stopped_) {
    return false;
  }

  StartIoThreads();

  bool success = transport_->Listen(config_.listen_port, [this](const Package& pkg, const Address& sender) {
    return OnPackage(pkg, sender);
  });
  if (!success) {
    LOG_NET_ERROR("failed to start {} listener on port {}", TransportKindName(config_.transport),
                  config_.listen_port);
    return false;
  }

  listening_ = true;
  LOG_NET_INFO("node listening on {} port {} (advertised {}), {} handlers", TransportKindName(config_.transport),
               transport_->listening_port(), transport_->advertised_port(),
               dispatcher_.GetRegisteredHandlers().size());
  return true;
}

void Node::Stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stopped_)
      return;
    stopped_ = true;
    listening_ = false;
  }

  LOG_NET_DEBUG("stopping node");

  transport_->Stop();

  // Let in-flight handlers finish; their sends are dropped by the stopped transport
  handler_pool_.join();

  if (work_guard_) {
    work_guard_.reset();
  }
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

void Node::RegisterHandler(const std::string& topic, const std::string& type, HandlerFn fn, ArgumentShape shape) {
  dispatcher_.RegisterHandler(topic, type, std::move(fn), std::move(shape));
}

void Node::RegisterHandler(const std::string& topic, const std::string& type, TypedHandler handler) {
  dispatcher_.RegisterHandler(topic, type, std::move(handler));
}

void Node::Send(const Address& recipient, const Message& message) {
  const Session session = sessions_.CreateInactiveSession();

  PackageMetadata metadata;
  metadata.advertised_port = transport_->advertised_port();
  metadata.stage = session.wire_stage();

  SendPackage(recipient, Package(message.Serialize(), metadata));
}

std::optional<nlohmann::json> Node::SendAndReceiveJson(const Address& recipient, const Message& message,
                                                       std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    timeout = config_.response_timeout;
  }

  SerializedMessage serialized = message.Serialize();

  const Session session = sessions_.CreateSession();
  sessions_.RegisterPending(session, message.type);

  PackageMetadata metadata;
  metadata.advertised_port = transport_->advertised_port();
  metadata.session_id = session.id();
  metadata.stage = session.wire_stage();

  try {
    SendPackage(recipient, Package(std::move(serialized), metadata));
  } catch (const std::exception&) {
    sessions_.Remove(session.id());
    throw;
  }

  LOG_SESSION_TRACE("awaiting {}/{} response from {} in session {}", message.topic, message.type,
                    recipient.ToString(), session.id());

  auto bytes = sessions_.AwaitResponse(session.id(), timeout);
  return SerializedMessage(message.topic, message.type, std::move(bytes)).Deserialize().payload;
}

void Node::SetBeforeSendHook(PackageHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  before_send_ = std::move(hook);
}

void Node::SetAfterReceiveHook(PackageHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  after_receive_ = std::move(hook);
}

void Node::SetBeforeSendHook(const std::string& topic, PackageHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  if (hook) {
    before_send_by_topic_[topic] = std::move(hook);
  } else {
    before_send_by_topic_.erase(topic);
  }
}

void Node::SetAfterReceiveHook(const std::string& topic, PackageHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  if (hook) {
    after_receive_by_topic_[topic] = std::move(hook);
  } else {
    after_receive_by_topic_.erase(topic);
  }
}

uint16_t Node::listening_port() const {
  return transport_->listening_port();
}

uint16_t Node::advertised_port() const {
  return transport_->advertised_port();
}

void Node::RunHooks(const PackageHook& global, const std::map<std::string, PackageHook>& by_topic,
                    Package& pkg) const {
  PackageHook topic_hook;
  PackageHook global_hook;
  {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    global_hook = global;
    auto it = by_topic.find(pkg.message.topic);
    if (it != by_topic.end()) {
      topic_hook = it->second;
    }
  }
  // Hooks run unlocked: they may install other hooks
  if (global_hook)
    global_hook(pkg);
  if (topic_hook)
    topic_hook(pkg);
}

void Node::SendPackage(const Address& recipient, Package pkg) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    StartIoThreads();
  }
  RunHooks(before_send_, before_send_by_topic_, pkg);
  transport_->Send(recipient, pkg);
}

std::optional<Message> Node::OnPackage(const Package& pkg, const Address& sender) {
  Package received = pkg;
  try {
    RunHooks(after_receive_, after_receive_by_topic_, received);
  } catch (const std::exception& e) {
    LOG_NET_WARN_RL("after-receive hook failed for {}: {}", received.ToString(), e.what());
    return std::nullopt;
  }
  dispatcher_.Dispatch(received, sender);
  return std::nullopt;
}

}  // namespace network
}  // namespace meshwire
