// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace meshwire {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Component loggers: "default", "network" (transports, framing, peer identity),
 * "session" (correlation and timeouts), "dispatch" (handler routing).
 *
 * Thread-safety: All methods are thread-safe. Initialization is performed
 * once per process lifetime (or after Shutdown()).
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // (or the first after Shutdown()) has an effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. Later logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Unknown names return the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for one component (default, network, session, dispatch).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace meshwire

#define LOG_TRACE(...) meshwire::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) meshwire::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) meshwire::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) meshwire::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) meshwire::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) meshwire::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) meshwire::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) meshwire::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) meshwire::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) meshwire::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SESSION_TRACE(...) meshwire::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...) meshwire::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...) meshwire::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...) meshwire::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)

#define LOG_DISPATCH_TRACE(...) meshwire::util::LogManager::GetLogger("dispatch")->trace(__VA_ARGS__)
#define LOG_DISPATCH_DEBUG(...) meshwire::util::LogManager::GetLogger("dispatch")->debug(__VA_ARGS__)
#define LOG_DISPATCH_INFO(...) meshwire::util::LogManager::GetLogger("dispatch")->info(__VA_ARGS__)
#define LOG_DISPATCH_WARN(...) meshwire::util::LogManager::GetLogger("dispatch")->warn(__VA_ARGS__)
#define LOG_DISPATCH_ERROR(...) meshwire::util::LogManager::GetLogger("dispatch")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Use for every line a remote peer can trigger (malformed frames, unknown
// handlers, responses for evicted sessions). 200 lines/hour per callsite.

#include "util/rate_limiter.hpp"

#define MESHWIRE_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define MESHWIRE_LOG_RL_(component, level, ...)                                                                        \
  do {                                                                                                                 \
    if (meshwire::util::RateLimiter::instance().should_log(MESHWIRE_CALLSITE_KEY_, 200, std::chrono::hours(1))) {      \
      meshwire::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...) MESHWIRE_LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR_RL(...) MESHWIRE_LOG_RL_("network", error, __VA_ARGS__)
#define LOG_SESSION_WARN_RL(...) MESHWIRE_LOG_RL_("session", warn, __VA_ARGS__)
#define LOG_DISPATCH_WARN_RL(...) MESHWIRE_LOG_RL_("dispatch", warn, __VA_ARGS__)
#define LOG_DISPATCH_ERROR_RL(...) MESHWIRE_LOG_RL_("dispatch", error, __VA_ARGS__)
