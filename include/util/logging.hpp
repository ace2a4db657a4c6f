// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kadcast {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "routing", "transport"),
 * all sharing the same sinks. Unknown component names resolve to "default".
 *
 * Thread-safety: all methods are thread-safe. Initialization happens once;
 * GetLogger() auto-initializes with logging switched off, so library code
 * may log before (or without) the host application configuring anything.
 */
class LogManager {
public:
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "kadcast.log");

  // Flushes and drops all loggers. A later GetLogger() re-initializes.
  static void Shutdown();

  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);

  static void SetComponentLevel(const std::string& component, const std::string& level);

  static bool IsInitialized();
};

}  // namespace util
}  // namespace kadcast

#define LOG_TRACE(...) kadcast::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) kadcast::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) kadcast::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) kadcast::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) kadcast::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) kadcast::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) kadcast::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) kadcast::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) kadcast::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) kadcast::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_ROUTING_TRACE(...) kadcast::util::LogManager::GetLogger("routing")->trace(__VA_ARGS__)
#define LOG_ROUTING_DEBUG(...) kadcast::util::LogManager::GetLogger("routing")->debug(__VA_ARGS__)
#define LOG_ROUTING_INFO(...) kadcast::util::LogManager::GetLogger("routing")->info(__VA_ARGS__)
#define LOG_ROUTING_WARN(...) kadcast::util::LogManager::GetLogger("routing")->warn(__VA_ARGS__)

#define LOG_TRANSPORT_TRACE(...) kadcast::util::LogManager::GetLogger("transport")->trace(__VA_ARGS__)
#define LOG_TRANSPORT_DEBUG(...) kadcast::util::LogManager::GetLogger("transport")->debug(__VA_ARGS__)
#define LOG_TRANSPORT_INFO(...) kadcast::util::LogManager::GetLogger("transport")->info(__VA_ARGS__)
#define LOG_TRANSPORT_WARN(...) kadcast::util::LogManager::GetLogger("transport")->warn(__VA_ARGS__)
#define LOG_TRANSPORT_ERROR(...) kadcast::util::LogManager::GetLogger("transport")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For anything a remote peer can trigger with a single datagram (malformed
// packets, spoofed headers, send failures towards a dead endpoint).
// 200 lines per hour per callsite.

#include "util/rate_limiter.hpp"

#define KADCAST_CALLSITE_ (kadcast::util::RateLimiter::Callsite{__FILE__, __LINE__})

#define KADCAST_LOG_RL_(component, level, ...)                                                                         \
  do {                                                                                                                 \
    if (kadcast::util::RateLimiter::instance().should_log(KADCAST_CALLSITE_, 200, std::chrono::hours(1))) {            \
      kadcast::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) KADCAST_LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_ERROR_RL(...) KADCAST_LOG_RL_("default", error, __VA_ARGS__)
#define LOG_NET_DEBUG_RL(...) KADCAST_LOG_RL_("network", debug, __VA_ARGS__)
#define LOG_NET_WARN_RL(...) KADCAST_LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR_RL(...) KADCAST_LOG_RL_("network", error, __VA_ARGS__)
#define LOG_TRANSPORT_DEBUG_RL(...) KADCAST_LOG_RL_("transport", debug, __VA_ARGS__)
#define LOG_TRANSPORT_WARN_RL(...) KADCAST_LOG_RL_("transport", warn, __VA_ARGS__)
