// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace bridgerelay {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to per-component loggers throughout the relayer.
 *
 * Thread-safety: All methods are thread-safe. Logger access is
 * protected by a mutex; the first GetLogger() call auto-initializes
 * with defaults if Initialize() has not been called yet.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "relayer.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "scan", "relay", "checkpoint")
   *
   * Returns the default logger if the component is unknown.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (scan, relay, checkpoint, rpc, app,
   * default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace bridgerelay

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  bridgerelay::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  bridgerelay::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  bridgerelay::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  bridgerelay::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  bridgerelay::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  bridgerelay::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_SCAN_TRACE(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("scan")->trace(__VA_ARGS__)
#define LOG_SCAN_DEBUG(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("scan")->debug(__VA_ARGS__)
#define LOG_SCAN_INFO(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("scan")->info(__VA_ARGS__)
#define LOG_SCAN_WARN(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("scan")->warn(__VA_ARGS__)
#define LOG_SCAN_ERROR(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("scan")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...)                                                   \
  bridgerelay::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...)                                                   \
  bridgerelay::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_INFO(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("relay")->info(__VA_ARGS__)
#define LOG_RELAY_WARN(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)
#define LOG_RELAY_ERROR(...)                                                   \
  bridgerelay::util::LogManager::GetLogger("relay")->error(__VA_ARGS__)

#define LOG_CKPT_TRACE(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("checkpoint")->trace(__VA_ARGS__)
#define LOG_CKPT_DEBUG(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("checkpoint")->debug(__VA_ARGS__)
#define LOG_CKPT_INFO(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("checkpoint")->info(__VA_ARGS__)
#define LOG_CKPT_WARN(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("checkpoint")->warn(__VA_ARGS__)
#define LOG_CKPT_ERROR(...)                                                    \
  bridgerelay::util::LogManager::GetLogger("checkpoint")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  bridgerelay::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  bridgerelay::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  bridgerelay::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  bridgerelay::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  bridgerelay::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
