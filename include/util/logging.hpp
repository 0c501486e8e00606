// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace rdvp {
namespace util {

/**
 * Logging configuration
 *
 * level: global minimum level (trace, debug, info, warn, error, critical, off)
 * file: if non-empty, log JSON lines to this file only (no console output)
 * component_levels: per-component overrides applied after the global level
 */
struct LogConfig {
  std::string level = "info";
  std::string file;
  std::map<std::string, std::string> component_levels;
};

// Formatter for the log file: one JSON object per line (ts, logger, level, msg)
std::unique_ptr<spdlog::formatter> MakeJsonLineFormatter();

/**
 * Logging utility wrapper around spdlog
 *
 * Builds one named logger per component sharing the same sinks. Components
 * get their logger injected at construction; GetLogger() is the factory used
 * to produce those handles (and by the LOG_* macros in main).
 *
 * Initialize() is also the single place that installs a process-wide
 * default: spdlog's default logger is replaced by our "default" logger so
 * code logging through spdlog::info() and friends lands in the configured
 * sinks.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const LogConfig &config = LogConfig{});

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "app", "network", "storage")
   *
   * Auto-initializes if not initialized. Unknown names get the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");
};

} // namespace util
} // namespace rdvp

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  rdvp::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  rdvp::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  rdvp::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  rdvp::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  rdvp::util::LogManager::GetLogger()->error(__VA_ARGS__)
