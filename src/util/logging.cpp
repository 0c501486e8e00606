// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace rdvp {
namespace util {

namespace {

constexpr const char *CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
// One JSON object per line when logging to a file; %* is the quoted,
// escaped message
constexpr const char *FILE_PATTERN =
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%e%z","logger":"%n","level":"%l","msg":%*})";

class JsonMessageFlag : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg &msg, const std::tm &,
              spdlog::memory_buf_t &dest) override {
    std::string text(msg.payload.data(), msg.payload.size());
    std::string quoted = nlohmann::json(text).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    dest.append(quoted.data(), quoted.data() + quoted.size());
  }

  std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
    return std::make_unique<JsonMessageFlag>();
  }
};

const std::vector<std::string> &Components() {
  static const std::vector<std::string> components = {
      "default", "app", "network", "storage", "rendezvous", "crypto"};
  return components;
}

} // namespace

std::unique_ptr<spdlog::formatter> MakeJsonLineFormatter() {
  auto formatter = std::make_unique<spdlog::pattern_formatter>();
  formatter->add_flag<JsonMessageFlag>('*').set_pattern(FILE_PATTERN);
  return formatter;
}

// Thread-safe initialization using std::call_once
static std::once_flag s_init_flag;

// Mutex protecting s_loggers map access (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

// Internal initialization function (called via std::call_once)
static void InitializeInternal(const LogConfig &config) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (!config.file.empty()) {
      namespace fs = std::filesystem;
      try {
        fs::path p(config.file);
        if (p.has_parent_path()) {
          std::error_code ec;
          fs::create_directories(p.parent_path(), ec);
        }
        // Rotating file sink (max 10MB per file, 3 files total = 30MB max)
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), 10 * 1024 * 1024, 3);
        file_sink->set_formatter(MakeJsonLineFormatter());
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
        sinks.clear();
      }
    }

    if (sinks.empty()) {
      // stdout is reserved for command output (genkey)
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern(CONSOLE_PATTERN);
      sinks.push_back(console_sink);
    }

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    const auto global_level = spdlog::level::from_str(config.level);
    for (const auto &component : Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(global_level);
      auto override_it = config.component_levels.find(component);
      if (override_it != config.component_levels.end()) {
        logger->set_level(spdlog::level::from_str(override_it->second));
      }
      logger->flush_on(spdlog::level::trace);

      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    if (config.level != "off") {
      s_loggers["default"]->debug("Logging system initialized (level: {})",
                                  config.level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Initialize(const LogConfig &config) {
  std::call_once(s_init_flag, InitializeInternal, config);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Loggers are gone (after Shutdown, or a failed init): hand out a silent
  // console logger so late callers never get a null handle.
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

} // namespace util
} // namespace rdvp
