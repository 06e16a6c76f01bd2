/**
 * @file logger.cpp
 * @author Carlos Salguero
 * @brief Logger implementation
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/utils/expected.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace wwnlookup::core {
namespace {
constexpr std::string_view LOGGER_NAME = "wwnlookup";
constexpr std::size_t QUEUE_SIZE = 8192;
} // namespace

utils::Expected<LogLevel> parse_log_level(std::string_view name) {
  if (name == "trace")
    return LogLevel::Trace;

  if (name == "debug")
    return LogLevel::Debug;

  if (name == "info")
    return LogLevel::Info;

  if (name == "warn" || name == "warning")
    return LogLevel::Warning;

  if (name == "error")
    return LogLevel::Error;

  if (name == "critical")
    return LogLevel::Critical;

  if (name == "off")
    return LogLevel::Off;

  return tl::unexpected{utils::Error{utils::ErrorCategory::Configuration,
                                     fmt::format("Unknown log level: {}", name)}};
}

utils::Result Logger::initialize(const LoggerConfig &config) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

      console_sink->set_pattern(config.pattern);
      sinks.push_back(console_sink);
    }

    if (config.enable_file) {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          config.log_file, config.max_file_size, config.max_files);

      file_sink->set_pattern(config.pattern);
      sinks.push_back(file_sink);
    }

    if (!spdlog::thread_pool()) {
      spdlog::init_thread_pool(QUEUE_SIZE, 1);
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        std::string{LOGGER_NAME}, sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(std::string{LOGGER_NAME});
    spdlog::register_logger(logger);

    m_instance = std::unique_ptr<Logger>(new Logger(logger, config.level));
    return {};
  } catch (const spdlog::spdlog_ex &ex) {
    return tl::unexpected{utils::Error{
        utils::ErrorCategory::Configuration,
        fmt::format("Failed to initialize logger: {}", ex.what())}};
  }
}

Logger &Logger::instance() {
  static std::once_flag defaults_flag;

  std::call_once(defaults_flag, [] {
    if (!m_instance) {
      LoggerConfig default_config;
      initialize(default_config).value();
    }
  });

  return *m_instance;
}
} // namespace wwnlookup::core
