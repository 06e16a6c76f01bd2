/**
 * @file logger.hpp
 * @author Carlos Salguero
 * @brief Structured logging system for wwnlookup
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Thread-safe logging built on spdlog with structured key=value context
 * and optional rotating file output.
 */

#pragma once

#include "wwnlookup/core/types.hpp"
#include "wwnlookup/utils/expected.hpp"

#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string_view>
#include <type_traits>

namespace wwnlookup::core {
/**
 * @brief Log level enumeration
 *
 * Maps to spdlog levels
 */
enum class LogLevel : std::uint8_t {
  Trace = 0,    ///< Very detailed debug information
  Debug = 1,    ///< General debug information
  Info = 2,     ///< Informational messages
  Warning = 3,  ///< Warning conditions
  Error = 4,    ///< Error conditions
  Critical = 5, ///< Critical error conditions
  Off = 6       ///< Disable logging
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off")
 */
[[nodiscard]] utils::Expected<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Structured log context for adding metadata to log entries.
 *
 * Fluent interface appending ` key=value` pairs to a log line.
 */
class LogContext {
public:
  LogContext() = default;

  /**
   * @brief Add key-value pair to log context
   */
  template <typename T> LogContext &with(std::string_view key, T &&value) & {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>>) {
      m_context += fmt::format(" {}={}", key, value);
    } else {
      m_context += fmt::format(" {}=\"{}\"", key, value);
    }

    return *this;
  }

  /**
   * @brief Add key-value pair to log context (rvalue overload)
   */
  template <typename T> LogContext &&with(std::string_view key, T &&value) && {
    return std::move(with(key, std::forward<T>(value)));
  }

  /**
   * @brief Add error information to context
   */
  LogContext &with_error(const utils::Error &error) & {
    return with("error_category", error.category_name())
        .with("error_message", error.message);
  }

  LogContext &&with_error(const utils::Error &error) && {
    return std::move(with_error(error));
  }

  /**
   * @brief Get formatted context string
   */
  [[nodiscard]] const std::string &str() const noexcept { return m_context; }

private:
  std::string m_context;
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
  LogLevel level{LogLevel::Info};
  std::string log_file{"wwnlookup.log"};
  std::size_t max_file_size{10 * 1024 * 1024}; ///< 10MB default
  std::size_t max_files{5};
  bool enable_console{true};
  bool enable_file{false};
  std::string pattern{"[%Y-%m-%d %H:%M:%S.%f] [%l] %v"};
};

/**
 * @brief Logger with structured logging support
 *
 * Process-wide logger built on spdlog. Console output goes to stderr so
 * that command output on stdout stays machine readable.
 */
class Logger : public NonCopyable {
public:
  /**
   * @brief Initialize global logger with configuration
   *
   * May be called again to replace the active configuration, before
   * other threads start logging.
   */
  [[nodiscard]] static utils::Result initialize(const LoggerConfig &config);

  /**
   * @brief Get global logger instance, initializing defaults on first use
   */
  [[nodiscard]] static Logger &instance();

  /**
   * @brief Check if logging is enabled for given level
   */
  [[nodiscard]] bool should_log(LogLevel level) const noexcept {
    return level >= m_current_level && level != LogLevel::Off;
  }

  /**
   * @brief Log message with context
   */
  template <typename... Args>
  void log(LogLevel level, const LogContext &context,
           fmt::format_string<Args...> format, Args &&...args) {
    if (!should_log(level)) [[likely]] {
      return;
    }

    auto message = fmt::format(format, std::forward<Args>(args)...);
    m_spdlog_logger->log(to_spdlog_level(level), "{}{}", message,
                         context.str());
  }

  /**
   * @brief Log message without context
   */
  template <typename... Args>
  void log(LogLevel level, fmt::format_string<Args...> format,
           Args &&...args) {
    log(level, LogContext{}, format, std::forward<Args>(args)...);
  }

  // Convenience methods for different log levels
  template <typename... Args>
  void trace(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Trace, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void trace(const LogContext &context, fmt::format_string<Args...> format,
             Args &&...args) {
    log(LogLevel::Trace, context, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Debug, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const LogContext &context, fmt::format_string<Args...> format,
             Args &&...args) {
    log(LogLevel::Debug, context, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Info, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const LogContext &context, fmt::format_string<Args...> format,
            Args &&...args) {
    log(LogLevel::Info, context, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Warning, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const LogContext &context, fmt::format_string<Args...> format,
               Args &&...args) {
    log(LogLevel::Warning, context, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Error, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const LogContext &context, fmt::format_string<Args...> format,
             Args &&...args) {
    log(LogLevel::Error, context, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(fmt::format_string<Args...> format, Args &&...args) {
    log(LogLevel::Critical, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(const LogContext &context, fmt::format_string<Args...> format,
                Args &&...args) {
    log(LogLevel::Critical, context, format, std::forward<Args>(args)...);
  }

private:
  std::shared_ptr<spdlog::logger> m_spdlog_logger;
  LogLevel m_current_level{LogLevel::Info};

private:
  static inline std::unique_ptr<Logger> m_instance;

private:
  explicit Logger(std::shared_ptr<spdlog::logger> logger, LogLevel level)
      : m_spdlog_logger{std::move(logger)}, m_current_level{level} {}

  [[nodiscard]] static spdlog::level::level_enum
  to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Trace:
      return spdlog::level::trace;
    case LogLevel::Debug:
      return spdlog::level::debug;
    case LogLevel::Info:
      return spdlog::level::info;
    case LogLevel::Warning:
      return spdlog::level::warn;
    case LogLevel::Error:
      return spdlog::level::err;
    case LogLevel::Critical:
      return spdlog::level::critical;
    case LogLevel::Off:
      return spdlog::level::off;
    }

    return spdlog::level::info;
  }
};

// Convenience macros for logging
/**
 * @brief Get global logger instance
 */
#define WL_LOG() ::wwnlookup::core::Logger::instance()

/**
 * @brief Convenience macros for different log levels
 */
#define WL_TRACE(...) WL_LOG().trace(__VA_ARGS__)
#define WL_DEBUG(...) WL_LOG().debug(__VA_ARGS__)
#define WL_INFO(...) WL_LOG().info(__VA_ARGS__)
#define WL_WARNING(...) WL_LOG().warning(__VA_ARGS__)
#define WL_ERROR_LOG(...) WL_LOG().error(__VA_ARGS__)
#define WL_CRITICAL(...) WL_LOG().critical(__VA_ARGS__)

/**
 * @brief Log result of an operation and return error if failed
 */
#define WL_LOG_TRY(expr, message)                                              \
  ({                                                                           \
    auto &&_wl_result = (expr);                                                \
    if (!_wl_result) [[unlikely]] {                                            \
      WL_ERROR_LOG(                                                            \
          ::wwnlookup::core::LogContext{}.with_error(_wl_result.error()),      \
          "{}: {}", message, _wl_result.error().what());                       \
      return tl::unexpected{std::move(_wl_result.error())};                    \
    }                                                                          \
    std::move(*_wl_result);                                                    \
  })
} // namespace wwnlookup::core
