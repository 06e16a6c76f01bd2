/**
 * @file expected.hpp
 * @author Carlos Salguero
 * @brief Error handling utilities using tl::expected
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Go-style error handling for wwnlookup built on tl::expected. Fallible
 * operations return Expected<T> instead of throwing exceptions.
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>
#include <system_error>
#include <tl/expected.hpp>

namespace wwnlookup::utils {
/**
 * @brief Error categories for different subsystems.
 */
enum class ErrorCategory : std::uint8_t {
  Unknown = 0,
  Network,       ///< Registry download errors
  Parse,         ///< Registry text parsing errors
  Configuration, ///< Logger or registry configuration errors
  FileSystem,    ///< Cache file I/O errors
  Validation     ///< Malformed WWN or OUI input
};

/**
 * @brief Detailed error information with context
 *
 * Carries category, message, source location and an optional system
 * error code.
 */
struct Error {
  ErrorCategory category{ErrorCategory::Unknown};
  std::string message;
  std::source_location location{std::source_location::current()};
  std::error_code system_error;

  explicit Error(
      ErrorCategory cat, std::string_view msg,
      std::source_location loc = std::source_location::current()) noexcept
      : category{cat}, message{msg}, location{loc} {}

  Error(ErrorCategory cat, std::string_view msg, std::error_code ec,
        std::source_location loc = std::source_location::current()) noexcept
      : category{cat}, message{msg}, location{loc}, system_error{ec} {}

  /**
   * @brief Get formatted error message with context
   */
  [[nodiscard]] std::string what() const {
    std::string result = fmt::format("[{}:{}] {}: {}", location.file_name(),
                                     location.line(), category_name(), message);

    if (system_error) {
      result += fmt::format(" (system: {})", system_error.message());
    }

    return result;
  }

  /**
   * @brief Get human-readable category name
   */
  [[nodiscard]] std::string_view category_name() const noexcept {
    switch (category) {
    case ErrorCategory::Network:
      return "Network";
    case ErrorCategory::Parse:
      return "Parse";
    case ErrorCategory::Configuration:
      return "Configuration";
    case ErrorCategory::FileSystem:
      return "FileSystem";
    case ErrorCategory::Validation:
      return "Validation";
    case ErrorCategory::Unknown:
    default:
      return "Unknown";
    }
  }
};

/**
 * @brief Primary return type for all fallible operations.
 */
template <typename T> using Expected = tl::expected<T, Error>;

/**
 * @brief Operations that can fail without returning a value.
 */
using Result = Expected<void>;

/**
 * @brief Try macro for early return on error
 *
 * Usage:
 *  auto text = WL_TRY(source.read_cache(path));
 */
#define WL_TRY(expr)                                                           \
  ({                                                                           \
    auto &&_wl_result = (expr);                                                \
    if (!_wl_result) [[unlikely]] {                                            \
      return tl::unexpected{std::move(_wl_result.error())};                    \
    }                                                                          \
    std::move(*_wl_result);                                                    \
  })

/**
 * @brief Try macro that only checks for errors without unwrapping value
 *
 * Usage: WL_TRY_VOID(core::Logger::initialize(config));
 */
#define WL_TRY_VOID(expr)                                                      \
  do {                                                                         \
    auto &&_wl_result = (expr);                                                \
    if (!_wl_result) [[unlikely]] {                                            \
      return tl::unexpected{std::move(_wl_result.error())};                    \
    }                                                                          \
  } while (0)

/**
 * @brief Convert system error codes to wwnlookup errors
 */
[[nodiscard]] inline Error make_system_error(
    ErrorCategory category, std::string_view message, int error_code,
    std::source_location loc = std::source_location::current()) noexcept {
  return Error{category, message, std::make_error_code(std::errc{error_code}),
               loc};
}

/**
 * @brief Convert errno to wwnlookup error
 */
[[nodiscard]] inline Error make_errno_error(
    ErrorCategory category, std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept {
  return make_system_error(category, message, errno, loc);
}

/**
 * @brief Create validation error for invalid input
 */
[[nodiscard]] inline Error make_validation_error(
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept {
  return Error{ErrorCategory::Validation, message, loc};
}

/**
 * @brief Create network error
 */
[[nodiscard]] inline Error make_network_error(
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept {
  return Error{ErrorCategory::Network, message, loc};
}

/**
 * @brief Create filesystem error
 */
[[nodiscard]] inline Error make_filesystem_error(
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept {
  return Error{ErrorCategory::FileSystem, message, loc};
}
} // namespace wwnlookup::utils

/**
 * @brief Format support for Error type
 */
template <> struct fmt::formatter<wwnlookup::utils::Error> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const wwnlookup::utils::Error &error, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", error.what());
  }
};
