/**
 * @file types.hpp
 * @author Carlos Salguero
 * @brief Core types, concepts, and utilities for wwnlookup
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Fundamental types and helpers shared by the WWN decoder and the OUI
 * registry. All headers should include this file to access common types.
 */

#pragma once

#include "wwnlookup/utils/expected.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wwnlookup::core {
// Fundamental types
/**
 * @brief Lowercase hexadecimal text (normalized WWN, OUI, sequence)
 */
using HexString = std::string;

/**
 * @brief Six lowercase hex digits identifying a vendor (24-bit OUI)
 */
using OuiKey = std::string;

/**
 * @brief OUI key to vendor display name
 */
using OuiMap = std::unordered_map<OuiKey, std::string>;

/**
 * @brief Number of hex digits in an OUI
 */
inline constexpr std::size_t OUI_HEX_DIGITS = 6;

// Utility types and functions
/**
 * @brief Non-copyable base class
 *
 * Inherit from this to make a class move-only
 */
class NonCopyable {
protected:
  NonCopyable() = default;
  ~NonCopyable() = default;
  NonCopyable(const NonCopyable &) = delete;
  NonCopyable &operator=(const NonCopyable &) = delete;
  NonCopyable(NonCopyable &&) = default;
  NonCopyable &operator=(NonCopyable &&) = default;
};

/**
 * @brief Hex text helpers
 */
namespace hex {
[[nodiscard]] constexpr bool is_digit(char c) noexcept {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

[[nodiscard]] constexpr char to_lower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/**
 * @brief Check that every character is a hex digit (empty is false)
 */
[[nodiscard]] constexpr bool is_hex(std::string_view text) noexcept {
  return !text.empty() && std::all_of(text.begin(), text.end(), is_digit);
}

/**
 * @brief Copy of text with the given separators removed and letters
 * lowercased
 */
[[nodiscard]] inline std::string strip_and_lower(std::string_view text,
                                                 std::string_view separators) {
  std::string result;
  result.reserve(text.size());

  for (char c : text) {
    if (separators.find(c) == std::string_view::npos) {
      result += to_lower(c);
    }
  }

  return result;
}
} // namespace hex
} // namespace wwnlookup::core
