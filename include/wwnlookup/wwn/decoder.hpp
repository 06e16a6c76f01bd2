/**
 * @file decoder.hpp
 * @author Carlos Salguero
 * @brief World Wide Name (WWN) structural decoder
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Normalizes, validates and decomposes 64-bit and 128-bit World Wide Names
 * as used by Fibre Channel and SAS into NAA, OUI, vendor sequence and the
 * NAA 6 vendor-specific extension.
 */

#pragma once

#include "../core/types.hpp"
#include "../utils/expected.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace wwnlookup::wwn {
/**
 * @brief Network Address Authority, the leading hex digit of a WWN
 *
 * Selects the field layout of the remaining digits.
 */
enum class Naa : char {
  Ieee = '1',                  ///< IEEE 48-bit, 64-bit WWN
  IeeeExtended = '2',          ///< IEEE extended, 64-bit WWN
  IeeeRegistered = '5',        ///< IEEE registered, 64-bit WWN
  IeeeRegisteredExtended = '6' ///< IEEE registered extended, 128-bit WWN
};

/**
 * @brief Hex digits of a 64-bit WWN
 */
inline constexpr std::size_t WWN64_HEX_DIGITS = 16;

/**
 * @brief Hex digits of a 128-bit WWN
 */
inline constexpr std::size_t WWN128_HEX_DIGITS = 32;

/**
 * @brief The NAA digit as it appears in the WWN ("1", "2", "5", "6")
 */
[[nodiscard]] std::string_view naa_to_string(Naa naa) noexcept;

/**
 * @brief Human-readable name of the NAA format
 */
[[nodiscard]] std::string_view naa_description(Naa naa) noexcept;

/**
 * @brief Strip ':' separators and lowercase
 *
 * Does not validate length or character set.
 */
[[nodiscard]] std::string normalize(std::string_view input);

/**
 * @brief Check that the normalized input is 16 or 32 hex digits
 */
[[nodiscard]] bool is_valid(std::string_view input);

/**
 * @brief NAA of a WWN
 *
 * Returns std::nullopt when the leading digit is not one of 1, 2, 5, 6, or
 * when the normalized input is shorter than 16 digits or contains non-hex
 * characters. Every extractor below depends on this and yields
 * std::nullopt in the same cases; use is_valid() for the exact length
 * check.
 */
[[nodiscard]] std::optional<Naa> naa(std::string_view wwn);

/**
 * @brief The 6-digit OUI
 *
 * NAA 1/2: digits [4, 10). NAA 5/6: digits [1, 7).
 */
[[nodiscard]] std::optional<core::OuiKey> oui(std::string_view wwn);

/**
 * @brief Vendor-assigned digits following the OUI
 *
 * NAA 1/2: [10, end). NAA 5: [7, end). NAA 6: [7, 16).
 */
[[nodiscard]] std::optional<core::HexString>
vendor_sequence(std::string_view wwn);

/**
 * @brief Digits [16, end) of an NAA 6 WWN; std::nullopt for other types
 * and for 64-bit NAA 6 input
 */
[[nodiscard]] std::optional<core::HexString>
vendor_specific_extension(std::string_view wwn);

/**
 * @brief All decoded fields of a WWN
 */
struct WwnFields {
  core::HexString normalized;
  Naa naa;
  core::OuiKey oui;
  core::HexString vendor_sequence;
  std::optional<core::HexString> vendor_specific_extension;

  /**
   * @brief Decode every field, or report why the input cannot be decoded
   */
  [[nodiscard]] static utils::Expected<WwnFields> decode(std::string_view wwn);

  /**
   * @brief Check if this is a 128-bit WWN
   */
  [[nodiscard]] bool is_extended() const noexcept {
    return vendor_specific_extension.has_value();
  }

  [[nodiscard]] bool operator==(const WwnFields &) const = default;
};
} // namespace wwnlookup::wwn
