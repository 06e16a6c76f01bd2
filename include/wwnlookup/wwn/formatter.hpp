/**
 * @file formatter.hpp
 * @author Carlos Salguero
 * @brief Human-readable WWN rendering and vendor lookup
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include "../core/types.hpp"
#include "../oui/registry.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace wwnlookup::wwn {
/**
 * @brief Split hex text into 2-character groups joined by ':'
 *
 * An odd trailing character forms its own group.
 */
[[nodiscard]] std::string colon_pairs(std::string_view hex);

/**
 * @brief Bracketed form, e.g. "[5][06:01:60][08:60:2c:04]"
 *
 * NAA, OUI and vendor sequence, followed by the vendor-specific
 * extension for 128-bit WWNs. Empty for input that does not decode.
 */
[[nodiscard]] std::string nice_wwn(std::string_view wwn);

/**
 * @brief Only the vendor sequence and extension brackets
 */
[[nodiscard]] std::string vendor_specific_nice_wwn(std::string_view wwn);

/**
 * @brief Vendor name of the OUI embedded in the WWN
 */
[[nodiscard]] std::optional<std::string>
vendor_from_wwn(std::string_view wwn, const oui::OuiRegistry &registry);
} // namespace wwnlookup::wwn
