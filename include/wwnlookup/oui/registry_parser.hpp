/**
 * @file registry_parser.hpp
 * @author Carlos Salguero
 * @brief IEEE OUI registry text parser
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Parses the line-oriented IEEE registry document (oui.txt), in which each
 * assignment appears as
 *
 *   00-00-0C   (hex)\t\tCisco Systems, Inc
 *
 * interspersed with address and "(base 16)" lines that are ignored.
 */

#pragma once

#include "../core/types.hpp"
#include <optional>
#include <string_view>
#include <utility>

namespace wwnlookup::oui {
/**
 * @brief Parse a single registry line
 *
 * Returns the lowercase 6-digit key and the vendor name, or std::nullopt
 * when the line is not an "XX-XX-XX (hex) Vendor" assignment.
 */
[[nodiscard]] std::optional<std::pair<core::OuiKey, std::string>>
parse_line(std::string_view line);

/**
 * @brief Parse a whole registry document
 *
 * Non-matching lines are skipped. When a key appears twice the last
 * occurrence wins. Never fails; empty input gives an empty map.
 */
[[nodiscard]] core::OuiMap parse(std::string_view text);
} // namespace wwnlookup::oui
