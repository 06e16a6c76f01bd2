/**
 * @file formatter.cpp
 * @author Carlos Salguero
 * @brief WWN formatter implementation
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/wwn/decoder.hpp>
#include <wwnlookup/wwn/formatter.hpp>

namespace wwnlookup::wwn {
std::string colon_pairs(std::string_view hex) {
  std::string result;
  result.reserve(hex.size() + hex.size() / 2);

  for (std::size_t i = 0; i < hex.size(); i += 2) {
    if (i > 0)
      result += ':';

    result += hex.substr(i, 2);
  }

  return result;
}

std::string vendor_specific_nice_wwn(std::string_view wwn) {
  auto sequence = vendor_sequence(wwn);
  if (!sequence) {
    return {};
  }

  std::string result = fmt::format("[{}]", colon_pairs(*sequence));
  if (auto extension = vendor_specific_extension(wwn)) {
    result += fmt::format("[{}]", colon_pairs(*extension));
  }

  return result;
}

std::string nice_wwn(std::string_view wwn) {
  auto kind = naa(wwn);
  auto id = oui(wwn);
  if (!kind || !id) {
    return {};
  }

  return fmt::format("[{}][{}]{}", naa_to_string(*kind), colon_pairs(*id),
                     vendor_specific_nice_wwn(wwn));
}

std::optional<std::string> vendor_from_wwn(std::string_view wwn,
                                           const oui::OuiRegistry &registry) {
  auto id = oui(wwn);
  if (!id) {
    return std::nullopt;
  }

  return registry.resolve(*id);
}
} // namespace wwnlookup::wwn
