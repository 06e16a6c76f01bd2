/**
 * @file registry_parser.cpp
 * @author Carlos Salguero
 * @brief IEEE OUI registry parser implementation
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/oui/registry_parser.hpp>

#include <regex>

namespace wwnlookup::oui {
namespace {
constexpr std::string_view WHITESPACE = " \t\r\n";

/// Columns the registry places between "(hex)" and the organization name
constexpr std::size_t VENDOR_PADDING = 2;

const std::regex &assignment_pattern() {
  static const std::regex pattern{
      R"(^([0-9A-Fa-f]{2})-([0-9A-Fa-f]{2})-([0-9A-Fa-f]{2})\s+\([^)]*\)(.*)$)"};
  return pattern;
}

std::string_view trim(std::string_view text) noexcept {
  auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string_view::npos) {
    return {};
  }

  auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}
} // namespace

std::optional<std::pair<core::OuiKey, std::string>>
parse_line(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  if (line.size() < 8 || line[2] != '-' || line[5] != '-') {
    return std::nullopt;
  }

  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_match(line.begin(), line.end(), match,
                        assignment_pattern())) {
    return std::nullopt;
  }

  core::OuiKey key =
      core::hex::strip_and_lower(match.str(1) + match.str(2) + match.str(3), "");

  std::string_view vendor{line};
  vendor.remove_prefix(static_cast<std::size_t>(match.position(4)));

  for (std::size_t i = 0; i < VENDOR_PADDING && !vendor.empty() &&
                          WHITESPACE.find(vendor.front()) != std::string_view::npos;
       ++i) {
    vendor.remove_prefix(1);
  }

  vendor = trim(vendor);
  if (vendor.empty()) {
    return std::nullopt;
  }

  return std::make_pair(std::move(key), std::string{vendor});
}

core::OuiMap parse(std::string_view text) {
  core::OuiMap result;
  std::size_t line_num = 0;
  std::size_t pos = 0;

  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }

    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;
    line_num++;

    auto parsed = parse_line(line);
    if (!parsed) {
      continue;
    }

    auto [key, vendor] = std::move(*parsed);
    WL_TRACE("OUI line {}: {} -> {}", line_num, key, vendor);
    result.insert_or_assign(std::move(key), std::move(vendor));
  }

  WL_DEBUG(core::LogContext{}.with("lines", line_num).with("entries",
                                                           result.size()),
           "Parsed OUI registry text");
  return result;
}
} // namespace wwnlookup::oui
