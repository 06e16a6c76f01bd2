/**
 * @file decoder.cpp
 * @author Carlos Salguero
 * @brief WWN decoder implementation
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/wwn/decoder.hpp>

namespace wwnlookup::wwn {
namespace {
/**
 * @brief Normalized WWN together with its NAA, or std::nullopt
 */
struct Classified {
  std::string text;
  Naa naa;
};

/**
 * Every slice below ends at or before digit 16, so anything shorter than a
 * 64-bit WWN is rejected instead of being indexed past its end.
 */
std::optional<Classified> classify(std::string_view wwn) {
  std::string text = normalize(wwn);
  if (text.size() < WWN64_HEX_DIGITS || !core::hex::is_hex(text)) {
    return std::nullopt;
  }

  const char digit = text.front();
  switch (digit) {
  case '1':
  case '2':
  case '5':
  case '6':
    return Classified{std::move(text), static_cast<Naa>(digit)};
  default:
    return std::nullopt;
  }
}
} // namespace

std::string_view naa_to_string(Naa naa) noexcept {
  switch (naa) {
  case Naa::Ieee:
    return "1";
  case Naa::IeeeExtended:
    return "2";
  case Naa::IeeeRegistered:
    return "5";
  case Naa::IeeeRegisteredExtended:
    return "6";
  }

  return "?";
}

std::string_view naa_description(Naa naa) noexcept {
  switch (naa) {
  case Naa::Ieee:
    return "IEEE 48-bit";
  case Naa::IeeeExtended:
    return "IEEE Extended";
  case Naa::IeeeRegistered:
    return "IEEE Registered";
  case Naa::IeeeRegisteredExtended:
    return "IEEE Registered Extended";
  }

  return "Unknown";
}

std::string normalize(std::string_view input) {
  return core::hex::strip_and_lower(input, ":");
}

bool is_valid(std::string_view input) {
  std::string text = normalize(input);
  return (text.size() == WWN64_HEX_DIGITS ||
          text.size() == WWN128_HEX_DIGITS) &&
         core::hex::is_hex(text);
}

std::optional<Naa> naa(std::string_view wwn) {
  auto classified = classify(wwn);
  if (!classified) {
    return std::nullopt;
  }

  return classified->naa;
}

std::optional<core::OuiKey> oui(std::string_view wwn) {
  auto classified = classify(wwn);
  if (!classified) {
    return std::nullopt;
  }

  switch (classified->naa) {
  case Naa::Ieee:
  case Naa::IeeeExtended:
    return classified->text.substr(4, core::OUI_HEX_DIGITS);
  case Naa::IeeeRegistered:
  case Naa::IeeeRegisteredExtended:
    return classified->text.substr(1, core::OUI_HEX_DIGITS);
  }

  return std::nullopt;
}

std::optional<core::HexString> vendor_sequence(std::string_view wwn) {
  auto classified = classify(wwn);
  if (!classified) {
    return std::nullopt;
  }

  switch (classified->naa) {
  case Naa::Ieee:
  case Naa::IeeeExtended:
    return classified->text.substr(10);
  case Naa::IeeeRegistered:
    return classified->text.substr(7);
  case Naa::IeeeRegisteredExtended:
    return classified->text.substr(7, WWN64_HEX_DIGITS - 7);
  }

  return std::nullopt;
}

std::optional<core::HexString>
vendor_specific_extension(std::string_view wwn) {
  auto classified = classify(wwn);
  if (!classified || classified->naa != Naa::IeeeRegisteredExtended) {
    return std::nullopt;
  }

  // A 64-bit NAA 6 WWN has no room for the extension
  if (classified->text.size() <= WWN64_HEX_DIGITS) {
    return std::nullopt;
  }

  return classified->text.substr(WWN64_HEX_DIGITS);
}

utils::Expected<WwnFields> WwnFields::decode(std::string_view wwn) {
  std::string text = normalize(wwn);
  if (!is_valid(text)) {
    return tl::unexpected{utils::make_validation_error(
        fmt::format("WWN must be 16 or 32 hex digits: '{}'", wwn))};
  }

  auto kind = wwnlookup::wwn::naa(text);
  if (!kind) {
    return tl::unexpected{utils::make_validation_error(
        fmt::format("Unsupported NAA '{}' in WWN {}", text.front(), text))};
  }

  // The NAA check above guarantees the remaining extractors succeed
  WwnFields fields{.normalized = text,
                   .naa = *kind,
                   .oui = *wwnlookup::wwn::oui(text),
                   .vendor_sequence = *wwnlookup::wwn::vendor_sequence(text),
                   .vendor_specific_extension =
                       wwnlookup::wwn::vendor_specific_extension(text)};

  WL_TRACE(core::LogContext{}
               .with("naa", naa_to_string(fields.naa))
               .with("oui", fields.oui),
           "Decoded WWN {}", fields.normalized);
  return fields;
}
} // namespace wwnlookup::wwn
