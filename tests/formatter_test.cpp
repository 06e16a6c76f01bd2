/**
 * @file formatter_test.cpp
 * @author Carlos Salguero
 * @brief WWN formatter tests
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <gtest/gtest.h>
#include <wwnlookup/oui/registry.hpp>
#include <wwnlookup/wwn/formatter.hpp>

#include <string>

using namespace wwnlookup;

namespace {
/**
 * @brief Source serving a fixed cache document and no network
 */
class FixedSource final : public oui::RegistrySource {
public:
  explicit FixedSource(std::string text) : m_text{std::move(text)} {}

  utils::Expected<std::string>
  read_cache(const std::filesystem::path &) override {
    return m_text;
  }

  utils::Expected<std::string> fetch_network(std::string_view url) override {
    ADD_FAILURE() << "unexpected download of " << url;
    return tl::unexpected{utils::make_network_error("offline")};
  }

  utils::Result write_cache(const std::filesystem::path &,
                            std::string_view) override {
    return {};
  }

private:
  std::string m_text;
};
} // namespace

// =============================================================================
// colon_pairs
// =============================================================================

TEST(ColonPairsTest, JoinsTwoCharacterGroups) {
  EXPECT_EQ(wwn::colon_pairs("060160"), "06:01:60");
  EXPECT_EQ(wwn::colon_pairs("08602c04"), "08:60:2c:04");
  EXPECT_EQ(wwn::colon_pairs("ab"), "ab");
  EXPECT_EQ(wwn::colon_pairs(""), "");
}

TEST(ColonPairsTest, OddTrailingCharacterFormsOwnGroup) {
  EXPECT_EQ(wwn::colon_pairs("005b2c600"), "00:5b:2c:60:0");
  EXPECT_EQ(wwn::colon_pairs("a"), "a");
}

// =============================================================================
// nice_wwn
// =============================================================================

TEST(NiceWwnTest, RegisteredSixtyFourBit) {
  EXPECT_EQ(wwn::nice_wwn("50:06:01:60:08:60:2c:04"),
            "[5][06:01:60][08:60:2c:04]");
  EXPECT_EQ(wwn::nice_wwn("5006016008602C04"), "[5][06:01:60][08:60:2c:04]");
}

TEST(NiceWwnTest, IeeeSixtyFourBit) {
  EXPECT_EQ(wwn::nice_wwn("10:00:00:00:c9:12:34:56"),
            "[1][00:00:c9][12:34:56]");
  EXPECT_EQ(wwn::nice_wwn("2100aabbcc012345"), "[2][aa:bb:cc][01:23:45]");
}

TEST(NiceWwnTest, RegisteredExtendedAppendsExtension) {
  EXPECT_EQ(wwn::nice_wwn("60060e8005b2c6000000b2c600000120"),
            "[6][00:60:e8][00:5b:2c:60:0][00:00:b2:c6:00:00:01:20]");
}

TEST(NiceWwnTest, UndecodableInputIsEmpty) {
  EXPECT_EQ(wwn::nice_wwn(""), "");
  EXPECT_EQ(wwn::nice_wwn("3006016008602c04"), "");
  EXPECT_EQ(wwn::nice_wwn("50:06:01"), "");
}

TEST(VendorSpecificNiceWwnTest, SequenceAndExtensionOnly) {
  EXPECT_EQ(wwn::vendor_specific_nice_wwn("5006016008602c04"), "[08:60:2c:04]");
  EXPECT_EQ(wwn::vendor_specific_nice_wwn("60060e8005b2c6000000b2c600000120"),
            "[00:5b:2c:60:0][00:00:b2:c6:00:00:01:20]");
  EXPECT_EQ(wwn::vendor_specific_nice_wwn("7006016008602c04"), "");
}

// =============================================================================
// vendor_from_wwn
// =============================================================================

TEST(VendorFromWwnTest, ResolvesEmbeddedOui) {
  FixedSource source{"06-01-60   (hex)\t\tEMC Corporation\n"
                     "00-60-E8   (hex)\t\tHITACHI COMPUTER PRODUCTS (AMERICA), INC.\n"};
  oui::OuiRegistry registry{source, {.cache_path = "unused"}};

  EXPECT_EQ(wwn::vendor_from_wwn("50:06:01:60:08:60:2c:04", registry),
            "EMC Corporation");
  EXPECT_EQ(wwn::vendor_from_wwn("60060e8005b2c6000000b2c600000120", registry),
            "HITACHI COMPUTER PRODUCTS (AMERICA), INC.");
}

TEST(VendorFromWwnTest, UnknownOuiOrBadWwnIsAbsent) {
  FixedSource source{"06-01-60   (hex)\t\tEMC Corporation\n"};
  oui::OuiRegistry registry{source, {.cache_path = "unused"}};

  EXPECT_FALSE(wwn::vendor_from_wwn("10000000c9123456", registry).has_value());
  EXPECT_FALSE(wwn::vendor_from_wwn("not-a-wwn", registry).has_value());
}

TEST(VendorFromWwnTest, FormattingDoesNotLoadRegistry) {
  FixedSource source{""};
  oui::OuiRegistry registry{source, {.cache_path = "unused"}};

  EXPECT_EQ(wwn::nice_wwn("5006016008602c04"), "[5][06:01:60][08:60:2c:04]");
  EXPECT_FALSE(registry.is_loaded());
}
