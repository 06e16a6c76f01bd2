/**
 * @file registry_source_test.cpp
 * @author Carlos Salguero
 * @brief Filesystem and network registry source tests
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "loopback_http_server.hpp"

#include <gtest/gtest.h>
#include <wwnlookup/oui/registry_source.hpp>

#include <sys/resource.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>

using namespace wwnlookup;
using test_support::LoopbackHttpServer;

// Test fixture providing a scratch directory
class SystemRegistrySourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::filesystem::temp_directory_path() /
                ("wwnlookup_source_test_" +
                 std::string{::testing::UnitTest::GetInstance()
                                 ->current_test_info()
                                 ->name()});
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  void TearDown() override {
    if (std::filesystem::exists(temp_dir_)) {
      std::filesystem::remove_all(temp_dir_);
    }
  }

  /**
   * @brief Run write_cache with the process file size limit lowered
   */
  utils::Result write_with_size_limit(const std::filesystem::path &path,
                                      std::string_view text,
                                      rlim_t limit_bytes) {
    rlimit previous{};
    if (getrlimit(RLIMIT_FSIZE, &previous) != 0) {
      ADD_FAILURE() << "getrlimit failed";
      return {};
    }

    // Oversized writes must fail with EFBIG instead of killing the process
    auto *previous_handler = std::signal(SIGXFSZ, SIG_IGN);

    rlimit limited = previous;
    limited.rlim_cur = limit_bytes;
    EXPECT_EQ(setrlimit(RLIMIT_FSIZE, &limited), 0);

    auto result = source_.write_cache(path, text);

    EXPECT_EQ(setrlimit(RLIMIT_FSIZE, &previous), 0);
    std::signal(SIGXFSZ, previous_handler);
    return result;
  }

  std::filesystem::path temp_dir_;
  oui::SystemRegistrySource source_{std::chrono::seconds{2}};
};

// =============================================================================
// Cache file
// =============================================================================

TEST_F(SystemRegistrySourceTest, ReadsWholeFile) {
  const auto path = temp_dir_ / "oui.txt";
  const std::string content = "00-00-0C   (hex)\t\tCisco Systems, Inc\r\n"
                              "00000C     (base 16)\t\tCisco Systems, Inc\r\n";
  {
    std::ofstream file{path, std::ios::binary};
    file << content;
  }

  auto text = source_.read_cache(path);
  ASSERT_TRUE(text.has_value()) << text.error().what();
  EXPECT_EQ(*text, content);
}

TEST_F(SystemRegistrySourceTest, MissingFileIsFileSystemError) {
  auto text = source_.read_cache(temp_dir_ / "absent.txt");

  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().category, utils::ErrorCategory::FileSystem);
}

TEST_F(SystemRegistrySourceTest, DirectoryIsNotACacheFile) {
  auto text = source_.read_cache(temp_dir_);
  EXPECT_FALSE(text.has_value());
}

TEST_F(SystemRegistrySourceTest, WriteThenRead) {
  const auto path = temp_dir_ / "nested" / "dir" / "oui.txt";
  const std::string content = "aa-bb-cc   (hex)   ACME Corp\n";

  auto written = source_.write_cache(path, content);
  ASSERT_TRUE(written.has_value()) << written.error().what();
  ASSERT_TRUE(std::filesystem::exists(path));

  auto text = source_.read_cache(path);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, content);
}

TEST_F(SystemRegistrySourceTest, WriteReplacesExistingContent) {
  const auto path = temp_dir_ / "oui.txt";

  ASSERT_TRUE(source_.write_cache(path, "a much longer first version").has_value());
  ASSERT_TRUE(source_.write_cache(path, "short").has_value());

  auto text = source_.read_cache(path);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "short");
}

TEST_F(SystemRegistrySourceTest, WriteOverDirectoryFails) {
  auto written = source_.write_cache(temp_dir_, "text");

  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().category, utils::ErrorCategory::FileSystem);
}

TEST_F(SystemRegistrySourceTest, FailedWriteLeavesNoPartialCache) {
  const auto path = temp_dir_ / "oui.txt";
  const std::string content(100000, 'x');

  auto written = write_with_size_limit(path, content, 4096);

  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().category, utils::ErrorCategory::FileSystem);
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "oui.txt.tmp"));
  EXPECT_FALSE(source_.read_cache(path).has_value());
}

TEST_F(SystemRegistrySourceTest, FailedWriteKeepsPreviousCache) {
  const auto path = temp_dir_ / "oui.txt";
  const std::string previous = "00-00-0C   (hex)\t\tCisco Systems, Inc\n";
  ASSERT_TRUE(source_.write_cache(path, previous).has_value());

  auto written = write_with_size_limit(path, std::string(100000, 'x'), 4096);
  ASSERT_FALSE(written.has_value());

  auto text = source_.read_cache(path);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, previous);
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "oui.txt.tmp"));
}

// =============================================================================
// Network
// =============================================================================

TEST_F(SystemRegistrySourceTest, UnreachableHostIsNetworkError) {
  auto text = source_.fetch_network("http://127.0.0.1:1/oui/oui.txt");

  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().category, utils::ErrorCategory::Network);
}

TEST_F(SystemRegistrySourceTest, UnsupportedSchemeIsNetworkError) {
  auto text = source_.fetch_network("nosuchscheme://standards-oui.ieee.org/oui.txt");

  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().category, utils::ErrorCategory::Network);
}

TEST_F(SystemRegistrySourceTest, SuccessfulGetReturnsBody) {
  const std::string body = "06-01-60   (hex)\t\tEMC Corporation\r\n"
                           "060160     (base 16)\t\tEMC Corporation\r\n";
  LoopbackHttpServer server{200, "OK", body};

  auto text = source_.fetch_network(server.url("/oui/oui.txt"));

  ASSERT_TRUE(text.has_value()) << text.error().what();
  EXPECT_EQ(*text, body);
}

TEST_F(SystemRegistrySourceTest, NotFoundIsNetworkError) {
  LoopbackHttpServer server{404, "Not Found", "no such registry"};

  auto text = source_.fetch_network(server.url("/oui/oui.txt"));

  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().category, utils::ErrorCategory::Network);
  EXPECT_NE(text.error().message.find("404"), std::string::npos);
}

TEST_F(SystemRegistrySourceTest, KeepsConfiguredTimeout) {
  EXPECT_EQ(source_.timeout(), std::chrono::milliseconds{2000});
}
