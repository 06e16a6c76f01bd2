/**
 * @file registry_source.hpp
 * @author Carlos Salguero
 * @brief Access to the raw IEEE OUI registry text
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * The registry text comes either from a local cache file or from the IEEE
 * download endpoint. RegistrySource is the seam the registry calls
 * through; SystemRegistrySource talks to the real filesystem and network.
 */

#pragma once

#include "../core/types.hpp"
#include "../utils/expected.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace wwnlookup::oui {
/**
 * @brief Provider of raw registry text
 */
class RegistrySource {
public:
  virtual ~RegistrySource() = default;

  /**
   * @brief Read the whole cache file
   */
  [[nodiscard]] virtual utils::Expected<std::string>
  read_cache(const std::filesystem::path &path) = 0;

  /**
   * @brief Single synchronous HTTP GET of the registry document
   *
   * No retry. Any transport failure or non-2xx status is an error.
   */
  [[nodiscard]] virtual utils::Expected<std::string>
  fetch_network(std::string_view url) = 0;

  /**
   * @brief Persist fetched text so later runs avoid the network
   */
  [[nodiscard]] virtual utils::Result
  write_cache(const std::filesystem::path &path, std::string_view text) = 0;
};

/**
 * @brief RegistrySource backed by std::fstream and libcurl
 */
class SystemRegistrySource final : public RegistrySource {
public:
  explicit SystemRegistrySource(
      std::chrono::milliseconds timeout = std::chrono::seconds{30}) noexcept
      : m_timeout{timeout} {}

  [[nodiscard]] utils::Expected<std::string>
  read_cache(const std::filesystem::path &path) override;

  [[nodiscard]] utils::Expected<std::string>
  fetch_network(std::string_view url) override;

  [[nodiscard]] utils::Result write_cache(const std::filesystem::path &path,
                                          std::string_view text) override;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept {
    return m_timeout;
  }

private:
  std::chrono::milliseconds m_timeout;
};
} // namespace wwnlookup::oui
