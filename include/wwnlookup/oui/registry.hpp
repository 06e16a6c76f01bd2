/**
 * @file registry.hpp
 * @author Carlos Salguero
 * @brief OUI to vendor name registry
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 * Resolves 24-bit OUIs to vendor names. The mapping is built once, on the
 * first lookup, from the cache file or, when that is missing, from the
 * IEEE download (which is then written to the cache). A failed download
 * leaves the registry empty for the rest of its lifetime.
 */

#pragma once

#include "../core/types.hpp"
#include "registry_source.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wwnlookup::oui {
/**
 * @brief Default registry download location (line-oriented text format)
 */
inline constexpr std::string_view DEFAULT_REGISTRY_URL =
    "https://standards-oui.ieee.org/oui/oui.txt";

/**
 * @brief Default cache file name
 */
inline constexpr std::string_view DEFAULT_CACHE_FILE = "oui.txt";

/**
 * @brief Cache path next to the running executable
 *
 * Falls back to the current directory when the executable location cannot
 * be determined.
 */
[[nodiscard]] std::filesystem::path default_cache_path();

/**
 * @brief Registry configuration
 */
struct RegistryConfig {
  std::filesystem::path cache_path{default_cache_path()};
  std::string url{DEFAULT_REGISTRY_URL};
  std::chrono::milliseconds timeout{std::chrono::seconds{30}};
};

/**
 * @brief Where the loaded mapping came from
 */
enum class RegistryOrigin : std::uint8_t {
  None,    ///< Not loaded yet, or cache and download both failed
  Cache,   ///< Read from the cache file
  Network, ///< Downloaded from the registry URL
};

[[nodiscard]] std::string_view origin_to_string(RegistryOrigin origin) noexcept;

/**
 * @brief OUI registry with once-only lazy loading
 *
 * Safe to share between threads: the mapping is written exactly once under
 * std::call_once and only read afterwards.
 */
class OuiRegistry : public core::NonCopyable {
public:
  /**
   * @brief Registry statistics
   */
  struct Statistics {
    std::size_t total_entries{0};
    RegistryOrigin origin{RegistryOrigin::None};
    std::vector<std::pair<std::string, std::size_t>> top_vendors;

    [[nodiscard]] std::string to_string() const;
  };

public:
  /**
   * @brief Registry reading through the given source
   *
   * The source must outlive the registry.
   */
  OuiRegistry(RegistrySource &source, RegistryConfig config = {});

  /**
   * @brief Vendor name for an OUI ("0050c2", "00-50-C2", "00:50:c2")
   *
   * Loads the mapping on first use. A miss, a malformed key and an
   * unavailable registry all yield std::nullopt.
   */
  [[nodiscard]] std::optional<std::string>
  resolve(std::string_view oui) const;

  /**
   * @brief Force the lazy load without a lookup
   */
  void load() const;

  [[nodiscard]] bool is_loaded() const noexcept;

  /**
   * @brief Number of entries (loads the mapping)
   */
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] RegistryOrigin origin() const;
  [[nodiscard]] Statistics statistics(std::size_t top_count = 10) const;

  [[nodiscard]] const RegistryConfig &config() const noexcept {
    return m_config;
  }

private:
  RegistrySource &m_source;
  RegistryConfig m_config;

  mutable std::once_flag m_loaded;
  mutable core::OuiMap m_database;
  mutable RegistryOrigin m_origin{RegistryOrigin::None};
  mutable std::atomic<bool> m_ready{false};

private:
  void populate() const;
};
} // namespace wwnlookup::oui
