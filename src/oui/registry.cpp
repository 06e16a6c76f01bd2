/**
 * @file registry.cpp
 * @author Carlos Salguero
 * @brief OUI registry implementation
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/oui/registry.hpp>
#include <wwnlookup/oui/registry_parser.hpp>

#include <algorithm>
#include <unordered_map>

namespace wwnlookup::oui {
std::filesystem::path default_cache_path() {
  std::error_code ec;
  auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && executable.has_parent_path()) {
    return executable.parent_path() / DEFAULT_CACHE_FILE;
  }

  return std::filesystem::path{DEFAULT_CACHE_FILE};
}

std::string_view origin_to_string(RegistryOrigin origin) noexcept {
  switch (origin) {
  case RegistryOrigin::Cache:
    return "cache";
  case RegistryOrigin::Network:
    return "network";
  case RegistryOrigin::None:
  default:
    return "none";
  }
}

std::string OuiRegistry::Statistics::to_string() const {
  std::string result = fmt::format("OUI Registry: {} total entries (from {})\n",
                                   total_entries, origin_to_string(origin));

  result += "Top vendors:\n";
  for (const auto &[vendor, count] : top_vendors) {
    result += fmt::format("  {}: {}\n", vendor, count);
  }

  return result;
}

OuiRegistry::OuiRegistry(RegistrySource &source, RegistryConfig config)
    : m_source{source}, m_config{std::move(config)} {}

std::optional<std::string> OuiRegistry::resolve(std::string_view oui) const {
  load();

  core::OuiKey key = core::hex::strip_and_lower(oui, "-:");
  if (key.size() != core::OUI_HEX_DIGITS || !core::hex::is_hex(key)) {
    WL_DEBUG("Rejecting malformed OUI '{}'", oui);
    return std::nullopt;
  }

  auto it = m_database.find(key);
  if (it == m_database.end()) {
    return std::nullopt;
  }

  return it->second;
}

void OuiRegistry::load() const {
  std::call_once(m_loaded, [this] { populate(); });
}

bool OuiRegistry::is_loaded() const noexcept {
  return m_ready.load(std::memory_order_acquire);
}

std::size_t OuiRegistry::size() const {
  load();
  return m_database.size();
}

RegistryOrigin OuiRegistry::origin() const {
  load();
  return m_origin;
}

OuiRegistry::Statistics OuiRegistry::statistics(std::size_t top_count) const {
  load();

  Statistics stats;
  stats.total_entries = m_database.size();
  stats.origin = m_origin;

  std::unordered_map<std::string, std::size_t> vendor_counts;
  for (const auto &[oui, vendor] : m_database) {
    vendor_counts[vendor]++;
  }

  std::vector<std::pair<std::string, std::size_t>> vendor_list(
      vendor_counts.begin(), vendor_counts.end());

  const auto top = std::min(top_count, vendor_list.size());
  std::partial_sort(vendor_list.begin(), vendor_list.begin() + top,
                    vendor_list.end(), [](const auto &a, const auto &b) {
                      return a.second != b.second ? a.second > b.second
                                                  : a.first < b.first;
                    });

  stats.top_vendors.assign(vendor_list.begin(), vendor_list.begin() + top);
  return stats;
}

void OuiRegistry::populate() const {
  try {
    auto cached = m_source.read_cache(m_config.cache_path);
    if (cached) {
      m_database = parse(*cached);
      m_origin = RegistryOrigin::Cache;
    } else {
      WL_DEBUG(core::LogContext{}.with_error(cached.error()),
               "OUI cache unavailable, falling back to download");

      auto fetched = m_source.fetch_network(m_config.url);
      if (fetched) {
        auto database = parse(*fetched);
        if (database.empty()) {
          utils::Error error{utils::ErrorCategory::Parse,
                             fmt::format("No OUI assignments in {} bytes from {}",
                                         fetched->size(), m_config.url)};
          WL_WARNING(core::LogContext{}.with_error(error),
                     "Downloaded OUI registry is unusable, not caching it");
        } else {
          auto written = m_source.write_cache(m_config.cache_path, *fetched);
          if (!written) {
            WL_WARNING(core::LogContext{}.with_error(written.error()),
                       "Could not persist OUI registry to {}",
                       m_config.cache_path.string());
          }

          m_database = std::move(database);
          m_origin = RegistryOrigin::Network;
        }
      } else {
        WL_WARNING(core::LogContext{}.with_error(fetched.error()),
                   "OUI registry unavailable, vendor names will not resolve");
      }
    }
  } catch (const std::exception &e) {
    WL_ERROR_LOG("Failed to load OUI registry: {}", e.what());
    m_database.clear();
    m_origin = RegistryOrigin::None;
  }

  WL_INFO(core::LogContext{}
              .with("origin", origin_to_string(m_origin))
              .with("entries", m_database.size()),
          "OUI registry loaded");
  m_ready.store(true, std::memory_order_release);
}
} // namespace wwnlookup::oui
