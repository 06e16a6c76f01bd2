/**
 * @file registry_source.cpp
 * @author Carlos Salguero
 * @brief Filesystem and libcurl registry source
 * @version 0.1
 * @date 2025-09-14
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <wwnlookup/core/logger.hpp>
#include <wwnlookup/oui/registry_source.hpp>

#include <curl/curl.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>

namespace wwnlookup::oui {
namespace {
/**
 * @brief One curl_global_init per process
 */
CURLcode ensure_curl_initialized() {
  static std::once_flag flag;
  static CURLcode code = CURLE_OK;

  std::call_once(flag, [] { code = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return code;
}

struct CurlDeleter {
  void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

std::size_t append_body(char *data, std::size_t size, std::size_t count,
                        void *user) {
  auto *body = static_cast<std::string *>(user);
  body->append(data, size * count);
  return size * count;
}
} // namespace

utils::Expected<std::string>
SystemRegistrySource::read_cache(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return tl::unexpected{utils::make_filesystem_error(
        fmt::format("OUI cache {} does not exist", path.string()))};
  }

  try {
    std::ifstream file{path, std::ios::binary};
    if (!file.is_open()) {
      return tl::unexpected{utils::make_errno_error(
          utils::ErrorCategory::FileSystem,
          fmt::format("Failed to open OUI cache: {}", path.string()))};
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (file.bad()) {
      return tl::unexpected{utils::make_filesystem_error(
          fmt::format("Failed to read OUI cache: {}", path.string()))};
    }

    WL_DEBUG("Read {} bytes from OUI cache {}", content.size(), path.string());
    return content;
  } catch (const std::exception &e) {
    return tl::unexpected{utils::make_filesystem_error(fmt::format(
        "Exception reading OUI cache {}: {}", path.string(), e.what()))};
  }
}

utils::Expected<std::string>
SystemRegistrySource::fetch_network(std::string_view url) {
  if (ensure_curl_initialized() != CURLE_OK) {
    return tl::unexpected{
        utils::make_network_error("Failed to initialize libcurl")};
  }

  CurlHandle curl{curl_easy_init()};
  if (!curl) {
    return tl::unexpected{
        utils::make_network_error("Failed to create curl handle")};
  }

  const std::string target{url};
  std::string body;

  curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(m_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(m_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

  WL_INFO("Downloading IEEE OUI registry from {}", target);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    return tl::unexpected{utils::make_network_error(fmt::format(
        "GET {} failed: {}", target, curl_easy_strerror(code)))};
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    return tl::unexpected{utils::make_network_error(
        fmt::format("GET {} returned HTTP {}", target, status))};
  }

  WL_INFO(core::LogContext{}.with("bytes", body.size()).with("status", status),
          "Downloaded IEEE OUI registry");
  return body;
}

utils::Result
SystemRegistrySource::write_cache(const std::filesystem::path &path,
                                  std::string_view text) {
  try {
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        return tl::unexpected{utils::Error{
            utils::ErrorCategory::FileSystem,
            fmt::format("Failed to create directory {}",
                        path.parent_path().string()),
            ec}};
      }
    }

    auto temp_path = path;
    temp_path += ".tmp";

    {
      std::ofstream file{temp_path, std::ios::binary | std::ios::trunc};
      if (!file.is_open()) {
        return tl::unexpected{utils::make_errno_error(
            utils::ErrorCategory::FileSystem,
            fmt::format("Failed to create OUI cache: {}", temp_path.string()))};
      }

      file.write(text.data(), static_cast<std::streamsize>(text.size()));
      file.flush();
      if (!file) {
        auto error = utils::make_errno_error(
            utils::ErrorCategory::FileSystem,
            fmt::format("Failed to write OUI cache: {}", temp_path.string()));
        file.close();
        std::filesystem::remove(temp_path, ec);
        return tl::unexpected{std::move(error)};
      }
    }

    // Only a complete file may take the cache's place
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
      auto error = utils::Error{
          utils::ErrorCategory::FileSystem,
          fmt::format("Failed to replace OUI cache {}", path.string()), ec};
      std::filesystem::remove(temp_path, ec);
      return tl::unexpected{std::move(error)};
    }

    WL_DEBUG("Wrote {} bytes to OUI cache {}", text.size(), path.string());
    return {};
  } catch (const std::exception &e) {
    return tl::unexpected{utils::make_filesystem_error(fmt::format(
        "Exception writing OUI cache {}: {}", path.string(), e.what()))};
  }
}
} // namespace wwnlookup::oui
