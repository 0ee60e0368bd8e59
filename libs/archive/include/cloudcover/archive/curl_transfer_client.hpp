/**
 * @file curl_transfer_client.hpp
 * @brief Blocking HTTPS downloads via libcurl.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "cloudcover/archive/scan_fetcher.hpp"
#include "cloudcover/core/interfaces.hpp"

namespace cloudcover::archive {

/**
 * @brief Streams a URL straight into a local file.
 *
 * Returns the `CURLcode` of the transfer (0 on success). HTTP error statuses are failures.
 */
class CurlTransferClient final : public cloudcover::core::ITransferClient {
 public:
  /**
   * @brief Transfer configuration.
   */
  struct Config {
    long timeout_s{0};  // 0 blocks indefinitely
    std::string user_agent{kDefaultUserAgent};
  };

  CurlTransferClient() = default;
  explicit CurlTransferClient(Config config) : config_(std::move(config)) {}

  [[nodiscard]] int download(const std::string& url, const std::filesystem::path& destination) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace cloudcover::archive
