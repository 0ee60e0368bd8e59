/**
 * @file s3_archive_lister.hpp
 * @brief Anonymous S3 ListObjectsV2 listing backed by libcurl and libxml2.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cloudcover/archive/scan_fetcher.hpp"
#include "cloudcover/core/interfaces.hpp"

namespace cloudcover::archive {

/**
 * @brief Lists public buckets through unauthenticated `?list-type=2` requests.
 */
class S3ArchiveLister final : public cloudcover::core::IArchiveLister {
 public:
  /**
   * @brief Listing configuration.
   */
  struct Config {
    std::string archive_domain{kDefaultArchiveDomain};
    long timeout_s{0};  // 0 blocks indefinitely
    int max_pages{100};
    std::string user_agent{kDefaultUserAgent};
  };

  /**
   * @brief One decoded ListObjectsV2 response page.
   */
  struct Page {
    std::vector<std::string> keys{};
    bool truncated{};
    std::string continuation_token{};
    cloudcover::core::Status status{cloudcover::core::Status::Ok};
    std::string detail{};
  };

  explicit S3ArchiveLister(Config config) : config_(std::move(config)) {}

  /**
   * @brief List `<bucket>/<key-prefix>`; entries come back as `<bucket>/<key>` sorted by name.
   */
  [[nodiscard]] cloudcover::core::ListingResult list(const std::string& prefix) const override;

  /**
   * @brief Decode a ListBucketResult (or S3 Error) XML document.
   */
  [[nodiscard]] static Page parse_page(const std::string& xml);

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace cloudcover::archive
