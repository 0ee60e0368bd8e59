/**
 * @file scan_fetcher.hpp
 * @brief Download of a located scan into local storage.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "cloudcover/core/interfaces.hpp"
#include "cloudcover/core/types.hpp"

namespace cloudcover::archive {

/**
 * @brief Default public archive domain for virtual-hosted bucket URLs.
 */
inline constexpr const char* kDefaultArchiveDomain = "s3.amazonaws.com";
/// User-Agent sent with archive listings and downloads.
inline constexpr const char* kDefaultUserAgent = "cloudcover/0.1";

/**
 * @brief Scan fetcher output bundle.
 */
struct FetchResult {
  std::filesystem::path local_path{};
  std::string url{};
  int transfer_code{};
  cloudcover::core::Status status{cloudcover::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Public object URL `https://{satellite}.{archive_domain}/{path}`.
 */
[[nodiscard]] std::string object_url(const cloudcover::core::ScanReference& reference,
                                     const std::string& archive_domain = kDefaultArchiveDomain);

/**
 * @brief Last path segment of a URL, used as the default local filename.
 */
[[nodiscard]] std::string url_basename(const std::string& url);

/**
 * @brief Fetches located scans through a transfer client.
 *
 * The fetcher never deletes anything: the caller owns the downloaded file, including a partial
 * file left behind by a failed transfer.
 */
class ScanFetcher {
 public:
  /**
   * @brief Construct fetcher.
   * @param transfer Blocking transfer backend.
   * @param archive_domain Domain appended to the satellite bucket name.
   */
  explicit ScanFetcher(const cloudcover::core::ITransferClient& transfer,
                       std::string archive_domain = kDefaultArchiveDomain)
      : transfer_(transfer), archive_domain_(std::move(archive_domain)) {}

  /**
   * @brief Download the referenced object.
   * @param reference Located scan; `path` must be non-empty.
   * @param output_path Explicit destination; defaults to the URL basename in the working directory.
   * @return Local path on success, `FetchFailed` on a non-zero transfer status.
   * @note No retry and no size or checksum validation.
   */
  [[nodiscard]] FetchResult fetch(const cloudcover::core::ScanReference& reference,
                                  const std::filesystem::path& output_path = {}) const;

  [[nodiscard]] const std::string& archive_domain() const { return archive_domain_; }

 private:
  const cloudcover::core::ITransferClient& transfer_;
  std::string archive_domain_{};
};

}  // namespace cloudcover::archive
