/**
 * @file interfaces.hpp
 * @brief Collaborator interfaces for archive listing, transfer and dataset loading.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cloudcover/core/types.hpp"

namespace cloudcover::core {

/**
 * @brief Interface for object-archive listings.
 */
class IArchiveLister {
 public:
  virtual ~IArchiveLister() = default;
  /**
   * @brief List every object under a prefix.
   * @param prefix `<bucket>/<key-prefix>` string.
   * @return Entries ordered by name, with `status` set on access failure.
   */
  [[nodiscard]] virtual ListingResult list(const std::string& prefix) const = 0;
};

/**
 * @brief Interface for blocking URL-to-file transfers.
 */
class ITransferClient {
 public:
  virtual ~ITransferClient() = default;
  /**
   * @brief Download a URL into a local file.
   * @param url Source URL.
   * @param destination Output file, created or truncated.
   * @return Zero on success, transfer-specific non-zero code otherwise.
   */
  [[nodiscard]] virtual int download(const std::string& url, const std::filesystem::path& destination) const = 0;
};

/**
 * @brief Interface for dataset readers that expose named 2-D bands.
 */
class IScanLoader {
 public:
  virtual ~IScanLoader() = default;
  /**
   * @brief Open a local file and decode the requested bands plus global attributes.
   * @param file Local dataset file.
   * @param band_names Bands to decode; names absent from the file are skipped.
   * @return Decoded scan with `status` set.
   */
  [[nodiscard]] virtual LoadResult load(const std::filesystem::path& file,
                                        const std::vector<std::string>& band_names) const = 0;
};

}  // namespace cloudcover::core
