/**
 * @file scan_locator.hpp
 * @brief Newest-scan discovery inside the current hourly archive partition.
 * @author Watosn
 */
#pragma once

#include <string>

#include "cloudcover/core/interfaces.hpp"
#include "cloudcover/core/types.hpp"

namespace cloudcover::archive {

/**
 * @brief Scan locator output bundle.
 *
 * Any discovery failure, including an unreachable archive, is reported as `NotFound`;
 * `detail` carries the underlying cause.
 */
struct LocateResult {
  cloudcover::core::ScanReference reference{};
  std::string prefix{};
  cloudcover::core::Status status{cloudcover::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Build the `{satellite}/{product}/{year}/{doy:03}/{hour:02}/` listing prefix.
 */
[[nodiscard]] std::string partition_prefix(const std::string& product, const std::string& satellite,
                                           const cloudcover::core::PartitionKey& key);

/**
 * @brief Split a `<satellite>/<key>` listing entry into a scan reference.
 */
[[nodiscard]] cloudcover::core::ScanReference reference_from_entry(const std::string& entry, const std::string& product,
                                                                   const std::string& fallback_satellite);

/**
 * @brief Locates the newest archived scan for the hour containing `now`.
 */
class ScanLocator {
 public:
  /**
   * @brief Construct locator over an archive listing backend.
   * @param lister Archive listing provider.
   */
  explicit ScanLocator(const cloudcover::core::IArchiveLister& lister) : lister_(lister) {}

  /**
   * @brief Find the newest object under the current hourly partition.
   * @param product Product identifier (for example `ABI-L2-MCMIPC`).
   * @param satellite Satellite bucket identifier (for example `noaa-goes19`).
   * @param now Injected UTC instant.
   * @return Reference to the lexicographically greatest entry, or `NotFound`.
   * @note "Newest" relies on the archive's filenames embedding the scan start time; there is no
   *       fallback to the previous hour when the current one is still empty.
   */
  [[nodiscard]] LocateResult find_latest(const std::string& product, const std::string& satellite,
                                         const cloudcover::core::Epoch& now) const;

 private:
  const cloudcover::core::IArchiveLister& lister_;
};

}  // namespace cloudcover::archive
