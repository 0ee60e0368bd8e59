/**
 * @file scan_locator.cpp
 * @brief Scan locator implementation.
 * @author Watosn
 */

#include "cloudcover/archive/scan_locator.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cloudcover/core/time_utils.hpp"

namespace cloudcover::archive {

std::string partition_prefix(const std::string& product, const std::string& satellite,
                             const cloudcover::core::PartitionKey& key) {
  return fmt::format("{}/{}/{}/", satellite, product, cloudcover::core::format_partition(key));
}

cloudcover::core::ScanReference reference_from_entry(const std::string& entry, const std::string& product,
                                                     const std::string& fallback_satellite) {
  const auto slash = entry.find('/');
  if (slash == std::string::npos) {
    return cloudcover::core::ScanReference{.satellite = fallback_satellite, .product = product, .path = entry};
  }
  return cloudcover::core::ScanReference{
      .satellite = entry.substr(0, slash), .product = product, .path = entry.substr(slash + 1)};
}

LocateResult ScanLocator::find_latest(const std::string& product, const std::string& satellite,
                                      const cloudcover::core::Epoch& now) const {
  using cloudcover::core::Status;

  if (product.empty() || satellite.empty()) {
    const std::string detail = "product and satellite identifiers must be non-empty";
    spdlog::error("scan lookup rejected: {}", detail);
    return LocateResult{.status = Status::NotFound, .detail = detail};
  }

  const auto key = cloudcover::core::partition_key(now);
  const std::string prefix = partition_prefix(product, satellite, key);
  spdlog::debug("listing archive prefix {}", prefix);

  const auto listing = lister_.list(prefix);
  if (listing.status != Status::Ok) {
    spdlog::error("Error accessing {}: {} ({})", prefix, listing.detail, cloudcover::core::status_name(listing.status));
    return LocateResult{.prefix = prefix, .status = Status::NotFound, .detail = listing.detail};
  }
  if (listing.entries.empty()) {
    spdlog::warn("No files found for this hour under {}", prefix);
    return LocateResult{.prefix = prefix, .status = Status::NotFound, .detail = "No files found for this hour"};
  }

  const auto latest = std::max_element(listing.entries.begin(), listing.entries.end());
  spdlog::info("latest scan under {}: {} ({} candidates)", prefix, *latest, listing.entries.size());
  return LocateResult{
      .reference = reference_from_entry(*latest, product, satellite), .prefix = prefix, .status = Status::Ok};
}

}  // namespace cloudcover::archive
