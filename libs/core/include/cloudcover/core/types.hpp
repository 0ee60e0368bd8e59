/**
 * @file types.hpp
 * @brief Core domain types for cloudcover.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace cloudcover::core {

/**
 * @brief Standard status code used by every result value.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotFound, FetchFailed, DataUnavailable };

/**
 * @brief Human-readable status name for logs and diagnostics.
 */
inline const char* status_name(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::NotFound:
      return "not_found";
    case Status::FetchFailed:
      return "fetch_failed";
    case Status::DataUnavailable:
      return "data_unavailable";
  }
  return "unknown";
}

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Hourly archive partition derived from a UTC instant.
 */
struct PartitionKey {
  int year{};
  int day_of_year{};
  int hour{};
};

/**
 * @brief One archived object.
 *
 * `path` is the object key inside the satellite's bucket, without the leading `<satellite>/`.
 */
struct ScanReference {
  std::string satellite{};
  std::string product{};
  std::string path{};
};

/**
 * @brief Single spectral band (Kelvin for IR, reflectance fraction for visible). NaN marks gaps.
 */
using Band = Eigen::Array<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Per-pixel cloud flags, same shape as the source band.
 */
using CloudMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Decoded scan: named bands plus global string attributes.
 */
struct Scan {
  std::map<std::string, Band> bands{};
  std::map<std::string, std::string> attributes{};

  [[nodiscard]] const Band* band(const std::string& name) const {
    const auto it = bands.find(name);
    return it == bands.end() ? nullptr : &it->second;
  }

  [[nodiscard]] std::optional<std::string> attribute(const std::string& name) const {
    const auto it = attributes.find(name);
    if (it == attributes.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

/**
 * @brief Archive listing output; entries are `<bucket>/<key>` strings ordered by name.
 */
struct ListingResult {
  std::vector<std::string> entries{};
  Status status{Status::Ok};
  std::string detail{};
};

/**
 * @brief Dataset loader output.
 */
struct LoadResult {
  Scan scan{};
  Status status{Status::Ok};
  std::string detail{};
};

}  // namespace cloudcover::core
