/**
 * @file cloud_classifier.hpp
 * @brief Threshold cloud detection with a day/night branch.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cloudcover/core/types.hpp"

namespace cloudcover::classify {

/// ABI band 13 (10.3 um clean longwave window), brightness temperature in Kelvin.
inline constexpr const char* kDefaultIrBand = "CMI_C13";
/// Cloud tops colder than this are counted as cloud.
inline constexpr double kDefaultIrThresholdK = 280.0;
/// Reflectance above this is counted as cloud in daylight.
inline constexpr double kDefaultVisThreshold = 0.3;
/// First and last UTC hour (inclusive) treated as daytime.
inline constexpr int kDaytimeFirstHourUtc = 6;
inline constexpr int kDaytimeLastHourUtc = 18;
/// Global attribute holding the scan start time.
inline constexpr const char* kScanStartAttribute = "time_coverage_start";

/**
 * @brief ABI bands 2 (0.64 um red) and 3 (0.86 um veggie).
 */
inline std::vector<std::string> default_vis_bands() { return {"CMI_C02", "CMI_C03"}; }

/**
 * @brief Classifier thresholds and band selection.
 */
struct ClassifierConfig {
  std::string ir_band{kDefaultIrBand};
  std::vector<std::string> vis_bands{default_vis_bands()};
  double ir_threshold_k{kDefaultIrThresholdK};
  double vis_threshold{kDefaultVisThreshold};
};

/**
 * @brief Classification output bundle.
 *
 * `percent` is NaN when no valid IR pixel exists; that value is meaningful and must be reported,
 * not replaced with zero.
 */
struct CloudFractionResult {
  double percent{std::numeric_limits<double>::quiet_NaN()};
  std::string source_path{};
  bool daytime{true};
  std::int64_t cloudy_pixels{};
  std::int64_t valid_pixels{};
  cloudcover::core::Status status{cloudcover::core::Status::Ok};
};

/**
 * @brief True when the result carries no cloud fraction because no pixel was valid.
 */
inline bool is_degenerate(const CloudFractionResult& result) {
  return result.status == cloudcover::core::Status::Ok && std::isnan(result.percent);
}

/**
 * @brief Illumination decision that surfaces malformed metadata.
 * @return Daytime flag; true when `time_coverage_start` is absent, `std::nullopt` when it is
 *         present but not an ISO-8601 timestamp.
 */
[[nodiscard]] std::optional<bool> parse_daytime(const cloudcover::core::Scan& scan);

/**
 * @brief Coarse illumination check from `time_coverage_start`.
 *
 * Daytime iff the scan start falls between 06 and 18 UTC inclusive; a missing timestamp counts
 * as daytime. The rule ignores the sub-solar point on purpose. A malformed timestamp also
 * returns true here; `parse_daytime` tells it apart and `CloudClassifier` rejects it.
 */
[[nodiscard]] bool is_daytime(const cloudcover::core::Scan& scan);

/**
 * @brief Pixels strictly colder than `threshold_k`. NaN pixels are never cloudy.
 */
[[nodiscard]] cloudcover::core::CloudMask ir_cloud_mask(const cloudcover::core::Band& ir, double threshold_k);

/**
 * @brief Percentage from counts; NaN when `valid` is zero.
 */
[[nodiscard]] double cloud_percent(std::int64_t cloudy, std::int64_t valid);

/**
 * @brief Night-time IR-only cloud fraction.
 * @param scan Decoded scan.
 * @param ir_band IR band name.
 * @param threshold_k Brightness temperature threshold in Kelvin.
 * @return Fraction over non-NaN IR pixels; `InvalidInput` when the IR band is missing.
 */
[[nodiscard]] CloudFractionResult classify_ir(const cloudcover::core::Scan& scan,
                                              const std::string& ir_band = kDefaultIrBand,
                                              double threshold_k = kDefaultIrThresholdK);

/**
 * @brief Daytime IR-or-visible cloud mask.
 *
 * Visible bands missing from the scan are skipped. Returns an empty mask when the IR band is
 * missing or a visible band's shape differs from the IR band.
 */
[[nodiscard]] cloudcover::core::CloudMask multiband_cloud_mask(const cloudcover::core::Scan& scan,
                                                               const std::string& ir_band,
                                                               const std::vector<std::string>& vis_bands,
                                                               double ir_threshold_k, double vis_threshold);

/**
 * @brief Daytime IR + visible cloud fraction.
 *
 * The denominator counts non-NaN IR pixels only; NaN pixels of the visible bands are not
 * excluded.
 */
[[nodiscard]] CloudFractionResult classify_multiband(const cloudcover::core::Scan& scan,
                                                     const std::string& ir_band = kDefaultIrBand,
                                                     const std::vector<std::string>& vis_bands = default_vis_bands(),
                                                     double ir_threshold_k = kDefaultIrThresholdK,
                                                     double vis_threshold = kDefaultVisThreshold);

/**
 * @brief Day/night dispatching classifier.
 */
class CloudClassifier {
 public:
  CloudClassifier() = default;
  explicit CloudClassifier(ClassifierConfig config) : config_(std::move(config)) {}

  /**
   * @brief Classify a scan with the multiband rule by day and the IR rule by night.
   * @param scan Decoded scan.
   * @param source_path Archive path the scan came from, copied into the result.
   * @return `InvalidInput` with a NaN percent when `time_coverage_start` is malformed.
   */
  [[nodiscard]] CloudFractionResult classify(const cloudcover::core::Scan& scan,
                                             const std::string& source_path = {}) const;

  /**
   * @brief Mask matching the rule `classify` would apply to this scan; empty when `classify`
   *        would reject it.
   */
  [[nodiscard]] cloudcover::core::CloudMask cloud_mask(const cloudcover::core::Scan& scan) const;

  /**
   * @brief Every band name either rule may read.
   */
  [[nodiscard]] std::vector<std::string> required_bands() const;

  [[nodiscard]] const ClassifierConfig& config() const { return config_; }

 private:
  ClassifierConfig config_{};
};

}  // namespace cloudcover::classify
