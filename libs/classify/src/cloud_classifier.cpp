/**
 * @file cloud_classifier.cpp
 * @brief Threshold cloud detection implementation.
 * @author Watosn
 */

#include "cloudcover/classify/cloud_classifier.hpp"

#include <spdlog/spdlog.h>

#include "cloudcover/core/time_utils.hpp"

namespace cloudcover::classify {
namespace {

using cloudcover::core::Band;
using cloudcover::core::CloudMask;
using cloudcover::core::Status;

std::int64_t valid_count(const Band& band) {
  return static_cast<std::int64_t>(band.size()) - static_cast<std::int64_t>(band.isNaN().count());
}

}  // namespace

std::optional<bool> parse_daytime(const cloudcover::core::Scan& scan) {
  const auto start = scan.attribute(kScanStartAttribute);
  if (!start.has_value()) {
    return true;
  }
  const auto epoch = cloudcover::core::parse_iso8601_utc(*start);
  if (!epoch.has_value()) {
    return std::nullopt;
  }
  const int hour = cloudcover::core::utc_hour(*epoch);
  return hour >= kDaytimeFirstHourUtc && hour <= kDaytimeLastHourUtc;
}

bool is_daytime(const cloudcover::core::Scan& scan) { return parse_daytime(scan).value_or(true); }

CloudMask ir_cloud_mask(const Band& ir, double threshold_k) { return ir < static_cast<float>(threshold_k); }

double cloud_percent(std::int64_t cloudy, std::int64_t valid) {
  if (valid <= 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return static_cast<double>(cloudy) / static_cast<double>(valid) * 100.0;
}

CloudFractionResult classify_ir(const cloudcover::core::Scan& scan, const std::string& ir_band, double threshold_k) {
  const Band* ir = scan.band(ir_band);
  if (ir == nullptr) {
    spdlog::error("IR band {} missing from scan", ir_band);
    return CloudFractionResult{.daytime = false, .status = Status::InvalidInput};
  }

  const std::int64_t cloudy = ir_cloud_mask(*ir, threshold_k).count();
  const std::int64_t valid = valid_count(*ir);
  return CloudFractionResult{.percent = cloud_percent(cloudy, valid),
                             .daytime = false,
                             .cloudy_pixels = cloudy,
                             .valid_pixels = valid,
                             .status = Status::Ok};
}

CloudMask multiband_cloud_mask(const cloudcover::core::Scan& scan, const std::string& ir_band,
                               const std::vector<std::string>& vis_bands, double ir_threshold_k, double vis_threshold) {
  const Band* ir = scan.band(ir_band);
  if (ir == nullptr) {
    return CloudMask{};
  }

  CloudMask mask = ir_cloud_mask(*ir, ir_threshold_k);
  for (const auto& name : vis_bands) {
    const Band* vis = scan.band(name);
    if (vis == nullptr) {
      continue;
    }
    if (vis->rows() != ir->rows() || vis->cols() != ir->cols()) {
      spdlog::error("visible band {} is {}x{}, IR band {} is {}x{}", name, vis->rows(), vis->cols(), ir_band, ir->rows(),
                    ir->cols());
      return CloudMask{};
    }
    mask = mask || (*vis > static_cast<float>(vis_threshold));
  }
  return mask;
}

CloudFractionResult classify_multiband(const cloudcover::core::Scan& scan, const std::string& ir_band,
                                       const std::vector<std::string>& vis_bands, double ir_threshold_k,
                                       double vis_threshold) {
  const Band* ir = scan.band(ir_band);
  if (ir == nullptr) {
    spdlog::error("IR band {} missing from scan", ir_band);
    return CloudFractionResult{.status = Status::InvalidInput};
  }

  const CloudMask mask = multiband_cloud_mask(scan, ir_band, vis_bands, ir_threshold_k, vis_threshold);
  if (mask.size() != ir->size()) {
    return CloudFractionResult{.status = Status::InvalidInput};
  }

  const std::int64_t cloudy = mask.count();
  const std::int64_t valid = valid_count(*ir);
  return CloudFractionResult{.percent = cloud_percent(cloudy, valid),
                             .daytime = true,
                             .cloudy_pixels = cloudy,
                             .valid_pixels = valid,
                             .status = Status::Ok};
}

CloudFractionResult CloudClassifier::classify(const cloudcover::core::Scan& scan, const std::string& source_path) const {
  const auto daytime = parse_daytime(scan);
  if (!daytime.has_value()) {
    spdlog::error("malformed {} '{}'", kScanStartAttribute, scan.attribute(kScanStartAttribute).value_or(""));
    return CloudFractionResult{.source_path = source_path, .status = Status::InvalidInput};
  }
  const bool day = *daytime;
  CloudFractionResult result =
      day ? classify_multiband(scan, config_.ir_band, config_.vis_bands, config_.ir_threshold_k, config_.vis_threshold)
          : classify_ir(scan, config_.ir_band, config_.ir_threshold_k);
  result.daytime = day;
  result.source_path = source_path;
  if (result.status == Status::Ok) {
    spdlog::info("{} classification: {}/{} cloudy pixels", day ? "day (IR+VIS)" : "night (IR)", result.cloudy_pixels,
                 result.valid_pixels);
  }
  return result;
}

CloudMask CloudClassifier::cloud_mask(const cloudcover::core::Scan& scan) const {
  const auto daytime = parse_daytime(scan);
  if (!daytime.has_value()) {
    return CloudMask{};
  }
  if (*daytime) {
    return multiband_cloud_mask(scan, config_.ir_band, config_.vis_bands, config_.ir_threshold_k, config_.vis_threshold);
  }
  const Band* ir = scan.band(config_.ir_band);
  return ir == nullptr ? CloudMask{} : ir_cloud_mask(*ir, config_.ir_threshold_k);
}

std::vector<std::string> CloudClassifier::required_bands() const {
  std::vector<std::string> bands{config_.ir_band};
  bands.insert(bands.end(), config_.vis_bands.begin(), config_.vis_bands.end());
  return bands;
}

}  // namespace cloudcover::classify
