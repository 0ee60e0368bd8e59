/**
 * @file test_cloud_classifier.cpp
 * @brief Threshold classifier and day/night branch tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cloudcover/classify/cloud_classifier.hpp"
#include "test_fakes.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

}  // namespace

int main() {
  using namespace cloudcover;
  using testing::make_band;

  core::Scan night{};
  night.bands["CMI_C13"] = make_band({270.0F, 290.0F, kNaN, 275.0F});
  night.attributes["time_coverage_start"] = "2024-03-15T02:00:21.7Z";

  const auto ir = classify::classify_ir(night);
  if (ir.status != core::Status::Ok || !approx(ir.percent, 200.0 / 3.0, 1e-9) || ir.cloudy_pixels != 2 ||
      ir.valid_pixels != 3) {
    spdlog::error("IR fraction mismatch: {}", ir.percent);
    return 1;
  }

  core::Scan all_nan{};
  all_nan.bands["CMI_C13"] = make_band({kNaN, kNaN, kNaN});
  const auto degenerate = classify::classify_ir(all_nan);
  if (degenerate.status != core::Status::Ok || !std::isnan(degenerate.percent) || !classify::is_degenerate(degenerate)) {
    spdlog::error("all-NaN IR band must yield NaN, not zero");
    return 2;
  }

  // Exactly at threshold is clear.
  core::Scan boundary{};
  boundary.bands["CMI_C13"] = make_band({280.0F, 279.99F});
  if (!approx(classify::classify_ir(boundary).percent, 50.0, 1e-9)) {
    spdlog::error("IR threshold must be strict");
    return 3;
  }

  core::Scan day{};
  day.bands["CMI_C13"] = make_band({290.0F, 270.0F});
  day.bands["CMI_C02"] = make_band({0.1F, 0.5F});
  const auto multiband = classify::classify_multiband(day, "CMI_C13", {"CMI_C02"});
  if (multiband.status != core::Status::Ok || !approx(multiband.percent, 50.0, 1e-9)) {
    spdlog::error("multiband fraction mismatch: {}", multiband.percent);
    return 4;
  }

  // Bright visible pixel over warm IR counts as cloud.
  day.bands["CMI_C03"] = make_band({0.6F, 0.1F});
  if (!approx(classify::classify_multiband(day).percent, 100.0, 1e-9)) {
    spdlog::error("visible band must be OR-ed into the IR mask");
    return 5;
  }

  core::Scan ir_only{};
  ir_only.bands["CMI_C13"] = make_band({270.0F, 290.0F, kNaN, 275.0F});
  const auto no_vis = classify::classify_multiband(ir_only);
  if (no_vis.status != core::Status::Ok || !approx(no_vis.percent, classify::classify_ir(ir_only).percent, 1e-12)) {
    spdlog::error("absent visible bands must reduce to the IR rule");
    return 6;
  }

  // NaN in the visible band is never cloud; NaN in IR leaves the pixel out of the denominator
  // but a bright visible pixel above it still counts.
  core::Scan asymmetric{};
  asymmetric.bands["CMI_C13"] = make_band({kNaN, 290.0F, 290.0F});
  asymmetric.bands["CMI_C02"] = make_band({0.9F, kNaN, 0.2F});
  const auto asym = classify::classify_multiband(asymmetric, "CMI_C13", {"CMI_C02"});
  if (asym.cloudy_pixels != 1 || asym.valid_pixels != 2 || !approx(asym.percent, 50.0, 1e-9)) {
    spdlog::error("NaN handling between IR and visible bands changed");
    return 7;
  }

  core::Scan mismatched{};
  mismatched.bands["CMI_C13"] = make_band({270.0F, 290.0F});
  mismatched.bands["CMI_C02"] = make_band({0.5F, 0.5F, 0.5F});
  core::Scan missing_ir{};
  missing_ir.bands["CMI_C02"] = make_band({0.5F});
  if (classify::classify_multiband(mismatched).status != core::Status::InvalidInput ||
      classify::classify_multiband(missing_ir).status != core::Status::InvalidInput ||
      classify::classify_ir(missing_ir).status != core::Status::InvalidInput ||
      classify::multiband_cloud_mask(mismatched, "CMI_C13", {"CMI_C02"}, 280.0, 0.3).size() != 0) {
    spdlog::error("malformed scans must be rejected");
    return 8;
  }

  core::Scan clock{};
  const int hours_day[] = {6, 12, 18};
  const int hours_night[] = {0, 5, 19, 23};
  for (const int h : hours_day) {
    clock.attributes["time_coverage_start"] = fmt::format("2024-06-01T{:02d}:59:59.9Z", h);
    if (!classify::is_daytime(clock)) {
      spdlog::error("hour {} must be daytime", h);
      return 9;
    }
  }
  for (const int h : hours_night) {
    clock.attributes["time_coverage_start"] = fmt::format("2024-06-01T{:02d}:00:00.0Z", h);
    if (classify::is_daytime(clock)) {
      spdlog::error("hour {} must be night", h);
      return 10;
    }
  }
  clock.attributes.clear();
  if (!classify::is_daytime(clock)) {
    spdlog::error("absent timestamp must default to daytime");
    return 11;
  }
  if (classify::parse_daytime(clock) != std::optional<bool>(true)) {
    spdlog::error("absent timestamp must parse as daytime");
    return 17;
  }
  core::Scan malformed = ir_only;
  malformed.attributes["time_coverage_start"] = "yesterday-ish";
  const auto rejected = classify::CloudClassifier{}.classify(malformed, "x.nc");
  if (classify::parse_daytime(malformed).has_value() || rejected.status != core::Status::InvalidInput ||
      !std::isnan(rejected.percent) || classify::CloudClassifier{}.cloud_mask(malformed).size() != 0) {
    spdlog::error("malformed timestamp must be rejected, not treated as daytime");
    return 12;
  }
  clock.attributes["time_coverage_start"] = "2024-06-01T20:30:00-03:00";
  if (classify::is_daytime(clock)) {
    spdlog::error("offset timestamp must be judged in UTC");
    return 13;
  }

  // Night scan: the dispatcher must ignore a bright visible band.
  night.bands["CMI_C02"] = make_band({0.9F, 0.9F, 0.9F, 0.9F});
  const classify::CloudClassifier classifier{};
  const auto dispatched = classifier.classify(night, "ABI-L2-MCMIPC/x.nc");
  if (dispatched.daytime || !approx(dispatched.percent, 200.0 / 3.0, 1e-9) ||
      dispatched.source_path != "ABI-L2-MCMIPC/x.nc") {
    spdlog::error("night dispatch must use the IR rule");
    return 14;
  }
  // 4 cloudy over 3 valid IR pixels: the NaN IR pixel under a bright visible pixel pushes the
  // fraction past 100.
  night.attributes["time_coverage_start"] = "2024-03-15T14:00:21.7Z";
  const auto daylit = classifier.classify(night);
  if (!daylit.daytime || !approx(daylit.percent, 400.0 / 3.0, 1e-9) || classifier.cloud_mask(night).count() != 4) {
    spdlog::error("day dispatch must use the multiband rule");
    return 15;
  }

  const classify::CloudClassifier strict(classify::ClassifierConfig{.ir_threshold_k = 272.0});
  if (!approx(strict.classify(ir_only).percent, 100.0 / 3.0, 1e-9) || strict.required_bands().size() != 3) {
    spdlog::error("configured threshold not applied");
    return 16;
  }
  return 0;
}
