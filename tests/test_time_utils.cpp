/**
 * @file test_time_utils.cpp
 * @brief Partition key and ISO-8601 parsing tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "cloudcover/core/time_utils.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

double utc(int y, unsigned m, unsigned d, int hh, int mm, double ss) {
  return static_cast<double>(cloudcover::core::days_from_civil(y, m, d)) * 86400.0 + hh * 3600.0 + mm * 60.0 + ss;
}

}  // namespace

int main() {
  using namespace cloudcover::core;

  if (days_from_civil(1970, 1, 1) != 0 || days_from_civil(2000, 3, 1) != 11017) {
    spdlog::error("days_from_civil mismatch");
    return 1;
  }

  const auto epoch0 = partition_key(Epoch{.utc_seconds = 0.0});
  if (epoch0.year != 1970 || epoch0.day_of_year != 1 || epoch0.hour != 0 || format_partition(epoch0) != "1970/001/00") {
    spdlog::error("unix epoch partition wrong: {}", format_partition(epoch0));
    return 2;
  }

  const auto mid_march = partition_key(Epoch{.utc_seconds = utc(2024, 3, 15, 13, 45, 0.0)});
  if (format_partition(mid_march) != "2024/075/13") {
    spdlog::error("leap-year partition wrong: {}", format_partition(mid_march));
    return 3;
  }

  const auto new_years_eve = partition_key(Epoch{.utc_seconds = utc(2024, 12, 31, 23, 59, 59.9)});
  if (new_years_eve.day_of_year != 366 || new_years_eve.hour != 23) {
    spdlog::error("day 366 not produced: {}", format_partition(new_years_eve));
    return 4;
  }

  // Sweep a year hour by hour: the key stays in range and matches the hour of day.
  const double start = utc(2023, 1, 1, 0, 0, 0.0);
  for (int h = 0; h < 365 * 24; ++h) {
    const Epoch e{.utc_seconds = start + h * 3600.0 + 1800.0};
    const auto key = partition_key(e);
    if (key.day_of_year < 1 || key.day_of_year > 366 || key.hour < 0 || key.hour > 23 || key.hour != h % 24 ||
        key.day_of_year != h / 24 + 1 || utc_hour(e) != key.hour) {
      spdlog::error("partition sweep failed at hour {}", h);
      return 5;
    }
  }

  const auto goes = parse_iso8601_utc("2024-03-15T13:45:00.5Z");
  if (!goes || !approx(goes->utc_seconds, utc(2024, 3, 15, 13, 45, 0.5), 1e-6)) {
    spdlog::error("GOES style timestamp not parsed");
    return 6;
  }

  const auto offset = parse_iso8601_utc("2024-03-15T15:45:00+02:00");
  if (!offset || !approx(offset->utc_seconds, utc(2024, 3, 15, 13, 45, 0.0), 1e-9)) {
    spdlog::error("offset timestamp not converted to UTC");
    return 7;
  }

  const auto negative = parse_iso8601_utc("2024-03-15 08:15-0530");
  if (!negative || !approx(negative->utc_seconds, utc(2024, 3, 15, 13, 45, 0.0), 1e-9)) {
    spdlog::error("negative compact offset not converted to UTC");
    return 8;
  }

  const auto naive = parse_iso8601_utc("  2024-03-15T13:45:00  ");
  const auto date_only = parse_iso8601_utc("2024-03-15");
  if (!naive || !approx(naive->utc_seconds, utc(2024, 3, 15, 13, 45, 0.0), 1e-9) || !date_only ||
      !approx(date_only->utc_seconds, utc(2024, 3, 15, 0, 0, 0.0), 1e-9)) {
    spdlog::error("timestamps without offset must be read as UTC");
    return 9;
  }

  const char* bad[] = {"", "not a time", "2024-02-30T00:00:00Z", "2023-02-29", "2024-13-01T00:00:00Z",
                       "2024-03-15T24:00:00Z", "2024-03-15T13:45:00.Z", "2024-03-15T13:45:00+2", "2024-03-15X13"};
  for (const char* text : bad) {
    if (parse_iso8601_utc(text).has_value()) {
      spdlog::error("malformed timestamp accepted: '{}'", text);
      return 10;
    }
  }

  const auto numeric = parse_epoch("1710469800.5");
  const auto iso = parse_epoch("2024-03-15T02:30:00Z");
  if (!numeric || !approx(numeric->utc_seconds, 1710469800.5, 1e-9) || !iso ||
      !approx(iso->utc_seconds, utc(2024, 3, 15, 2, 30, 0.0), 1e-9)) {
    spdlog::error("epoch argument parsing mismatch");
    return 11;
  }
  const char* bad_epochs[] = {"", "yesterday", "17104698OO", "1710469800s", " 1710469800", "nan", "1e999"};
  for (const char* text : bad_epochs) {
    if (parse_epoch(text).has_value()) {
      spdlog::error("malformed epoch accepted: '{}'", text);
      return 12;
    }
  }
  return 0;
}
