/**
 * @file report_json.cpp
 * @brief JSON payload construction.
 * @author Watosn
 */

#include "cloudcover/service/report_json.hpp"

#include <cmath>

namespace cloudcover::service {

double round_percent(double percent) {
  if (!std::isfinite(percent)) {
    return percent;
  }
  return std::round(percent * 100.0) / 100.0;
}

nlohmann::json report_payload(const CloudCoverReport& report) {
  if (report.status != cloudcover::core::Status::Ok || !report.error.empty()) {
    return error_payload(report.error.empty() ? std::string(kErrorProcessingFailed) : report.error);
  }
  nlohmann::json payload = nlohmann::json::object();
  const double percent = round_percent(report.cloud_cover_percent);
  if (std::isnan(percent)) {
    payload["cloud_cover_percent"] = nullptr;
  } else {
    payload["cloud_cover_percent"] = percent;
  }
  payload["source_file"] = report.source_file;
  return payload;
}

nlohmann::json health_payload() { return nlohmann::json{{"status", "ok"}}; }

nlohmann::json error_payload(const std::string& message) { return nlohmann::json{{"error", message}}; }

}  // namespace cloudcover::service
