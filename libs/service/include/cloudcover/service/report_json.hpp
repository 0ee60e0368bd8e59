/**
 * @file report_json.hpp
 * @brief JSON payloads of the HTTP boundary.
 * @author Watosn
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "cloudcover/service/cloud_cover_service.hpp"

namespace cloudcover::service {

/**
 * @brief Round to two decimals; NaN stays NaN.
 */
[[nodiscard]] double round_percent(double percent);

/**
 * @brief `{"cloud_cover_percent": x|null, "source_file": s}` on success, `{"error": e}` otherwise.
 */
[[nodiscard]] nlohmann::json report_payload(const CloudCoverReport& report);

/**
 * @brief `{"status":"ok"}`.
 */
[[nodiscard]] nlohmann::json health_payload();

/**
 * @brief `{"error": message}`.
 */
[[nodiscard]] nlohmann::json error_payload(const std::string& message);

}  // namespace cloudcover::service
