/**
 * @file service_config.hpp
 * @brief Runtime configuration read from `CLOUDCOVER_*` environment variables.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "cloudcover/archive/scan_fetcher.hpp"
#include "cloudcover/classify/cloud_classifier.hpp"

namespace cloudcover::service {

inline constexpr const char* kDefaultProduct = "ABI-L2-MCMIPC";
inline constexpr const char* kDefaultSatellite = "noaa-goes19";
inline constexpr int kDefaultPort = 8000;

/**
 * @brief Everything a service run needs besides the injected clock.
 */
struct ServiceConfig {
  std::string product{kDefaultProduct};
  std::string satellite{kDefaultSatellite};
  std::string archive_domain{cloudcover::archive::kDefaultArchiveDomain};
  std::filesystem::path work_dir{};  // empty means the system temp directory
  long http_timeout_s{0};
  int port{kDefaultPort};
  std::string log_level{"info"};
  cloudcover::classify::ClassifierConfig classifier{};
};

/**
 * @brief Defaults overridden by any `CLOUDCOVER_*` variable that is set and non-empty.
 *
 * A numeric variable that does not parse keeps its default and logs a warning.
 */
[[nodiscard]] ServiceConfig load_config_from_env();

/**
 * @brief Resolved download directory (`work_dir` or the system temp directory).
 */
[[nodiscard]] std::filesystem::path resolve_work_dir(const ServiceConfig& config);

/**
 * @brief Apply a level name (`trace|debug|info|warn|error|off`) to the default spdlog logger.
 * @return False, leaving the level unchanged, when the name is not recognized.
 */
bool configure_logging(std::string_view level);

}  // namespace cloudcover::service
