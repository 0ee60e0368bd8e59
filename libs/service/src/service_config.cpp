/**
 * @file service_config.cpp
 * @brief Environment configuration implementation.
 * @author Watosn
 */

#include "cloudcover/service/service_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace cloudcover::service {
namespace {

std::optional<std::string> read_env(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

void read_env_string(const char* name, std::string& value) {
  if (auto raw = read_env(name)) {
    value = std::move(*raw);
  }
}

void read_env_double(const char* name, double& value) {
  const auto raw = read_env(name);
  if (!raw) {
    return;
  }
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(raw->c_str(), &end);
  if (end == raw->c_str() || *end != '\0' || errno == ERANGE) {
    spdlog::warn("ignoring {}='{}': not a number, keeping {}", name, *raw, value);
    return;
  }
  value = parsed;
}

void read_env_long(const char* name, long& value, long min_value, long max_value) {
  const auto raw = read_env(name);
  if (!raw) {
    return;
  }
  char* end = nullptr;
  errno = 0;
  const long parsed = std::strtol(raw->c_str(), &end, 10);
  if (end == raw->c_str() || *end != '\0' || errno == ERANGE || parsed < min_value || parsed > max_value) {
    spdlog::warn("ignoring {}='{}': expected an integer in [{}, {}], keeping {}", name, *raw, min_value, max_value,
                 value);
    return;
  }
  value = parsed;
}

}  // namespace

ServiceConfig load_config_from_env() {
  ServiceConfig config{};
  read_env_string("CLOUDCOVER_PRODUCT", config.product);
  read_env_string("CLOUDCOVER_SATELLITE", config.satellite);
  read_env_string("CLOUDCOVER_ARCHIVE_DOMAIN", config.archive_domain);
  if (auto dir = read_env("CLOUDCOVER_WORK_DIR")) {
    config.work_dir = *dir;
  }
  read_env_long("CLOUDCOVER_HTTP_TIMEOUT_S", config.http_timeout_s, 0, 86400);
  long port = config.port;
  read_env_long("CLOUDCOVER_PORT", port, 1, 65535);
  config.port = static_cast<int>(port);
  read_env_double("CLOUDCOVER_IR_THRESHOLD_K", config.classifier.ir_threshold_k);
  read_env_double("CLOUDCOVER_VIS_THRESHOLD", config.classifier.vis_threshold);
  read_env_string("CLOUDCOVER_LOG_LEVEL", config.log_level);
  return config;
}

std::filesystem::path resolve_work_dir(const ServiceConfig& config) {
  if (!config.work_dir.empty()) {
    return config.work_dir;
  }
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    spdlog::warn("no system temp directory ({}), using /tmp", ec.message());
    return "/tmp";
  }
  return tmp;
}

bool configure_logging(std::string_view level) {
  static constexpr std::string_view kNames[] = {"trace", "debug", "info", "warn", "error", "off"};
  for (const auto name : kNames) {
    if (name == level) {
      spdlog::set_level(spdlog::level::from_str(std::string(level)));
      return true;
    }
  }
  spdlog::warn("unknown log level '{}'", level);
  return false;
}

}  // namespace cloudcover::service
