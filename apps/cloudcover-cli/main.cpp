/**
 * @file main.cpp
 * @brief cloudcover command-line entrypoint.
 * @author Watosn
 */

#include <exception>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cloudcover/archive/scan_fetcher.hpp"
#include "cloudcover/archive/scan_locator.hpp"
#include "cloudcover/core/time_utils.hpp"
#include "cloudcover/dataset/hdf5_scan_loader.hpp"
#include "cloudcover/service/cloud_cover_service.hpp"
#include "cloudcover/service/report_json.hpp"
#include "cloudcover/service/service_config.hpp"

namespace {

void usage() {
  spdlog::error("usage: cloudcover_cli [run [epoch_utc_s] | locate [epoch_utc_s] | inspect <file>]");
  spdlog::error("run: locate, download and classify the newest scan (default)");
  spdlog::error("locate: print the newest scan of the current hour without downloading it");
  spdlog::error("inspect: list the variables and classify a local netCDF-4 file");
}

std::optional<cloudcover::core::Epoch> epoch_arg(int argc, char** argv) {
  if (argc >= 3) {
    return cloudcover::core::parse_epoch(argv[2]);
  }
  return cloudcover::core::now_utc();
}

int inspect(const std::string& file, const cloudcover::service::ServiceConfig& config) {
  const auto variables = cloudcover::dataset::Hdf5ScanLoader::list_variables(file);
  if (variables.empty()) {
    spdlog::error("no variables readable from {}", file);
    return 2;
  }
  fmt::print("variables ({}):\n", variables.size());
  for (const auto& name : variables) {
    fmt::print("  {}\n", name);
  }

  const cloudcover::classify::CloudClassifier classifier(config.classifier);
  const cloudcover::dataset::Hdf5ScanLoader loader{};
  const auto loaded = loader.load(file, classifier.required_bands());
  if (loaded.status != cloudcover::core::Status::Ok) {
    spdlog::error("cannot decode {}: {}", file, loaded.detail);
    return 3;
  }
  const auto result = classifier.classify(loaded.scan, file);
  if (result.status != cloudcover::core::Status::Ok) {
    spdlog::error("classification failed: {}", cloudcover::core::status_name(result.status));
    return 4;
  }
  fmt::print("time_coverage_start={}\n", loaded.scan.attribute("time_coverage_start").value_or("<absent>"));
  fmt::print("daytime={}\n", result.daytime ? "true" : "false");
  fmt::print("cloudy_pixels={}\n", result.cloudy_pixels);
  fmt::print("valid_pixels={}\n", result.valid_pixels);
  fmt::print("cloud_cover_percent={:.6f}\n", result.percent);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const auto config = cloudcover::service::load_config_from_env();
  cloudcover::service::configure_logging(config.log_level);

  const std::string command = (argc >= 2) ? argv[1] : "run";
  if (command == "inspect") {
    if (argc != 3) {
      usage();
      return 1;
    }
    return inspect(argv[2], config);
  }
  if (command != "run" && command != "locate") {
    usage();
    return 1;
  }

  const auto epoch = epoch_arg(argc, argv);
  if (!epoch) {
    spdlog::error("cannot read '{}' as an ISO-8601 timestamp or Unix seconds", argv[2]);
    usage();
    return 1;
  }
  const cloudcover::core::Epoch now = *epoch;
  const auto backends = cloudcover::service::ServiceBackends::Create(config);

  if (command == "locate") {
    const cloudcover::archive::ScanLocator locator(*backends.lister);
    const auto located = locator.find_latest(config.product, config.satellite, now);
    if (located.status != cloudcover::core::Status::Ok) {
      spdlog::error("{}: {}", cloudcover::service::kErrorNoRecentFiles, located.detail);
      return 2;
    }
    fmt::print("prefix={}\n", located.prefix);
    fmt::print("satellite={}\n", located.reference.satellite);
    fmt::print("path={}\n", located.reference.path);
    fmt::print("url={}\n", cloudcover::archive::object_url(located.reference, config.archive_domain));
    return 0;
  }

  const cloudcover::service::CloudCoverService service(config, *backends.lister, *backends.transfer,
                                                       *backends.loader);
  cloudcover::service::CloudCoverReport report{};
  try {
    report = service.run(now);
  } catch (const std::exception& e) {
    spdlog::error("cloud cover run failed: {}", e.what());
    fmt::print("{}\n", cloudcover::service::error_payload(cloudcover::service::kErrorProcessingFailed).dump(2));
    return 2;
  }
  fmt::print("{}\n", cloudcover::service::report_payload(report).dump(2, ' ', false,
                                                                     nlohmann::json::error_handler_t::replace));
  return report.status == cloudcover::core::Status::Ok ? 0 : 2;
}
