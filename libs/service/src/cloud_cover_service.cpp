/**
 * @file cloud_cover_service.cpp
 * @brief Cloud cover pipeline implementation.
 * @author Watosn
 */

#include "cloudcover/service/cloud_cover_service.hpp"

#include <random>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cloudcover/archive/curl_transfer_client.hpp"
#include "cloudcover/archive/s3_archive_lister.hpp"
#include "cloudcover/archive/scan_fetcher.hpp"
#include "cloudcover/archive/scan_locator.hpp"
#include "cloudcover/archive/scoped_artifact.hpp"
#include "cloudcover/dataset/hdf5_scan_loader.hpp"

namespace cloudcover::service {

using cloudcover::core::Status;

ServiceBackends ServiceBackends::Create(const ServiceConfig& config) {
  ServiceBackends backends{};
  backends.lister = std::make_unique<cloudcover::archive::S3ArchiveLister>(cloudcover::archive::S3ArchiveLister::Config{
      .archive_domain = config.archive_domain, .timeout_s = config.http_timeout_s});
  backends.transfer = std::make_unique<cloudcover::archive::CurlTransferClient>(
      cloudcover::archive::CurlTransferClient::Config{.timeout_s = config.http_timeout_s});
  backends.loader = std::make_unique<cloudcover::dataset::Hdf5ScanLoader>();
  return backends;
}

std::string make_request_id() {
  std::random_device rd;
  const std::uint64_t hi = rd();
  const std::uint64_t lo = rd();
  return fmt::format("{:016x}", (hi << 32) ^ lo);
}

CloudCoverService::CloudCoverService(ServiceConfig config, const cloudcover::core::IArchiveLister& lister,
                                     const cloudcover::core::ITransferClient& transfer,
                                     const cloudcover::core::IScanLoader& loader)
    : config_(std::move(config)),
      work_dir_(resolve_work_dir(config_)),
      lister_(lister),
      transfer_(transfer),
      loader_(loader),
      classifier_(config_.classifier) {}

std::filesystem::path CloudCoverService::artifact_path(const cloudcover::core::ScanReference& reference,
                                                       const std::string& request_id) const {
  return work_dir_ / fmt::format("{}-{}", request_id, cloudcover::archive::url_basename(reference.path));
}

CloudCoverReport CloudCoverService::run(const cloudcover::core::Epoch& now) const {
  const cloudcover::archive::ScanLocator locator(lister_);
  const auto located = locator.find_latest(config_.product, config_.satellite, now);
  if (located.status != Status::Ok) {
    spdlog::warn("no scan located under {}: {}", located.prefix, located.detail);
    return CloudCoverReport{.status = located.status, .error = kErrorNoRecentFiles, .detail = located.detail};
  }
  spdlog::info("Latest scan: {}/{}", located.reference.satellite, located.reference.path);

  const cloudcover::archive::ScanFetcher fetcher(transfer_, config_.archive_domain);
  cloudcover::archive::ScopedArtifact artifact(artifact_path(located.reference, make_request_id()));
  const auto fetched = fetcher.fetch(located.reference, artifact.file());
  if (fetched.status != Status::Ok) {
    return CloudCoverReport{.status = fetched.status,
                            .source_file = located.reference.path,
                            .error = kErrorDownloadFailed,
                            .detail = fetched.detail};
  }

  const auto loaded = loader_.load(artifact.file(), classifier_.required_bands());
  if (loaded.status != Status::Ok) {
    spdlog::error("cannot decode {}: {}", artifact.file().string(), loaded.detail);
    return CloudCoverReport{.status = loaded.status,
                            .source_file = located.reference.path,
                            .error = kErrorProcessingFailed,
                            .detail = loaded.detail};
  }

  const auto fraction = classifier_.classify(loaded.scan, located.reference.path);
  if (fraction.status != Status::Ok) {
    return CloudCoverReport{.status = fraction.status,
                            .source_file = located.reference.path,
                            .error = kErrorProcessingFailed,
                            .detail = fmt::format("classification failed ({})", status_name(fraction.status))};
  }

  spdlog::info("cloud cover {:.2f}% for {}", fraction.percent, located.reference.path);
  return CloudCoverReport{.status = Status::Ok,
                          .cloud_cover_percent = fraction.percent,
                          .source_file = located.reference.path,
                          .daytime = fraction.daytime,
                          .cloudy_pixels = fraction.cloudy_pixels,
                          .valid_pixels = fraction.valid_pixels};
}

}  // namespace cloudcover::service
