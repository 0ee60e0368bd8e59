/**
 * @file cloud_cover_service.hpp
 * @brief Locate, fetch, decode and classify the newest scan.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>

#include "cloudcover/classify/cloud_classifier.hpp"
#include "cloudcover/core/interfaces.hpp"
#include "cloudcover/core/types.hpp"
#include "cloudcover/service/service_config.hpp"

namespace cloudcover::service {

inline constexpr const char* kErrorNoRecentFiles = "No recent GOES files found";
inline constexpr const char* kErrorDownloadFailed = "Failed to download GOES file";
inline constexpr const char* kErrorProcessingFailed = "Failed to process GOES file";

/**
 * @brief Outcome of one service run.
 *
 * On success `error` is empty and `source_file` holds the object key inside the bucket. A NaN
 * `cloud_cover_percent` with `Ok` status means the scan had no valid IR pixel.
 */
struct CloudCoverReport {
  cloudcover::core::Status status{cloudcover::core::Status::Ok};
  double cloud_cover_percent{std::numeric_limits<double>::quiet_NaN()};
  std::string source_file{};
  std::string error{};
  std::string detail{};
  bool daytime{true};
  std::int64_t cloudy_pixels{};
  std::int64_t valid_pixels{};
};

/**
 * @brief Production listing, transfer and decoding backends.
 */
struct ServiceBackends {
  std::unique_ptr<cloudcover::core::IArchiveLister> lister{};
  std::unique_ptr<cloudcover::core::ITransferClient> transfer{};
  std::unique_ptr<cloudcover::core::IScanLoader> loader{};

  /**
   * @brief S3 listing, libcurl transfer and HDF5 decoding configured from `config`.
   */
  static ServiceBackends Create(const ServiceConfig& config);
};

/**
 * @brief One-shot pipeline: newest scan of the current hour to a cloud fraction.
 *
 * Each run downloads into `{work_dir}/{request-id}-{basename}` and removes that file on every
 * exit path, including a failed or partial transfer.
 */
class CloudCoverService {
 public:
  /**
   * @brief Construct service over injected backends.
   * @param config Product, satellite, archive and classifier settings.
   * @param lister Archive listing backend.
   * @param transfer Download backend.
   * @param loader Scan decoder.
   */
  CloudCoverService(ServiceConfig config, const cloudcover::core::IArchiveLister& lister,
                    const cloudcover::core::ITransferClient& transfer, const cloudcover::core::IScanLoader& loader);

  /**
   * @brief Run the pipeline for the hour containing `now`.
   */
  [[nodiscard]] CloudCoverReport run(const cloudcover::core::Epoch& now) const;

  /**
   * @brief Local path a run with `request_id` would download `reference` to.
   */
  [[nodiscard]] std::filesystem::path artifact_path(const cloudcover::core::ScanReference& reference,
                                                    const std::string& request_id) const;

  [[nodiscard]] const ServiceConfig& config() const { return config_; }

 private:
  ServiceConfig config_{};
  std::filesystem::path work_dir_{};
  const cloudcover::core::IArchiveLister& lister_;
  const cloudcover::core::ITransferClient& transfer_;
  const cloudcover::core::IScanLoader& loader_;
  cloudcover::classify::CloudClassifier classifier_{};
};

/**
 * @brief Random 16-hex-digit identifier used to keep concurrent downloads apart.
 */
[[nodiscard]] std::string make_request_id();

}  // namespace cloudcover::service
