/**
 * @file scan_fetcher.cpp
 * @brief Scan fetcher implementation.
 * @author Watosn
 */

#include "cloudcover/archive/scan_fetcher.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace cloudcover::archive {

std::string object_url(const cloudcover::core::ScanReference& reference, const std::string& archive_domain) {
  return fmt::format("https://{}.{}/{}", reference.satellite, archive_domain, reference.path);
}

std::string url_basename(const std::string& url) {
  const auto slash = url.find_last_of('/');
  return slash == std::string::npos ? url : url.substr(slash + 1);
}

FetchResult ScanFetcher::fetch(const cloudcover::core::ScanReference& reference,
                               const std::filesystem::path& output_path) const {
  using cloudcover::core::Status;

  if (reference.path.empty() || reference.satellite.empty()) {
    spdlog::error("fetch rejected: scan reference has an empty satellite or path");
    return FetchResult{.status = Status::InvalidInput, .detail = "empty scan reference"};
  }

  const std::string url = object_url(reference, archive_domain_);
  std::filesystem::path destination = output_path;
  if (destination.empty()) {
    const std::string name = url_basename(url);
    if (name.empty()) {
      spdlog::error("fetch rejected: no filename in {}", url);
      return FetchResult{.url = url, .status = Status::InvalidInput, .detail = "URL has no filename"};
    }
    destination = name;
  }

  const int code = transfer_.download(url, destination);
  if (code != 0) {
    spdlog::error("Error downloading {} (transfer status {})", url, code);
    return FetchResult{.local_path = destination,
                       .url = url,
                       .transfer_code = code,
                       .status = Status::FetchFailed,
                       .detail = fmt::format("transfer exited with status {}", code)};
  }

  spdlog::info("Successfully downloaded {} -> {}", url, destination.string());
  return FetchResult{.local_path = destination, .url = url, .status = Status::Ok};
}

}  // namespace cloudcover::archive
