/**
 * @file curl_transfer_client.cpp
 * @brief libcurl transfer implementation.
 * @author Watosn
 */

#include "cloudcover/archive/curl_transfer_client.hpp"

#include <cstdio>
#include <memory>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace cloudcover::archive {
namespace {

// Returned when the destination cannot be opened or flushed; outside the CURLcode range in use.
constexpr int kLocalWriteError = 1000;

size_t write_to_file(void* contents, size_t size, size_t nmemb, void* userp) {
  return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp)) * size;
}

}  // namespace

int CurlTransferClient::download(const std::string& url, const std::filesystem::path& destination) const {
  if (url.empty()) {
    return static_cast<int>(CURLE_URL_MALFORMAT);
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return static_cast<int>(CURLE_FAILED_INIT);
  }

  std::FILE* out = std::fopen(destination.c_str(), "wb");
  if (out == nullptr) {
    spdlog::error("[NET] cannot open {} for writing", destination.string());
    return kLocalWriteError;
  }

  spdlog::debug("[NET] Downloading: {}", url);
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_s);

  const CURLcode res = curl_easy_perform(curl.get());
  const bool closed = std::fclose(out) == 0;

  if (res != CURLE_OK) {
    spdlog::error("[NET] download failed: {}", curl_easy_strerror(res));
    return static_cast<int>(res);
  }
  if (!closed) {
    spdlog::error("[NET] failed to flush {}", destination.string());
    return kLocalWriteError;
  }

  curl_off_t bytes = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_SIZE_DOWNLOAD_T, &bytes);
  spdlog::debug("[NET] OK ({} bytes)", static_cast<long long>(bytes));
  return 0;
}

}  // namespace cloudcover::archive
