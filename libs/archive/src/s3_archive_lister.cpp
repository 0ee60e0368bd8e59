/**
 * @file s3_archive_lister.cpp
 * @brief S3 ListObjectsV2 listing implementation.
 * @author Watosn
 */

#include "cloudcover/archive/s3_archive_lister.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <spdlog/spdlog.h>

namespace cloudcover::archive {
namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using XmlDoc = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string escape(CURL* curl, const std::string& text) {
  char* raw = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
  if (raw == nullptr) {
    return {};
  }
  std::string out(raw);
  curl_free(raw);
  return out;
}

bool is_element(const xmlNode* node, const char* name) {
  return node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, BAD_CAST name) != 0;
}

std::string node_text(const xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return {};
  }
  std::string out(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return out;
}

const xmlNode* first_child(const xmlNode* parent, const char* name) {
  for (const xmlNode* n = parent->children; n != nullptr; n = n->next) {
    if (is_element(n, name)) {
      return n;
    }
  }
  return nullptr;
}

struct HttpReply {
  CURLcode code{CURLE_OK};
  long http_status{};
  std::string body{};
};

HttpReply http_get(CURL* curl, const std::string& url, long timeout_s, const std::string& user_agent) {
  HttpReply reply{};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
  reply.code = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.http_status);
  return reply;
}

}  // namespace

S3ArchiveLister::Page S3ArchiveLister::parse_page(const std::string& xml) {
  using cloudcover::core::Status;

  XmlDoc doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "listing.xml", nullptr,
                           XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
             &xmlFreeDoc);
  if (!doc) {
    return Page{.status = Status::DataUnavailable, .detail = "malformed listing response"};
  }
  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (root == nullptr) {
    return Page{.status = Status::DataUnavailable, .detail = "empty listing response"};
  }

  if (is_element(root, "Error")) {
    const xmlNode* code = first_child(root, "Code");
    const xmlNode* message = first_child(root, "Message");
    return Page{.status = Status::DataUnavailable,
                .detail = fmt::format("{}: {}", code ? node_text(code) : "Error", message ? node_text(message) : "")};
  }
  if (!is_element(root, "ListBucketResult")) {
    return Page{.status = Status::DataUnavailable,
                .detail = fmt::format("unexpected listing root <{}>", reinterpret_cast<const char*>(root->name))};
  }

  Page page{};
  for (const xmlNode* n = root->children; n != nullptr; n = n->next) {
    if (is_element(n, "Contents")) {
      if (const xmlNode* key = first_child(n, "Key")) {
        page.keys.push_back(node_text(key));
      }
    } else if (is_element(n, "IsTruncated")) {
      page.truncated = node_text(n) == "true";
    } else if (is_element(n, "NextContinuationToken")) {
      page.continuation_token = node_text(n);
    }
  }
  return page;
}

cloudcover::core::ListingResult S3ArchiveLister::list(const std::string& prefix) const {
  using cloudcover::core::Status;

  const auto slash = prefix.find('/');
  const std::string bucket = prefix.substr(0, slash);
  const std::string key_prefix = (slash == std::string::npos) ? std::string{} : prefix.substr(slash + 1);
  if (bucket.empty()) {
    return cloudcover::core::ListingResult{.status = Status::InvalidInput, .detail = "listing prefix has no bucket"};
  }

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return cloudcover::core::ListingResult{.status = Status::DataUnavailable, .detail = "curl_easy_init failed"};
  }

  const std::string base =
      fmt::format("https://{}.{}/?list-type=2&prefix={}", bucket, config_.archive_domain, escape(curl.get(), key_prefix));

  cloudcover::core::ListingResult result{};
  std::string token{};
  for (int page_index = 0; page_index < config_.max_pages; ++page_index) {
    const std::string url = token.empty() ? base : base + "&continuation-token=" + escape(curl.get(), token);
    spdlog::debug("[NET] listing {}", url);

    const HttpReply reply = http_get(curl.get(), url, config_.timeout_s, config_.user_agent);
    if (reply.code != CURLE_OK) {
      return cloudcover::core::ListingResult{.status = Status::DataUnavailable,
                                             .detail = curl_easy_strerror(reply.code)};
    }

    Page page = parse_page(reply.body);
    if (reply.http_status >= 400) {
      return cloudcover::core::ListingResult{
          .status = Status::DataUnavailable,
          .detail = fmt::format("HTTP {}{}", reply.http_status, page.detail.empty() ? "" : " " + page.detail)};
    }
    if (page.status != Status::Ok) {
      return cloudcover::core::ListingResult{.status = page.status, .detail = page.detail};
    }

    for (const auto& key : page.keys) {
      result.entries.push_back(bucket + "/" + key);
    }
    if (!page.truncated || page.continuation_token.empty()) {
      std::sort(result.entries.begin(), result.entries.end());
      return result;
    }
    token = std::move(page.continuation_token);
  }

  spdlog::warn("listing of {} stopped after {} pages", prefix, config_.max_pages);
  std::sort(result.entries.begin(), result.entries.end());
  return result;
}

}  // namespace cloudcover::archive
