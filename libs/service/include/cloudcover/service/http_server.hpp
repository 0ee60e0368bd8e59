/**
 * @file http_server.hpp
 * @brief Minimal blocking HTTP/1.1 server for the health and cloud cover routes.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "cloudcover/service/cloud_cover_service.hpp"

namespace cloudcover::service {

/**
 * @brief Response to serialize back to the client.
 */
struct HttpResponse {
  int status_code{200};
  std::string content_type{"application/json"};
  std::string body{};
};

/**
 * @brief Method and path (query string removed) of a request.
 */
struct RequestLine {
  std::string method{};
  std::string path{};
};

/**
 * @brief Parse `METHOD /path[?query] HTTP/x.y` from the first request line.
 */
[[nodiscard]] std::optional<RequestLine> parse_request_line(const std::string& request);

/**
 * @brief Reason phrase for the status codes this server emits.
 */
[[nodiscard]] const char* reason_phrase(int status_code);

/**
 * @brief Full response text including status line and headers.
 */
[[nodiscard]] std::string format_response(const HttpResponse& response);

/**
 * @brief Serves `GET /health` and `GET /cloud-cover`, one connection at a time.
 */
class HttpServer {
 public:
  using ReportHandler = std::function<CloudCoverReport()>;

  /**
   * @brief Listener settings.
   */
  struct Config {
    int port{kDefaultPort};
    int backlog{10};
    int poll_interval_ms{250};
    std::size_t max_request_bytes{8192};
  };

  HttpServer(Config config, ReportHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Map a raw request to a response without touching any socket.
   */
  [[nodiscard]] HttpResponse route(const std::string& request) const;

  /**
   * @brief Bind and listen on `config.port`.
   * @return False when the socket cannot be set up; the cause is logged.
   */
  [[nodiscard]] bool start();

  /**
   * @brief Accept and answer connections until `request_stop` is called.
   */
  void run_blocking();

  /**
   * @brief Ask `run_blocking` to return. Only touches an atomic flag, so it is safe from a
   *        signal handler.
   */
  void request_stop() noexcept { running_.store(false); }

  /**
   * @brief Close the listening socket.
   */
  void stop();

  [[nodiscard]] int port() const { return config_.port; }

 private:
  void serve_client(int client_fd) const;

  Config config_{};
  ReportHandler handler_{};
  int server_fd_{-1};
  std::atomic<bool> running_{false};
};

}  // namespace cloudcover::service
