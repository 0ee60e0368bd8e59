/**
 * @file http_server.cpp
 * @brief Blocking HTTP server implementation over POSIX sockets.
 * @author Watosn
 */

#include "cloudcover/service/http_server.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <sstream>
#include <utility>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cloudcover/service/report_json.hpp"

namespace cloudcover::service {
namespace {

std::string dump(const nlohmann::json& payload) {
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpResponse json_response(int status_code, const nlohmann::json& payload) {
  return HttpResponse{.status_code = status_code, .body = dump(payload)};
}

bool send_all(int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t bytes = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(bytes);
  }
  return true;
}

}  // namespace

std::optional<RequestLine> parse_request_line(const std::string& request) {
  std::istringstream ss(request.substr(0, request.find("\r\n")));
  RequestLine line{};
  std::string version{};
  if (!(ss >> line.method >> line.path >> version) || line.path.empty() || line.path.front() != '/' ||
      version.rfind("HTTP/", 0) != 0) {
    return std::nullopt;
  }
  line.path = line.path.substr(0, line.path.find('?'));
  return line;
}

const char* reason_phrase(int status_code) {
  switch (status_code) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    default:
      return "Internal Server Error";
  }
}

std::string format_response(const HttpResponse& response) {
  std::string out = fmt::format(
      "HTTP/1.1 {} {}\r\nContent-Type: {}\r\nCache-Control: no-cache, no-store\r\nConnection: close\r\n"
      "Content-Length: {}\r\n",
      response.status_code, reason_phrase(response.status_code), response.content_type, response.body.size());
  if (response.status_code == 405) {
    out += "Allow: GET\r\n";
  }
  out += "\r\n";
  out += response.body;
  return out;
}

HttpServer::HttpServer(Config config, ReportHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

HttpServer::~HttpServer() { stop(); }

HttpResponse HttpServer::route(const std::string& request) const {
  const auto line = parse_request_line(request);
  if (!line) {
    return json_response(400, error_payload("Bad request"));
  }
  const bool known = line->path == "/health" || line->path == "/cloud-cover";
  if (!known) {
    return json_response(404, error_payload("Not found"));
  }
  if (line->method != "GET") {
    return json_response(405, error_payload("Method not allowed"));
  }
  if (line->path == "/health") {
    return json_response(200, health_payload());
  }
  if (!handler_) {
    return json_response(200, error_payload(kErrorProcessingFailed));
  }
  try {
    return json_response(200, report_payload(handler_()));
  } catch (const std::exception& e) {
    spdlog::error("cloud cover request failed: {}", e.what());
    return json_response(200, error_payload(kErrorProcessingFailed));
  }
}

bool HttpServer::start() {
  server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    spdlog::error("socket() failed: {}", std::strerror(errno));
    return false;
  }
  int opt = 1;
  ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_ANY);
  address.sin_port = htons(static_cast<std::uint16_t>(config_.port));
  if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
    spdlog::error("bind to port {} failed: {}", config_.port, std::strerror(errno));
    stop();
    return false;
  }
  if (::listen(server_fd_, config_.backlog) < 0) {
    spdlog::error("listen on port {} failed: {}", config_.port, std::strerror(errno));
    stop();
    return false;
  }
  running_.store(true);
  spdlog::info("HTTP server listening on port {}", config_.port);
  return true;
}

void HttpServer::run_blocking() {
  while (running_.load() && server_fd_ >= 0) {
    pollfd pfd{.fd = server_fd_, .events = POLLIN, .revents = 0};
    const int ready = ::poll(&pfd, 1, config_.poll_interval_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      spdlog::error("poll() failed: {}", std::strerror(errno));
      break;
    }
    if (ready == 0) {
      continue;
    }
    const int client = ::accept(server_fd_, nullptr, nullptr);
    if (client < 0) {
      if (errno != EINTR) {
        spdlog::warn("accept() failed: {}", std::strerror(errno));
      }
      continue;
    }
    serve_client(client);
    ::shutdown(client, SHUT_WR);
    ::close(client);
  }
  spdlog::info("HTTP server on port {} stopped", config_.port);
}

void HttpServer::serve_client(int client_fd) const {
  std::string request{};
  char buffer[4096];
  while (request.find("\r\n\r\n") == std::string::npos && request.size() < config_.max_request_bytes) {
    const ssize_t bytes = ::recv(client_fd, buffer, sizeof(buffer), 0);
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes <= 0) {
      break;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
  }
  if (request.empty()) {
    return;
  }

  const HttpResponse response = route(request);
  const auto line = parse_request_line(request);
  spdlog::info("{} {} -> {}", line ? line->method : "?", line ? line->path : "?", response.status_code);
  if (!send_all(client_fd, format_response(response))) {
    spdlog::warn("client disconnected before the response was sent");
  }
}

void HttpServer::stop() {
  running_.store(false);
  if (server_fd_ >= 0) {
    ::close(server_fd_);
    server_fd_ = -1;
  }
}

}  // namespace cloudcover::service
