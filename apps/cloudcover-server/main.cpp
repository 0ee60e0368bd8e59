/**
 * @file main.cpp
 * @brief cloudcover HTTP server entrypoint.
 * @author Watosn
 */

#include <csignal>

#include <spdlog/spdlog.h>

#include "cloudcover/core/time_utils.hpp"
#include "cloudcover/service/cloud_cover_service.hpp"
#include "cloudcover/service/http_server.hpp"
#include "cloudcover/service/service_config.hpp"

namespace {

cloudcover::service::HttpServer* g_server = nullptr;

extern "C" void handle_signal(int /*signum*/) {
  if (g_server != nullptr) {
    g_server->request_stop();
  }
}

}  // namespace

int main() {
  const auto config = cloudcover::service::load_config_from_env();
  cloudcover::service::configure_logging(config.log_level);

  const auto backends = cloudcover::service::ServiceBackends::Create(config);
  const cloudcover::service::CloudCoverService service(config, *backends.lister, *backends.transfer,
                                                       *backends.loader);

  cloudcover::service::HttpServer server(cloudcover::service::HttpServer::Config{.port = config.port},
                                         [&service]() { return service.run(cloudcover::core::now_utc()); });
  if (!server.start()) {
    return 1;
  }
  g_server = &server;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  spdlog::info("serving {} from {} (satellite {})", config.product, config.archive_domain, config.satellite);
  server.run_blocking();
  g_server = nullptr;
  return 0;
}
