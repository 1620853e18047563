#include "http_server.hpp"

#include <httplib.h>

#include <stdexcept>

#include "http_error.hpp"
#include "internal/observability/logging.hpp"

namespace gearledger::http {

namespace {

void Configure(httplib::Server& server, const HttpServerOptions& options) {
  const auto workers = options.worker_threads;
  server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  server.set_payload_max_length(options.max_body_bytes);
  server.set_default_headers({{"Server", "GearLedger"}, {"Access-Control-Allow-Origin", "*"}});

  // Runs for every status >= 400; handler failures already carry a body.
  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.body.empty()) {
      res.set_content(ErrorBody(StatusMessage(res.status)), "application/json");
    }
  });

  server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    GEARLEDGER_LOG_DEBUG("HTTP request", {observability::StringField("method", req.method),
                                          observability::StringField("path", req.path),
                                          observability::StringField("peer", req.remote_addr),
                                          observability::IntField("status", res.status)});
  });
}

} // namespace

HttpServer::HttpServer(HttpServerOptions options, RouteInstaller routes)
    : options_(std::move(options)), routes_(std::move(routes)) {
  if (!routes_) {
    throw std::invalid_argument("HttpServer requires routes");
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  if (running_.load()) {
    return;
  }

  server_ = std::make_unique<httplib::Server>();
  Configure(*server_, options_);
  routes_(*server_);

  int bound_port = -1;
  if (options_.port == 0) {
    bound_port = server_->bind_to_any_port(options_.bind_address);
  } else if (server_->bind_to_port(options_.bind_address, options_.port)) {
    bound_port = options_.port;
  }
  if (bound_port <= 0) {
    server_.reset();
    throw std::runtime_error("failed to listen on " + options_.bind_address + ":" + std::to_string(options_.port));
  }

  port_ = static_cast<uint16_t>(bound_port);
  running_.store(true);
  listen_thread_ = std::thread([this] {
    if (!server_->listen_after_bind()) {
      GEARLEDGER_LOG_WARN("HTTP listener exited", {observability::IntField("port", port_)});
    }
  });
  server_->wait_until_ready();

  GEARLEDGER_LOG_INFO("HTTP server listening",
                      {observability::StringField("bind_address", options_.bind_address), observability::IntField("port", port_)});
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  server_->stop();
  if (listen_thread_.joinable()) {
    listen_thread_.join();
  }
  server_.reset();

  GEARLEDGER_LOG_INFO("HTTP server stopped", {observability::IntField("port", port_)});
}

uint16_t HttpServer::Port() const {
  return port_;
}

} // namespace gearledger::http
