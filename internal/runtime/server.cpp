#include "server.hpp"

#include <stdexcept>

#include "internal/discovery/broadcaster.hpp"
#include "internal/discovery/network_interfaces.hpp"
#include "internal/http/http_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/client_tracker.hpp"
#include "internal/sync/event_hub.hpp"

namespace gearledger::runtime {

namespace {

// Multipart framing and headers around the largest accepted catalog.
constexpr std::size_t kUploadOverheadBytes = 64 * 1024;

} // namespace

Server::Server(gearledger::runtime::config::RuntimeConfig config, gearledger::factory::Application app)
    : config_(std::move(config)), app_(std::move(app)) {
  if (!app_.routes || !app_.events || !app_.clients) {
    throw std::invalid_argument("Server requires a fully built application");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (running_) {
    return;
  }

  gearledger::http::HttpServerOptions options;
  options.bind_address   = config_.server().bind_address();
  options.port           = static_cast<uint16_t>(config_.server().port());
  options.max_body_bytes = config_.sync().max_catalog_bytes() + kUploadOverheadBytes;

  http_ = std::make_unique<gearledger::http::HttpServer>(options, app_.routes);
  http_->Start();
  app_.clients->Start();

  const auto& discovery = config_.discovery();
  if (discovery.enabled()) {
    gearledger::discovery::BroadcasterOptions broadcast;
    broadcast.name           = config_.server().name();
    broadcast.server_port    = http_->Port();
    broadcast.discovery_port = static_cast<uint16_t>(discovery.port());
    broadcast.interval       = std::chrono::milliseconds(discovery.interval_ms());
    broadcast.broadcast_addresses.assign(discovery.broadcast_addresses().begin(), discovery.broadcast_addresses().end());

    broadcaster_ = std::make_unique<gearledger::discovery::ServerBroadcaster>(std::move(broadcast));
    broadcaster_->Start();
  }

  running_ = true;
  GEARLEDGER_LOG_INFO("Sync server started", {observability::StringField("url", Url()),
                                              observability::StringField("name", config_.server().name()),
                                              observability::BoolField("discovery", discovery.enabled())});
}

void Server::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  if (broadcaster_) {
    broadcaster_->Stop();
    broadcaster_.reset();
  }
  // Release SSE workers blocked on their queues before joining connections.
  app_.events->CloseAll();
  http_->Stop();
  app_.clients->Stop();

  GEARLEDGER_LOG_INFO("Sync server stopped");
}

bool Server::IsRunning() const {
  return running_;
}

uint16_t Server::Port() const {
  return http_ ? http_->Port() : 0;
}

std::string Server::Url() const {
  return gearledger::discovery::ServerUrl(gearledger::discovery::PrimaryAddress(), Port());
}

} // namespace gearledger::runtime
