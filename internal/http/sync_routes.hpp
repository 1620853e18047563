#pragma once

#include <chrono>
#include <memory>

#include "http_server.hpp"

namespace gearledger::service { class SyncService; }

namespace gearledger::http {

/*
  HTTP adapter for SyncService: decodes requests, encodes proto responses as
  JSON and maps exceptions through http_error.
*/
RouteInstaller BuildSyncRoutes(std::shared_ptr<gearledger::service::SyncService> service,
                               std::chrono::milliseconds                         keepalive_interval);

} // namespace gearledger::http
