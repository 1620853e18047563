#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_server.hpp"

namespace gearledger::ledger { class ResultLedger; }
namespace gearledger::service { class SyncService; }
namespace gearledger::sync {
class SyncState;
class EventHub;
class ClientTracker;
class SyncObserver;
}

namespace gearledger::factory {

/*
  Application

  Owns every long-lived component of a sync server. Nothing here is a
  process-wide singleton; tests build as many as they need.
*/
struct Application {
  std::shared_ptr<ledger::ResultLedger> ledger;

  std::shared_ptr<sync::SyncState>     state;
  std::shared_ptr<sync::EventHub>      events;
  std::shared_ptr<sync::ClientTracker> clients;

  std::shared_ptr<service::SyncService> sync_service;
  http::RouteInstaller                  routes;
};

/*
  Build

  Composition root: opens (and if needed creates) the SQLite database,
  bootstraps the schema and wires the sync endpoints.

  It is the ONLY place that knows the concrete storage types.
*/
Application Build(const gearledger::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<sync::SyncObserver>                observer = nullptr);

} // namespace gearledger::factory
