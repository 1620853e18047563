#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/http/sync_routes.hpp"
#include "internal/ledger/result_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/sync_service.hpp"
#include "internal/sync/client_tracker.hpp"
#include "internal/sync/event_hub.hpp"
#include "internal/sync/sync_observer.hpp"
#include "internal/sync/sync_state.hpp"

namespace gearledger::factory {

namespace {

std::shared_ptr<db::ResultsRepository> BuildRepository(const gearledger::runtime::config::SqliteConfig& sqlite) {
  const std::filesystem::path path(sqlite.path());
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create database directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto pool = std::make_shared<db::sqlite::SqlitePool>(sqlite.path(), std::chrono::milliseconds(sqlite.busy_timeout_ms()),
                                                       sqlite.max_connections());
  {
    auto conn = pool->Acquire();
    db::sqlite::BootstrapSchema(*conn);
  }

  GEARLEDGER_LOG_INFO("Results database ready", {observability::StringField("path", sqlite.path()),
                                                 observability::IntField("busy_timeout_ms", sqlite.busy_timeout_ms())});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
}

} // namespace

Application Build(const gearledger::runtime::config::RuntimeConfig& config, std::shared_ptr<sync::SyncObserver> observer) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.ledger = std::make_shared<ledger::ResultLedger>(BuildRepository(config.database().sqlite()));

  // ------------------------------------------------------------------
  // Sync core
  // ------------------------------------------------------------------
  const auto& sync_config = config.sync();
  app.state               = std::make_shared<sync::SyncState>();
  app.events              = std::make_shared<sync::EventHub>(sync_config.subscriber_queue_capacity());
  app.clients             = std::make_shared<sync::ClientTracker>(std::chrono::milliseconds(sync_config.client_stale_after_ms()),
                                                                  std::chrono::milliseconds(sync_config.client_sweep_interval_ms()),
                                                                  observer);

  // ------------------------------------------------------------------
  // Endpoints
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger            = app.ledger;
  ctx.state             = app.state;
  ctx.events            = app.events;
  ctx.clients           = app.clients;
  ctx.observer          = std::move(observer);
  ctx.server_name       = config.server().name();
  ctx.max_catalog_bytes = sync_config.max_catalog_bytes();

  app.sync_service = std::make_shared<service::SyncService>(ctx);
  app.routes       = http::BuildSyncRoutes(app.sync_service, std::chrono::milliseconds(sync_config.keepalive_interval_ms()));

  return app;
}

} // namespace gearledger::factory
