#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace gearledger::ledger { class ResultLedger; }
namespace gearledger::sync {
class SyncState;
class EventHub;
class ClientTracker;
class SyncObserver;
}

namespace gearledger::service {

/*
  Dependency container shared by the sync endpoints.
*/
struct ServiceContext {
  std::shared_ptr<gearledger::ledger::ResultLedger> ledger;
  std::shared_ptr<gearledger::sync::SyncState>      state;
  std::shared_ptr<gearledger::sync::EventHub>       events;
  std::shared_ptr<gearledger::sync::ClientTracker>  clients;
  std::shared_ptr<gearledger::sync::SyncObserver>   observer;

  std::string server_name;
  uint32_t    max_catalog_bytes = 64u * 1024u * 1024u;
};

}
