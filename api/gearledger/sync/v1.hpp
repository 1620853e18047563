#pragma once

#include "gearledger/discovery/v1/announcement.pb.h"
#include "gearledger/sync/v1/results.pb.h"
#include "gearledger/sync/v1/sync.pb.h"

namespace gearledger::sync::v1 {

inline constexpr const char* kServerIdentity = "Gear Ledger Server";
inline constexpr const char* kApiVersion     = "1.0.0";

inline constexpr const char* kEventConnected       = "connected";
inline constexpr const char* kEventResultsChanged  = "results_changed";
inline constexpr const char* kEventCatalogUploaded = "catalog_uploaded";

} // namespace gearledger::sync::v1

namespace gearledger::discovery::v1 {

inline constexpr const char* kAnnouncementType = "gearledger_server";

} // namespace gearledger::discovery::v1
