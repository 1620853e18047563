#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "gearledger/sync/v1.hpp"
#include "service_context.hpp"

namespace gearledger::sync {
struct CatalogBlob;
class Subscription;
}

namespace gearledger::service {

// A freshly registered SSE subscriber and the `connected` event it must
// receive before anything from its queue.
struct EventStream {
  std::shared_ptr<gearledger::sync::Subscription> subscription;
  std::string                                     connected_event;
};

/*
  SyncService

  Transport-independent behaviour of every sync endpoint. `peer` is the
  caller's address, used for connected-client bookkeeping.

  Accepted result upserts, clears and catalog uploads bump the sync version
  and fan out an event; point updates/deletes only notify the observer.

  Errors are thrown as util:: exception types.
*/
class SyncService {
public:
  explicit SyncService(ServiceContext ctx);

  gearledger::sync::v1::StatusResponse Status() const;

  gearledger::sync::v1::SyncVersionResponse GetVersion(const std::string& peer);

  gearledger::sync::v1::ListResultsResponse
  ListResults(const std::string& peer, const std::optional<std::string>& client);

  gearledger::sync::v1::UpsertResultResponse
  UpsertResult(const std::string& peer, const gearledger::sync::v1::UpsertResultRequest& req);

  gearledger::sync::v1::GetResultResponse GetResult(int64_t id);

  gearledger::sync::v1::AckResponse UpdateResult(int64_t id, const google::protobuf::Struct& fields);

  gearledger::sync::v1::AckResponse DeleteResult(int64_t id);

  gearledger::sync::v1::ClearResultsResponse ClearResults(const gearledger::sync::v1::ClearResultsRequest& req);

  gearledger::sync::v1::ListClientsResponse ListClients();

  gearledger::sync::v1::ClientCountResponse ConnectedClientCount() const;

  gearledger::sync::v1::CatalogInfoResponse CatalogInfo() const;

  // Throws util::NotFound when no catalog has been uploaded.
  std::shared_ptr<const gearledger::sync::CatalogBlob> DownloadCatalog() const;

  gearledger::sync::v1::CatalogUploadResponse UploadCatalog(std::string filename, std::string bytes);

  EventStream OpenEventStream();
  void        CloseEventStream(const std::shared_ptr<gearledger::sync::Subscription>& subscription);

private:
  void NotifyDataChanged();
  void Touch(const std::string& peer);

  ServiceContext ctx_;
};

}
