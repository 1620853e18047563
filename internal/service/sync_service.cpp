#include "sync_service.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/db/model/result_record.hpp"
#include "internal/ledger/result_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/client_tracker.hpp"
#include "internal/sync/event_hub.hpp"
#include "internal/sync/sync_observer.hpp"
#include "internal/sync/sync_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace gearledger::service {

using namespace gearledger::sync::v1;

namespace {

ResultRecord ToProto(const gearledger::db::model::ResultRecord& row) {
  ResultRecord out;
  out.set_id(static_cast<int32_t>(row.id));
  out.set_artikul(row.artikul);
  out.set_client(row.client);
  out.set_quantity(static_cast<int32_t>(row.quantity));
  out.set_weight(row.weight);
  out.set_brand(row.brand);
  out.set_description(row.description);
  out.set_sale_price(row.sale_price);
  out.set_total_price(row.total_price);
  out.set_last_updated(row.last_updated);
  out.set_created_at(row.created_at);
  return out;
}

const google::protobuf::Value* FieldOrNull(const google::protobuf::Struct& fields, const char* key) {
  const auto it = fields.fields().find(key);
  if (it == fields.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> StringValue(const google::protobuf::Struct& fields, const char* key) {
  const auto* value = FieldOrNull(fields, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->kind_case() != google::protobuf::Value::kStringValue) {
    throw gearledger::util::InvalidArgument(std::string(key) + " must be a string");
  }
  return value->string_value();
}

std::optional<double> NumberValue(const google::protobuf::Struct& fields, const char* key) {
  const auto* value = FieldOrNull(fields, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->kind_case() != google::protobuf::Value::kNumberValue) {
    throw gearledger::util::InvalidArgument(std::string(key) + " must be a number");
  }
  return value->number_value();
}

gearledger::db::model::ResultPatch ToPatch(const google::protobuf::Struct& fields) {
  gearledger::db::model::ResultPatch patch;
  patch.artikul     = StringValue(fields, "artikul");
  patch.client      = StringValue(fields, "client");
  patch.brand       = StringValue(fields, "brand");
  patch.description = StringValue(fields, "description");
  patch.weight      = NumberValue(fields, "weight");
  patch.sale_price  = NumberValue(fields, "sale_price");
  patch.total_price = NumberValue(fields, "total_price");

  if (const auto quantity = NumberValue(fields, "quantity")) {
    if (*quantity != std::floor(*quantity)) {
      throw gearledger::util::InvalidArgument("quantity must be an integer");
    }
    // Also rejects NaN and values no int64 can hold.
    if (!(*quantity >= 0 && *quantity <= static_cast<double>(gearledger::ledger::kMaxQuantity))) {
      throw gearledger::util::InvalidArgument("quantity out of range");
    }
    patch.quantity = static_cast<int64_t>(*quantity);
  }
  return patch;
}

template <typename Fn>
auto ObserveRequest(std::string_view route, Fn&& fn) {
  try {
    return fn();
  } catch (const gearledger::util::NotFound& ex) {
    GEARLEDGER_LOG_DEBUG("Request rejected", {gearledger::observability::StringField("route", route),
                                              gearledger::observability::StringField("error", ex.what())});
    throw;
  } catch (const gearledger::util::InvalidArgument& ex) {
    GEARLEDGER_LOG_WARN("Request rejected", {gearledger::observability::StringField("route", route),
                                             gearledger::observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    GEARLEDGER_LOG_ERROR("Request failed", {gearledger::observability::StringField("route", route),
                                            gearledger::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

SyncService::SyncService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.ledger || !ctx_.state || !ctx_.events || !ctx_.clients) {
    throw std::invalid_argument("SyncService requires ledger, state, events and clients");
  }
  if (ctx_.server_name.empty()) {
    ctx_.server_name = kServerIdentity;
  }
}

StatusResponse SyncService::Status() const {
  StatusResponse resp;
  resp.set_status("ok");
  resp.set_server(kServerIdentity);
  resp.set_version(kApiVersion);
  resp.set_name(ctx_.server_name);
  return resp;
}

SyncVersionResponse SyncService::GetVersion(const std::string& peer) {
  Touch(peer);
  SyncVersionResponse resp;
  resp.set_ok(true);
  resp.set_version(ctx_.state->Version());
  return resp;
}

ListResultsResponse SyncService::ListResults(const std::string& peer, const std::optional<std::string>& client) {
  return ObserveRequest("results.list", [&] {
    Touch(peer);
    ListResultsResponse resp;
    resp.set_ok(true);
    for (const auto& row : ctx_.ledger->ListResults(client)) {
      *resp.add_results() = ToProto(row);
    }
    return resp;
  });
}

UpsertResultResponse SyncService::UpsertResult(const std::string& peer, const UpsertResultRequest& req) {
  return ObserveRequest("results.upsert", [&] {
    Touch(peer);
    if (req.artikul().empty() || req.client().empty()) {
      throw gearledger::util::InvalidArgument("artikul and client required");
    }

    gearledger::ledger::ResultWrite write;
    write.artikul     = req.artikul();
    write.client      = req.client();
    write.quantity    = req.has_quantity() ? req.quantity() : 1;
    write.weight      = req.weight();
    write.brand       = req.brand();
    write.description = req.description();
    write.sale_price  = req.sale_price();

    const auto outcome = ctx_.ledger->UpsertResult(write);
    const auto version = ctx_.state->BumpVersion();

    ResultsChangedEvent event;
    event.set_type(kEventResultsChanged);
    event.set_version(version);
    ctx_.events->Publish(gearledger::util::ToJson(event));
    NotifyDataChanged();

    UpsertResultResponse resp;
    resp.set_ok(true);
    resp.set_action(outcome.inserted ? "inserted" : "updated");
    resp.set_id(static_cast<int32_t>(outcome.id));
    resp.set_version(version);
    return resp;
  });
}

GetResultResponse SyncService::GetResult(int64_t id) {
  return ObserveRequest("results.get", [&] {
    const auto row = ctx_.ledger->GetResult(id);
    if (!row) {
      throw gearledger::util::NotFound("Not found");
    }
    GetResultResponse resp;
    resp.set_ok(true);
    *resp.mutable_result() = ToProto(*row);
    return resp;
  });
}

AckResponse SyncService::UpdateResult(int64_t id, const google::protobuf::Struct& fields) {
  return ObserveRequest("results.update", [&] {
    AckResponse resp;
    resp.set_ok(ctx_.ledger->UpdateResult(id, ToPatch(fields)));
    if (resp.ok()) {
      NotifyDataChanged();
    }
    return resp;
  });
}

AckResponse SyncService::DeleteResult(int64_t id) {
  return ObserveRequest("results.delete", [&] {
    ctx_.ledger->DeleteResult(id);
    NotifyDataChanged();
    AckResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

ClearResultsResponse SyncService::ClearResults(const ClearResultsRequest& req) {
  return ObserveRequest("results.clear", [&] {
    std::optional<std::string> client;
    if (!req.client().empty()) {
      client = req.client();
    }
    const auto deleted = ctx_.ledger->ClearResults(client);
    const auto version = ctx_.state->BumpVersion();

    ResultsChangedEvent event;
    event.set_type(kEventResultsChanged);
    event.set_version(version);
    ctx_.events->Publish(gearledger::util::ToJson(event));
    NotifyDataChanged();

    ClearResultsResponse resp;
    resp.set_ok(true);
    resp.set_deleted(static_cast<int32_t>(deleted));
    resp.set_version(version);
    return resp;
  });
}

ListClientsResponse SyncService::ListClients() {
  return ObserveRequest("clients.list", [&] {
    ListClientsResponse resp;
    resp.set_ok(true);
    for (const auto& client : ctx_.ledger->ListClients()) {
      resp.add_clients(client);
    }
    return resp;
  });
}

ClientCountResponse SyncService::ConnectedClientCount() const {
  ClientCountResponse resp;
  resp.set_ok(true);
  resp.set_count(static_cast<int32_t>(ctx_.clients->Count()));
  return resp;
}

CatalogInfoResponse SyncService::CatalogInfo() const {
  const auto [version, catalog] = ctx_.state->Snapshot();

  CatalogInfoResponse resp;
  resp.set_ok(true);
  resp.set_version(version);
  resp.set_exists(catalog.has_value());
  if (catalog) {
    resp.set_filename(catalog->filename);
    resp.set_size(catalog->size);
    resp.set_uploaded_at(catalog->uploaded_at);
  }
  return resp;
}

std::shared_ptr<const gearledger::sync::CatalogBlob> SyncService::DownloadCatalog() const {
  auto blob = ctx_.state->CatalogBlobSnapshot();
  if (!blob) {
    throw gearledger::util::NotFound("No catalog uploaded");
  }
  return blob;
}

CatalogUploadResponse SyncService::UploadCatalog(std::string filename, std::string bytes) {
  return ObserveRequest("catalog.upload", [&] {
    if (filename.empty()) {
      throw gearledger::util::InvalidArgument("No file selected");
    }
    if (bytes.size() > ctx_.max_catalog_bytes) {
      throw gearledger::util::PayloadTooLarge("Catalog exceeds " + std::to_string(ctx_.max_catalog_bytes) + " bytes");
    }

    const auto size    = static_cast<uint32_t>(bytes.size());
    const auto version = ctx_.state->ReplaceCatalog(filename, std::move(bytes), gearledger::util::NowIso8601());

    CatalogUploadedEvent event;
    event.set_type(kEventCatalogUploaded);
    event.set_filename(filename);
    event.set_size(size);
    event.set_version(version);
    const auto delivered = ctx_.events->Publish(gearledger::util::ToJson(event));
    NotifyDataChanged();

    GEARLEDGER_LOG_INFO("Catalog uploaded", {gearledger::observability::StringField("filename", filename),
                                             gearledger::observability::IntField("size", size),
                                             gearledger::observability::IntField("version", version),
                                             gearledger::observability::IntField("subscribers", static_cast<int64_t>(delivered))});

    CatalogUploadResponse resp;
    resp.set_ok(true);
    resp.set_filename(filename);
    resp.set_size(size);
    resp.set_version(version);
    return resp;
  });
}

EventStream SyncService::OpenEventStream() {
  EventStream stream;
  // Subscribe before reading the snapshot so no mutation falls between them.
  stream.subscription = ctx_.events->Subscribe();

  const auto [version, catalog] = ctx_.state->Snapshot();

  ConnectedEvent event;
  event.set_type(kEventConnected);
  event.set_version(version);
  if (catalog) {
    event.mutable_catalog()->set_filename(catalog->filename);
    event.mutable_catalog()->set_size(catalog->size);
    event.mutable_catalog()->set_version(version);
  }
  stream.connected_event = gearledger::util::ToJson(event);
  return stream;
}

void SyncService::CloseEventStream(const std::shared_ptr<gearledger::sync::Subscription>& subscription) {
  ctx_.events->Unsubscribe(subscription);
}

void SyncService::NotifyDataChanged() {
  if (ctx_.observer) {
    ctx_.observer->OnDataChanged();
  }
}

void SyncService::Touch(const std::string& peer) {
  if (!peer.empty()) {
    ctx_.clients->Touch(peer);
  }
}

}
