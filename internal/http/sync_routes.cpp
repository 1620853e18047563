#include "sync_routes.hpp"

#include <httplib.h>

#include <charconv>
#include <google/protobuf/struct.pb.h>
#include <mutex>
#include <optional>

#include "gearledger/sync/v1.hpp"
#include "http_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/sync_service.hpp"
#include "internal/sync/event_hub.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "sse.hpp"

namespace gearledger::http {

namespace {

using namespace gearledger::sync::v1;
using gearledger::service::SyncService;

constexpr const char* kResultPath = R"(/api/results/(\d+))";

// Handler failures become the JSON error body with the mapped status.
template <typename Fn>
httplib::Server::Handler Guarded(Fn fn) {
  return [fn = std::move(fn)](const httplib::Request& req, httplib::Response& res) {
    try {
      fn(req, res);
    } catch (const std::exception& e) {
      auto error = ToHttpError(e);
      if (error.status >= 500) {
        GEARLEDGER_LOG_ERROR("Request failed", {observability::StringField("path", req.path),
                                                observability::StringField("error", e.what())});
      }
      res.status = error.status;
      res.set_content(error.body, "application/json");
    }
  };
}

void Json(httplib::Response& res, const google::protobuf::Message& message) {
  res.status = 200;
  res.set_content(gearledger::util::ToJson(message), "application/json");
}

// The route regex admits digits only; an id past int64 is simply unknown.
int64_t ResultId(const httplib::Request& req) {
  const auto raw = req.matches[1].str();
  int64_t    id  = 0;
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), id);
  if (ec != std::errc{} || end != raw.data() + raw.size()) {
    throw gearledger::util::NotFound("Not found");
  }
  return id;
}

const std::string& RequireBody(const httplib::Request& req) {
  if (req.body.empty()) {
    throw gearledger::util::InvalidArgument("No data provided");
  }
  return req.body;
}

std::optional<std::string> ClientParam(const httplib::Request& req) {
  auto value = req.get_param_value("client");
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string AttachmentName(const std::string& filename) {
  std::string safe = filename;
  for (auto& c : safe) {
    if (c == '"' || c == '\\' || c == '\r' || c == '\n') {
      c = '_';
    }
  }
  return "attachment; filename=\"" + safe + "\"";
}

/*
  One /api/events subscriber. httplib calls Pump() on the connection's
  worker until it returns false or the sink is marked done; Close() runs
  from the resource releaser whichever way the stream ends.
*/
class EventSession {
 public:
  EventSession(std::shared_ptr<SyncService> service, std::chrono::milliseconds keepalive, std::string peer)
      : service_(std::move(service)), keepalive_(keepalive), peer_(std::move(peer)) {
    auto stream      = service_->OpenEventStream();
    subscription_    = std::move(stream.subscription);
    connected_event_ = std::move(stream.connected_event);
    GEARLEDGER_LOG_INFO("SSE subscriber connected", {observability::StringField("peer", peer_)});
  }

  bool Pump(httplib::DataSink& sink) {
    if (!greeted_) {
      greeted_ = true;
      return Send(sink, SseData(connected_event_));
    }

    std::string event;
    switch (subscription_->Pop(keepalive_, &event)) {
      case gearledger::sync::Subscription::PopStatus::kEvent:
        return Send(sink, SseData(event));
      case gearledger::sync::Subscription::PopStatus::kTimeout:
        return Send(sink, kSseKeepalive);
      case gearledger::sync::Subscription::PopStatus::kClosed:
        sink.done();
        return true;
    }
    return false;
  }

  void Close() {
    std::call_once(closed_, [this] {
      service_->CloseEventStream(subscription_);
      GEARLEDGER_LOG_INFO("SSE subscriber disconnected", {observability::StringField("peer", peer_)});
    });
  }

 private:
  static bool Send(httplib::DataSink& sink, std::string_view frame) {
    return sink.write(frame.data(), frame.size());
  }

  const std::shared_ptr<SyncService>              service_;
  const std::chrono::milliseconds                 keepalive_;
  const std::string                               peer_;
  std::shared_ptr<gearledger::sync::Subscription> subscription_;
  std::string                                     connected_event_;
  bool                                            greeted_ = false;
  std::once_flag                                  closed_;
};

} // namespace

RouteInstaller BuildSyncRoutes(std::shared_ptr<SyncService> service, std::chrono::milliseconds keepalive_interval) {
  return [svc = std::move(service), keepalive_interval](httplib::Server& server) {
    server.Get("/api/status", Guarded([svc](const httplib::Request&, httplib::Response& res) { Json(res, svc->Status()); }));

    server.Get("/api/sync/version", Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                 Json(res, svc->GetVersion(req.remote_addr));
               }));

    server.Get("/api/events", Guarded([svc, keepalive_interval](const httplib::Request& req, httplib::Response& res) {
                 auto session = std::make_shared<EventSession>(svc, keepalive_interval, req.remote_addr);
                 res.set_header("Cache-Control", "no-cache");
                 res.set_chunked_content_provider(
                     "text/event-stream", [session](size_t, httplib::DataSink& sink) { return session->Pump(sink); },
                     [session](bool) { session->Close(); });
               }));

    server.Get("/api/results", Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                 Json(res, svc->ListResults(req.remote_addr, ClientParam(req)));
               }));

    server.Post("/api/results", Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                  UpsertResultRequest body;
                  gearledger::util::FromJson(RequireBody(req), &body);
                  Json(res, svc->UpsertResult(req.remote_addr, body));
                }));

    server.Post("/api/results/clear", Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                  ClearResultsRequest body;
                  if (!req.body.empty()) {
                    gearledger::util::FromJson(req.body, &body);
                  }
                  if (body.client().empty()) {
                    if (auto client = ClientParam(req)) {
                      body.set_client(*client);
                    }
                  }
                  Json(res, svc->ClearResults(body));
                }));

    server.Get(kResultPath, Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                 Json(res, svc->GetResult(ResultId(req)));
               }));

    server.Put(kResultPath, Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                 const auto               id = ResultId(req);
                 google::protobuf::Struct fields;
                 gearledger::util::FromJson(RequireBody(req), &fields);
                 Json(res, svc->UpdateResult(id, fields));
               }));

    server.Delete(kResultPath, Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                    Json(res, svc->DeleteResult(ResultId(req)));
                  }));

    server.Get("/api/clients", Guarded([svc](const httplib::Request&, httplib::Response& res) { Json(res, svc->ListClients()); }));

    server.Get("/api/clients/count", Guarded([svc](const httplib::Request&, httplib::Response& res) {
                 Json(res, svc->ConnectedClientCount());
               }));

    server.Get("/api/catalog/info", Guarded([svc](const httplib::Request&, httplib::Response& res) { Json(res, svc->CatalogInfo()); }));

    server.Get("/api/catalog", Guarded([svc](const httplib::Request&, httplib::Response& res) {
                 const auto blob = svc->DownloadCatalog();
                 res.status      = 200;
                 res.set_content(blob->bytes, "application/octet-stream");
                 res.set_header("Content-Disposition", AttachmentName(blob->filename));
               }));

    server.Post("/api/catalog", Guarded([svc](const httplib::Request& req, httplib::Response& res) {
                  if (!req.is_multipart_form_data() || !req.has_file("file")) {
                    throw gearledger::util::InvalidArgument("No file provided");
                  }
                  auto file = req.get_file_value("file");
                  Json(res, svc->UploadCatalog(std::move(file.filename), std::move(file.content)));
                }));
  };
}

} // namespace gearledger::http
