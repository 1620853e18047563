#include "client/cpp/event_stream_client.h"
#include "client/cpp/sync_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/sync/event_hub.hpp"
#include "internal/util/json.hpp"

#include <httplib.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace gearledger::sync;
using namespace std::chrono_literals;
using gearledger::sync::client::EventStreamCallbacks;
using gearledger::sync::client::EventStreamClient;
using gearledger::sync::client::EventStreamOptions;
using gearledger::sync::client::SyncClient;

gearledger::runtime::config::RuntimeConfig TestConfig() {
  const auto dir = std::filesystem::temp_directory_path() / ("gearledger_sync_server_test_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);

  auto config = gearledger::config::ConfigLoader::Defaults();
  config.mutable_server()->set_bind_address("127.0.0.1");
  config.mutable_server()->set_port(0);
  config.mutable_server()->set_name("Integration");
  config.mutable_database()->mutable_sqlite()->set_path((dir / "results.db").string());
  config.mutable_discovery()->set_enabled(false);
  config.mutable_sync()->set_keepalive_interval_ms(200);
  config.mutable_sync()->set_max_catalog_bytes(64 * 1024);
  return config;
}

// Collects catalog notifications delivered on the stream worker.
class CatalogWatcher {
 public:
  void Record(const v1::CatalogUploadedEvent& event) {
    {
      std::lock_guard lock(mutex_);
      events_.push_back(event);
    }
    cv_.notify_all();
  }

  void Connected() {
    {
      std::lock_guard lock(mutex_);
      ++connects_;
    }
    cv_.notify_all();
  }

  bool WaitConnected(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return connects_ > 0; });
  }

  int Connects() {
    std::lock_guard lock(mutex_);
    return connects_;
  }

  bool WaitForCatalog(const std::string& filename, std::chrono::milliseconds timeout, v1::CatalogUploadedEvent* out) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
      for (const auto& event : events_) {
        if (event.filename() == filename) {
          *out = event;
          return true;
        }
      }
      return false;
    });
  }

 private:
  std::mutex                            mutex_;
  std::condition_variable               cv_;
  std::vector<v1::CatalogUploadedEvent> events_;
  int                                   connects_ = 0;
};

int StatusOf(const httplib::Result& result, std::string* reply_body = nullptr) {
  assert(result);
  if (reply_body) {
    *reply_body = result->body;
  }
  return result->status;
}

bool WaitForSubscribers(const gearledger::sync::EventHub& events, std::size_t expected, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (events.SubscriberCount() != expected) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(20ms);
  }
  return true;
}

void TestStatusAndVersion(const SyncClient& client) {
  const auto status = client.CheckConnection();
  assert(status.ok);
  assert(status.value.status() == "ok");
  assert(status.value.server() == "Gear Ledger Server");
  assert(status.value.name() == "Integration");

  assert(client.GetSyncVersion() == 0);

  const auto count = client.GetConnectedClientCount();
  assert(count.ok && count.value.count() == 1);
}

void TestResultsRoundTrip(const SyncClient& client) {
  v1::UpsertResultRequest req;
  req.set_artikul("PK-5396");
  req.set_client("Acme");
  req.set_sale_price(2.5);

  const auto first = client.AddResult(req);
  assert(first.ok);
  assert(first.value.action() == "inserted");
  const auto version_after_first = first.value.version();
  assert(version_after_first > 0);

  req.set_artikul("pk 5396");
  req.set_client("ACME");
  req.clear_sale_price();
  const auto second = client.AddResult(req);
  assert(second.ok);
  assert(second.value.action() == "updated");
  assert(second.value.id() == first.value.id());
  assert(second.value.version() > version_after_first);

  const auto listed = client.GetResults(std::string("acme"));
  assert(listed.ok);
  assert(listed.value.results_size() == 1);
  const auto& row = listed.value.results(0);
  assert(row.quantity() == 2);
  assert(row.total_price() == 5.0);
  assert(row.artikul() == "PK-5396");

  google::protobuf::Struct patch;
  gearledger::util::FromJson(R"({"description":"Oil filter"})", &patch);
  assert(client.UpdateResult(row.id(), patch).ok);
  assert(client.GetResult(row.id()).value.result().description() == "Oil filter");

  const auto clients = client.GetClients();
  assert(clients.ok && clients.value.clients_size() == 1 && clients.value.clients(0) == "Acme");

  assert(client.DeleteResult(row.id()).ok);
  const auto gone = client.GetResult(row.id());
  assert(!gone.ok);
  assert(gone.error == "Not found");

  v1::UpsertResultRequest other;
  other.set_artikul("X-1");
  other.set_client("Beta");
  assert(client.AddResult(other).ok);
  const auto cleared = client.ClearResults();
  assert(cleared.ok && cleared.value.deleted() == 1);
  assert(cleared.value.version() == client.GetSyncVersion());
}

void TestErrorStatuses(httplib::Client& http) {
  std::string body;
  assert(StatusOf(http.Post("/api/results", "", "application/json"), &body) == 400);
  assert(body.find("No data provided") != std::string::npos);

  assert(StatusOf(http.Post("/api/results", "{not json", "application/json")) == 400);
  assert(StatusOf(http.Post("/api/results", R"({"artikul":"A-1"})", "application/json"), &body) == 400);
  assert(body.find("artikul and client required") != std::string::npos);

  assert(StatusOf(http.Get("/api/results/999999")) == 404);
  assert(StatusOf(http.Get("/api/results/abc"), &body) == 404);
  assert(body.find("Not found") != std::string::npos);
  assert(StatusOf(http.Put("/api/results/999999", R"({"brand":"X"})", "application/json")) == 404);
  assert(StatusOf(http.Delete("/api/results/999999")) == 404);
  assert(StatusOf(http.Get("/api/does-not-exist"), &body) == 404);
  assert(body.find("\"ok\":false") != std::string::npos);
  // No DELETE route is registered for the status path.
  assert(StatusOf(http.Delete("/api/status")) == 404);

  assert(StatusOf(http.Post("/api/catalog", "x", "text/plain"), &body) == 400);
  assert(body.find("No file provided") != std::string::npos);
}

void TestCatalogFlowReachesSubscribers(const SyncClient& client, const std::string& url,
                                       const gearledger::sync::EventHub& events) {
  const auto empty = client.GetCatalogInfo();
  assert(empty.ok && !empty.value.exists());
  const auto missing = client.DownloadCatalog();
  assert(!missing.ok && missing.error == "No catalog uploaded");

  CatalogWatcher       watcher;
  EventStreamCallbacks callbacks;
  // The `connected` event is written only after the server-side subscription exists.
  callbacks.on_event = [&watcher](const std::string& type, const std::string&) {
    if (type == v1::kEventConnected) {
      watcher.Connected();
    }
  };
  callbacks.on_catalog_uploaded = [&watcher](const v1::CatalogUploadedEvent& event) { watcher.Record(event); };

  // Shorter than the idle window below, longer than the 200ms keepalive:
  // only keepalive frames keep this stream open.
  EventStreamOptions options;
  options.read_timeout    = 600ms;
  options.reconnect_delay = 200ms;
  EventStreamClient stream(url, callbacks, options);
  stream.Start();
  assert(watcher.WaitConnected(5s));

  std::string bytes(500, '\0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<char>(i % 251);
  }
  const auto uploaded = client.UploadCatalog("parts.xlsx", bytes);
  assert(uploaded.ok);
  assert(uploaded.value.size() == 500);
  assert(uploaded.value.filename() == "parts.xlsx");

  v1::CatalogUploadedEvent event;
  assert(watcher.WaitForCatalog("parts.xlsx", 5s, &event));
  assert(event.size() == 500);
  assert(event.version() == uploaded.value.version());

  const auto info = client.GetCatalogInfo();
  assert(info.ok && info.value.exists());
  assert(info.value.filename() == "parts.xlsx");
  assert(info.value.size() == 500);
  assert(info.value.version() == uploaded.value.version());

  const auto downloaded = client.DownloadCatalog();
  assert(downloaded.ok);
  assert(downloaded.value.filename == "parts.xlsx");
  assert(downloaded.value.bytes == bytes);

  // Idle for well past the read timeout; the stream must neither drop nor
  // reconnect.
  std::this_thread::sleep_for(1500ms);
  assert(stream.IsConnected());
  assert(watcher.Connects() == 1);
  assert(events.SubscriberCount() == 1);

  stream.Stop();
  assert(!stream.IsConnected());
  // The server notices the closed socket on its next keepalive write.
  assert(WaitForSubscribers(events, 0, 2s));

  // A late subscriber learns about the catalog from its connected event.
  CatalogWatcher       late_watcher;
  EventStreamCallbacks late_callbacks;
  late_callbacks.on_catalog_uploaded = [&late_watcher](const v1::CatalogUploadedEvent& e) { late_watcher.Record(e); };
  EventStreamClient late(url, late_callbacks, options);
  late.Start();
  assert(late_watcher.WaitForCatalog("parts.xlsx", 5s, &event));
  late.Stop();
}

void TestOversizedCatalogIsRejected(const SyncClient& client) {
  const auto before = client.GetCatalogInfo().value.version();
  const auto result = client.UploadCatalog("huge.xlsx", std::string(70 * 1024, 'h'));
  assert(!result.ok);
  assert(client.GetCatalogInfo().value.filename() == "parts.xlsx");
  assert(client.GetCatalogInfo().value.version() == before);
}

void TestUploadFilenameIsSanitized(const SyncClient& client) {
  const auto uploaded = client.UploadCatalog("odd\"name\\\r\n.xlsx", "abc");
  assert(uploaded.ok);
  assert(uploaded.value.filename() == "odd_name___.xlsx");

  const auto downloaded = client.DownloadCatalog();
  assert(downloaded.ok);
  assert(downloaded.value.filename == "odd_name___.xlsx");
  assert(downloaded.value.bytes == "abc");
}

} // namespace

int main() {
  const auto config = TestConfig();

  gearledger::runtime::Server server(config, gearledger::factory::Build(config));
  server.Start();
  assert(server.IsRunning());
  assert(server.Port() != 0);

  const std::string url = "http://127.0.0.1:" + std::to_string(server.Port());
  SyncClient      client(url);
  httplib::Client http("127.0.0.1", server.Port());
  http.set_read_timeout(5s);

  TestStatusAndVersion(client);
  TestResultsRoundTrip(client);
  TestErrorStatuses(http);
  TestCatalogFlowReachesSubscribers(client, url, *server.App().events);
  TestOversizedCatalogIsRejected(client);
  TestUploadFilenameIsSanitized(client);

  server.Stop();
  assert(!server.IsRunning());
  assert(!client.GetStatus().ok);

  std::cout << "gearledger_integration_sync_server: pass\n";
  return 0;
}
