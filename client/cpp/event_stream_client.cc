#include "client/cpp/event_stream_client.h"

#include <httplib.h>

#include "client/cpp/http_client.h"
#include "client/cpp/sse_parser.h"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace gearledger::sync::client {

EventStreamClient::EventStreamClient(std::string server_url, EventStreamCallbacks callbacks, EventStreamOptions options)
    : server_url_(std::move(server_url)), callbacks_(std::move(callbacks)), options_(options) {
}

EventStreamClient::~EventStreamClient() {
  Stop();
}

void EventStreamClient::Start() {
  if (thread_.joinable()) {
    return;
  }
  stopping_.store(false);
  thread_ = std::thread([this] { Run(); });
}

void EventStreamClient::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_.store(true);
    if (active_) {
      active_->stop();
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool EventStreamClient::IsConnected() const {
  return connected_.load();
}

void EventStreamClient::Run() {
  while (!stopping_.load()) {
    try {
      StreamOnce();
    } catch (const std::exception& e) {
      if (!stopping_.load()) {
        GEARLEDGER_LOG_WARN("Event stream failed",
                            {observability::StringField("server", server_url_), observability::StringField("error", e.what())});
        if (callbacks_.on_error) {
          callbacks_.on_error(std::string("Unexpected error: ") + e.what());
        }
      }
    }

    if (connected_.exchange(false) && callbacks_.on_disconnected) {
      callbacks_.on_disconnected();
    }
    SleepBeforeRetry();
  }
}

void EventStreamClient::StreamOnce() {
  const auto address = ParseServerUrl(server_url_);
  if (!address) {
    if (callbacks_.on_error) {
      callbacks_.on_error("invalid server URL: " + server_url_);
    }
    return;
  }

  auto http = MakeHttpClient(*address, options_.connect_timeout, options_.read_timeout);
  {
    std::lock_guard lock(mutex_);
    if (stopping_.load()) {
      return;
    }
    active_ = http.get();
  }

  SseParser parser;
  int       status = 0;
  auto      result = http->Get(
      "/api/events", httplib::Headers{{"Accept", "text/event-stream"}, {"Cache-Control", "no-cache"}},
      [&](const httplib::Response& response) {
        status = response.status;
        if (status != 200) {
          return false;
        }
        connected_.store(true);
        GEARLEDGER_LOG_INFO("Event stream connected", {observability::StringField("server", server_url_)});
        if (callbacks_.on_connected) {
          callbacks_.on_connected();
        }
        return true;
      },
      [&](const char* data, size_t length) {
        for (const auto& event : parser.Feed(std::string_view(data, length))) {
          HandleEvent(event);
        }
        return !stopping_.load();
      });

  {
    std::lock_guard lock(mutex_);
    active_ = nullptr;
  }
  if (stopping_.load()) {
    return;
  }

  if (status != 0 && status != 200) {
    if (callbacks_.on_error) {
      callbacks_.on_error("Connection failed: " + std::to_string(status));
    }
  } else if (!result) {
    GEARLEDGER_LOG_DEBUG("Event stream interrupted", {observability::StringField("server", server_url_),
                                                      observability::StringField("error", httplib::to_string(result.error()))});
  } else {
    GEARLEDGER_LOG_INFO("Event stream closed by server", {observability::StringField("server", server_url_)});
  }
}

void EventStreamClient::HandleEvent(const std::string& json) {
  v1::EventEnvelope envelope;
  if (!gearledger::util::TryFromJson(json, &envelope)) {
    GEARLEDGER_LOG_WARN("Dropping malformed event", {observability::StringField("data", json)});
    return;
  }

  const auto& type = envelope.type();
  if (callbacks_.on_event) {
    callbacks_.on_event(type, json);
  }

  if (type == v1::kEventResultsChanged) {
    v1::ResultsChangedEvent event;
    if (gearledger::util::TryFromJson(json, &event) && callbacks_.on_results_changed) {
      callbacks_.on_results_changed(event);
    }
  } else if (type == v1::kEventCatalogUploaded) {
    v1::CatalogUploadedEvent event;
    if (gearledger::util::TryFromJson(json, &event) && callbacks_.on_catalog_uploaded) {
      callbacks_.on_catalog_uploaded(event);
    }
  } else if (type == v1::kEventConnected) {
    v1::ConnectedEvent event;
    if (gearledger::util::TryFromJson(json, &event) && event.has_catalog() && callbacks_.on_catalog_uploaded) {
      v1::CatalogUploadedEvent catalog;
      catalog.set_type(v1::kEventCatalogUploaded);
      catalog.set_filename(event.catalog().filename().empty() ? "catalog" : event.catalog().filename());
      catalog.set_size(event.catalog().size());
      catalog.set_version(event.catalog().version() != 0 ? event.catalog().version() : event.version());
      callbacks_.on_catalog_uploaded(catalog);
    }
  } else {
    GEARLEDGER_LOG_DEBUG("Unknown event type", {observability::StringField("type", type)});
  }
}

void EventStreamClient::SleepBeforeRetry() {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, options_.reconnect_delay, [this] { return stopping_.load(); });
}

} // namespace gearledger::sync::client
