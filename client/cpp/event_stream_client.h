#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "gearledger/sync/v1.hpp"

namespace httplib {
class Client;
}

namespace gearledger::sync::client {

// Every callback runs on the stream's worker thread.
struct EventStreamCallbacks {
  // Raw JSON of every event, before the typed callbacks.
  std::function<void(const std::string& type, const std::string& json)> on_event;
  std::function<void(const v1::ResultsChangedEvent&)>                   on_results_changed;
  // Also fired for a `connected` event that reports an existing catalog.
  std::function<void(const v1::CatalogUploadedEvent&)> on_catalog_uploaded;
  std::function<void()>                                on_connected;
  std::function<void()>                                on_disconnected;
  std::function<void(const std::string&)>              on_error;
};

struct EventStreamOptions {
  // Must exceed the server keepalive interval (30 s).
  std::chrono::milliseconds read_timeout{60000};
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds reconnect_delay{5000};
};

/*
  EventStreamClient

  Subscribes to /api/events on a worker thread and reconnects after any
  failure. Connection and timeout failures are retried quietly; HTTP errors
  and unexpected failures are reported through on_error first.
*/
class EventStreamClient {
 public:
  EventStreamClient(std::string server_url, EventStreamCallbacks callbacks, EventStreamOptions options = {});
  ~EventStreamClient();

  EventStreamClient(const EventStreamClient&)            = delete;
  EventStreamClient& operator=(const EventStreamClient&) = delete;

  void Start();

  // Shuts down an open stream's socket and returns once the worker has
  // exited; never waits out the read timeout.
  void Stop();

  bool IsConnected() const;

  // Dispatches one decoded event payload to the callbacks.
  void HandleEvent(const std::string& json);

 private:
  void Run();
  void StreamOnce();
  void SleepBeforeRetry();

  const std::string          server_url_;
  const EventStreamCallbacks callbacks_;
  const EventStreamOptions   options_;

  std::atomic<bool>       stopping_{false};
  std::atomic<bool>       connected_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
  // The stream currently being read; guarded by mutex_.
  httplib::Client*        active_ = nullptr;
  std::thread             thread_;
};

} // namespace gearledger::sync::client
