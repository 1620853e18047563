#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace gearledger::http {

// Registers handlers on a server that is not listening yet.
using RouteInstaller = std::function<void(httplib::Server&)>;

struct HttpServerOptions {
  std::string bind_address = "0.0.0.0";
  // 0 picks an ephemeral port; see HttpServer::Port().
  uint16_t    port = 8080;
  std::size_t max_body_bytes = 64u * 1024u * 1024u + 64u * 1024u;
  // Every open SSE subscriber holds one worker.
  std::size_t worker_threads = 32;
};

/*
  HttpServer

  Owns one httplib::Server listening on a background thread. Requests that
  reach no route, exceed the body limit or fail to parse get the same JSON
  error body as handler failures.

  Stop() closes the listener and joins the worker pool. Handlers blocked
  outside socket I/O (SSE queues) must be released by the owner first.
*/
class HttpServer {
 public:
  HttpServer(HttpServerOptions options, RouteInstaller routes);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts listening; throws std::runtime_error when the address
  // cannot be bound.
  void Start();
  void Stop();

  uint16_t Port() const;

 private:
  const HttpServerOptions options_;
  RouteInstaller          routes_;

  std::unique_ptr<httplib::Server> server_;
  std::thread                      listen_thread_;
  std::atomic<bool>                running_{false};
  uint16_t                         port_ = 0;
};

} // namespace gearledger::http
