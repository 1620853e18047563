#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace gearledger::http { class HttpServer; }
namespace gearledger::discovery { class ServerBroadcaster; }

namespace gearledger::runtime {

/*
  Server

  Runs one sync server: the HTTP/SSE listener, the connected-client sweeper
  and (when enabled) the discovery broadcaster.
*/
class Server {
public:
  Server(gearledger::runtime::config::RuntimeConfig config, gearledger::factory::Application app);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const;

  // Bound HTTP port; differs from the configured one when that was 0.
  uint16_t Port() const;

  // http://<primary LAN address>:<port>
  std::string Url() const;

  const gearledger::factory::Application& App() const {
    return app_;
  }

private:
  gearledger::runtime::config::RuntimeConfig           config_;
  gearledger::factory::Application                     app_;
  std::unique_ptr<gearledger::http::HttpServer>        http_;
  std::unique_ptr<gearledger::discovery::ServerBroadcaster> broadcaster_;
  bool                                                 running_ = false;
};

} // namespace gearledger::runtime
