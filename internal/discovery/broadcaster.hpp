#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gearledger/sync/v1.hpp"

namespace gearledger::discovery {

struct BroadcasterOptions {
  std::string               name;
  uint32_t                  server_port    = 8080;
  uint16_t                  discovery_port = 8888;
  std::chrono::milliseconds interval{3000};
  // Explicit destinations; when empty every usable interface's broadcast
  // address is used.
  std::vector<std::string> broadcast_addresses;
};

/*
  ServerBroadcaster

  Periodically announces this server on the discovery port. Runs on its own
  thread until Stop(). A send failure ends the loop; the HTTP server keeps
  running without discovery.
*/
class ServerBroadcaster {
 public:
  explicit ServerBroadcaster(BroadcasterOptions options);
  ~ServerBroadcaster();

  ServerBroadcaster(const ServerBroadcaster&)            = delete;
  ServerBroadcaster& operator=(const ServerBroadcaster&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const;

  // The datagram content for the current interface set.
  v1::Announcement BuildAnnouncement() const;

 private:
  void                     Run();
  std::vector<std::string> Destinations() const;

  const BroadcasterOptions options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_     = false;
  bool                    loop_active_ = false;
  std::thread             thread_;
};

} // namespace gearledger::discovery
