#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"

namespace gearledger::discovery {

struct DiscoveredServer {
  std::string                        ip;
  uint32_t                           port = 0;
  std::string                        name;
  util::SteadyClock::time_point      last_seen;

  std::string Key() const;
  std::string Url() const;
};

struct ListenerOptions {
  std::string               bind_address = "0.0.0.0";
  uint16_t                  port         = 8888;
  std::chrono::milliseconds stale_after{5000};
  // Receive wait per iteration; bounds how long Stop() takes.
  std::chrono::milliseconds receive_timeout{1000};
};

/*
  ServerDiscovery

  Client-side listener for server announcements. Keeps one entry per
  advertised ip:port; an entry is stale once it has not been refreshed
  within `stale_after`.

  The callback runs on the listener thread, outside the internal lock, when
  an entry is new or its previous sighting had gone stale.
*/
class ServerDiscovery {
 public:
  using Callback = std::function<void(const DiscoveredServer&)>;

  explicit ServerDiscovery(ListenerOptions options, Callback on_found = nullptr);
  ~ServerDiscovery();

  ServerDiscovery(const ServerDiscovery&)            = delete;
  ServerDiscovery& operator=(const ServerDiscovery&) = delete;

  // Binds the discovery port before returning; throws std::runtime_error
  // when the port cannot be bound.
  void Start();
  void Stop();

  // Prunes stale entries and returns the live ones.
  std::vector<DiscoveredServer> Servers();

  // Processes one datagram as if received from `sender`. Malformed or
  // foreign datagrams are ignored.
  void HandleDatagram(std::string_view datagram, const std::string& sender);

 private:
  struct Socket;

  void Run();

  const ListenerOptions options_;
  Callback              on_found_;

  std::mutex                              mutex_;
  std::map<std::string, DiscoveredServer> servers_;

  std::atomic<bool>       running_{false};
  std::unique_ptr<Socket> socket_;
  std::thread             thread_;
};

} // namespace gearledger::discovery
