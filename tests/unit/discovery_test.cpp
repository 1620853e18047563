#include "internal/discovery/announcement.hpp"
#include "internal/discovery/broadcaster.hpp"
#include "internal/discovery/listener.hpp"
#include "internal/discovery/network_interfaces.hpp"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using gearledger::discovery::DecodeAnnouncement;
using gearledger::discovery::DiscoveredServer;
using gearledger::discovery::EncodeAnnouncement;
using gearledger::discovery::ListenerOptions;
using gearledger::discovery::ServerDiscovery;

uint16_t TestPort() {
  return static_cast<uint16_t>(39000 + (::getpid() % 2000));
}

void TestEncodeStampsAnnouncementType() {
  gearledger::discovery::v1::Announcement announcement;
  announcement.set_ip("192.168.1.20");
  announcement.add_ips("192.168.1.20");
  announcement.set_port(8080);
  announcement.set_name("Warehouse");

  const auto wire = EncodeAnnouncement(announcement);
  assert(wire.find("\"type\":\"gearledger_server\"") != std::string::npos);

  const auto decoded = DecodeAnnouncement(wire);
  assert(decoded.has_value());
  assert(decoded->ip() == "192.168.1.20");
  assert(decoded->port() == 8080);
  assert(decoded->name() == "Warehouse");
}

void TestDecodeRejectsForeignAndMalformedDatagrams() {
  assert(!DecodeAnnouncement("not json").has_value());
  assert(!DecodeAnnouncement("").has_value());
  assert(!DecodeAnnouncement(R"({"type":"other_server","ip":"10.0.0.1","port":8080})").has_value());
  assert(!DecodeAnnouncement(R"({"ip":"10.0.0.1","port":8080})").has_value());
}

void TestDecodeFillsMissingPortAndName() {
  const auto decoded = DecodeAnnouncement(R"({"type":"gearledger_server","ip":"10.0.0.7","extra":1})");
  assert(decoded.has_value());
  assert(decoded->port() == gearledger::discovery::kDefaultServerPort);
  assert(decoded->name() == "Gear Ledger Server");
}

void TestHandleDatagramRecordsEveryAdvertisedAddress() {
  std::vector<DiscoveredServer> found;
  ServerDiscovery discovery(ListenerOptions{}, [&](const DiscoveredServer& server) { found.push_back(server); });

  discovery.HandleDatagram(R"({"type":"gearledger_server","ip":"10.0.0.1","ips":["10.0.0.1","192.168.5.1"],"port":9000,"name":"A"})",
                           "10.0.0.1");
  assert(found.size() == 2);

  const auto servers = discovery.Servers();
  assert(servers.size() == 2);
  for (const auto& server : servers) {
    assert(server.port == 9000);
    assert(server.name == "A");
    assert(server.Key() == server.ip + ":9000");
  }
}

void TestHandleDatagramFallsBackToIpThenSender() {
  ServerDiscovery discovery(ListenerOptions{});

  discovery.HandleDatagram(R"({"type":"gearledger_server","ip":"10.1.1.1","port":8080})", "10.9.9.9");
  discovery.HandleDatagram(R"({"type":"gearledger_server","port":8081})", "10.2.2.2");

  const auto servers = discovery.Servers();
  assert(servers.size() == 2);

  bool saw_ip     = false;
  bool saw_sender = false;
  for (const auto& server : servers) {
    saw_ip     = saw_ip || server.Key() == "10.1.1.1:8080";
    saw_sender = saw_sender || server.Key() == "10.2.2.2:8081";
  }
  assert(saw_ip && saw_sender);
  assert(servers.front().Url().rfind("http://", 0) == 0);
}

void TestCallbackOnlyForNewOrStaleEntries() {
  ListenerOptions options;
  options.stale_after = std::chrono::milliseconds(100);

  int             calls = 0;
  ServerDiscovery discovery(options, [&](const DiscoveredServer&) { ++calls; });

  const std::string datagram = R"({"type":"gearledger_server","ip":"10.0.0.2","port":8080})";
  discovery.HandleDatagram(datagram, "10.0.0.2");
  discovery.HandleDatagram(datagram, "10.0.0.2");
  assert(calls == 1);

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  assert(discovery.Servers().empty());

  discovery.HandleDatagram(datagram, "10.0.0.2");
  assert(calls == 2);

  discovery.HandleDatagram("garbage", "10.0.0.3");
  assert(calls == 2);
  assert(discovery.Servers().size() == 1);
}

void TestBroadcasterAnnouncementCarriesPortAndAddresses() {
  gearledger::discovery::BroadcasterOptions options;
  options.name        = "Bench";
  options.server_port = 9123;

  gearledger::discovery::ServerBroadcaster broadcaster(options);
  const auto announcement = broadcaster.BuildAnnouncement();
  assert(announcement.type() == "gearledger_server");
  assert(announcement.port() == 9123);
  assert(announcement.name() == "Bench");
  assert(announcement.ips_size() >= 1);
  assert(announcement.ip() == announcement.ips(0));
}

void TestServerUrlFormatting() {
  assert(gearledger::discovery::ServerUrl("192.168.1.5", 8080) == "http://192.168.1.5:8080");
  assert(!gearledger::discovery::PrimaryAddress().empty());
}

void TestLoopbackAnnouncementIsDiscoveredAndExpires() {
  const auto port     = TestPort();
  const auto interval = std::chrono::milliseconds(100);

  ListenerOptions listener_options;
  listener_options.port            = port;
  listener_options.stale_after     = std::chrono::milliseconds(300);
  listener_options.receive_timeout = std::chrono::milliseconds(50);

  std::atomic<int> found{0};
  ServerDiscovery  discovery(listener_options, [&](const DiscoveredServer&) { ++found; });
  discovery.Start();

  gearledger::discovery::BroadcasterOptions broadcaster_options;
  broadcaster_options.name                = "Loopback";
  broadcaster_options.server_port         = 8765;
  broadcaster_options.discovery_port      = port;
  broadcaster_options.interval            = interval;
  broadcaster_options.broadcast_addresses = {"127.0.0.1"};

  gearledger::discovery::ServerBroadcaster broadcaster(broadcaster_options);
  broadcaster.Start();

  const auto deadline = std::chrono::steady_clock::now() + 2 * interval + std::chrono::milliseconds(500);
  while (found.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(found.load() >= 1);

  const auto servers = discovery.Servers();
  assert(!servers.empty());
  assert(servers.front().port == 8765);
  assert(servers.front().name == "Loopback");

  broadcaster.Stop();
  assert(!broadcaster.IsRunning());

  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  assert(discovery.Servers().empty());

  discovery.Stop();
}

} // namespace

int main() {
  TestEncodeStampsAnnouncementType();
  TestDecodeRejectsForeignAndMalformedDatagrams();
  TestDecodeFillsMissingPortAndName();
  TestHandleDatagramRecordsEveryAdvertisedAddress();
  TestHandleDatagramFallsBackToIpThenSender();
  TestCallbackOnlyForNewOrStaleEntries();
  TestBroadcasterAnnouncementCarriesPortAndAddresses();
  TestServerUrlFormatting();
  TestLoopbackAnnouncementIsDiscoveredAndExpires();

  std::cout << "gearledger_unit_discovery: pass\n";
  return 0;
}
