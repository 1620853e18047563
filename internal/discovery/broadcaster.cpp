#include "broadcaster.hpp"

#include <algorithm>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/socket_base.hpp>

#include "announcement.hpp"
#include "internal/observability/logging.hpp"
#include "network_interfaces.hpp"

namespace gearledger::discovery {

namespace {

using boost::asio::ip::udp;

constexpr const char* kLimitedBroadcast = "255.255.255.255";

} // namespace

ServerBroadcaster::ServerBroadcaster(BroadcasterOptions options) : options_(std::move(options)) {
}

ServerBroadcaster::~ServerBroadcaster() {
  Stop();
}

void ServerBroadcaster::Start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_     = true;
  loop_active_ = true;
  thread_      = std::thread([this] { Run(); });
}

void ServerBroadcaster::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ServerBroadcaster::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_ && loop_active_;
}

v1::Announcement ServerBroadcaster::BuildAnnouncement() const {
  v1::Announcement announcement;
  announcement.set_type(v1::kAnnouncementType);
  announcement.set_port(options_.server_port);
  announcement.set_name(options_.name.empty() ? sync::v1::kServerIdentity : options_.name);

  for (const auto& iface : ListIPv4Interfaces()) {
    announcement.add_ips(iface.address);
  }
  if (announcement.ips_size() == 0) {
    announcement.add_ips(PrimaryAddress());
  }
  announcement.set_ip(announcement.ips(0));
  return announcement;
}

std::vector<std::string> ServerBroadcaster::Destinations() const {
  if (!options_.broadcast_addresses.empty()) {
    return options_.broadcast_addresses;
  }

  std::vector<std::string> out;
  for (const auto& iface : ListIPv4Interfaces()) {
    if (std::find(out.begin(), out.end(), iface.broadcast) == out.end()) {
      out.push_back(iface.broadcast);
    }
  }
  if (out.empty()) {
    out.push_back(kLimitedBroadcast);
  }
  return out;
}

void ServerBroadcaster::Run() {
  boost::asio::io_context   io;
  udp::socket               socket(io);
  boost::system::error_code ec;

  socket.open(udp::v4(), ec);
  if (!ec) {
    socket.set_option(boost::asio::socket_base::broadcast(true), ec);
  }
  if (ec) {
    GEARLEDGER_LOG_ERROR("Discovery broadcaster socket setup failed", {observability::StringField("error", ec.message())});
    std::lock_guard lock(mutex_);
    loop_active_ = false;
    return;
  }

  const std::string payload = EncodeAnnouncement(BuildAnnouncement());

  std::vector<udp::endpoint> endpoints;
  for (const auto& destination : Destinations()) {
    const auto address = boost::asio::ip::make_address_v4(destination, ec);
    if (ec) {
      GEARLEDGER_LOG_WARN("Ignoring invalid broadcast address", {observability::StringField("address", destination)});
      continue;
    }
    endpoints.emplace_back(address, options_.discovery_port);
  }

  GEARLEDGER_LOG_INFO("Discovery broadcaster started",
                      {observability::IntField("discovery_port", options_.discovery_port),
                       observability::IntField("destinations", static_cast<int64_t>(endpoints.size())),
                       observability::StringField("announcement", payload)});

  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    bool failed = false;
    for (const auto& endpoint : endpoints) {
      socket.send_to(boost::asio::buffer(payload), endpoint, 0, ec);
      if (ec) {
        GEARLEDGER_LOG_ERROR("Discovery broadcast failed",
                             {observability::StringField("destination", endpoint.address().to_string()),
                              observability::StringField("error", ec.message())});
        failed = true;
        break;
      }
    }
    lock.lock();
    if (failed) {
      break;
    }
    cv_.wait_for(lock, options_.interval, [this] { return !running_; });
  }
  loop_active_ = false;
  lock.unlock();

  GEARLEDGER_LOG_INFO("Discovery broadcaster stopped");
}

} // namespace gearledger::discovery
