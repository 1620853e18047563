#include "listener.hpp"

#include <optional>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/socket_base.hpp>

#include "announcement.hpp"
#include "internal/observability/logging.hpp"
#include "network_interfaces.hpp"

namespace gearledger::discovery {

using boost::asio::ip::udp;

namespace {

constexpr std::size_t kMaxDatagram = 1024;

} // namespace

struct ServerDiscovery::Socket {
  boost::asio::io_context           io;
  udp::socket                       socket{io};
  std::array<char, kMaxDatagram>    buffer{};
};

std::string DiscoveredServer::Key() const {
  return ip + ":" + std::to_string(port);
}

std::string DiscoveredServer::Url() const {
  return ServerUrl(ip, port);
}

ServerDiscovery::ServerDiscovery(ListenerOptions options, Callback on_found)
    : options_(std::move(options)), on_found_(std::move(on_found)) {
}

ServerDiscovery::~ServerDiscovery() {
  Stop();
}

void ServerDiscovery::Start() {
  if (running_.load()) {
    return;
  }

  auto                      sock = std::make_unique<Socket>();
  boost::system::error_code ec;
  const udp::endpoint       endpoint(boost::asio::ip::make_address_v4(options_.bind_address, ec), options_.port);
  if (ec) {
    throw std::runtime_error("invalid discovery bind address: " + options_.bind_address);
  }

  sock->socket.open(udp::v4(), ec);
  if (!ec) {
    sock->socket.set_option(boost::asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    sock->socket.set_option(boost::asio::socket_base::broadcast(true), ec);
  }
  if (!ec) {
    sock->socket.bind(endpoint, ec);
  }
  if (ec) {
    throw std::runtime_error("discovery listener bind failed on port " + std::to_string(options_.port) + ": " + ec.message());
  }

  socket_ = std::move(sock);
  running_.store(true);
  thread_ = std::thread([this] { Run(); });

  GEARLEDGER_LOG_INFO("Discovery listener started", {observability::IntField("port", options_.port)});
}

void ServerDiscovery::Stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  socket_.reset();
}

std::vector<DiscoveredServer> ServerDiscovery::Servers() {
  const auto now = util::SteadyClock::now();

  std::lock_guard               lock(mutex_);
  std::vector<DiscoveredServer> out;
  for (auto it = servers_.begin(); it != servers_.end();) {
    if (now - it->second.last_seen > options_.stale_after) {
      it = servers_.erase(it);
      continue;
    }
    out.push_back(it->second);
    ++it;
  }
  return out;
}

void ServerDiscovery::HandleDatagram(std::string_view datagram, const std::string& sender) {
  const auto announcement = DecodeAnnouncement(datagram);
  if (!announcement) {
    GEARLEDGER_LOG_DEBUG("Ignoring discovery datagram", {observability::StringField("from", sender)});
    return;
  }

  std::vector<std::string> ips(announcement->ips().begin(), announcement->ips().end());
  if (ips.empty()) {
    ips.push_back(announcement->ip().empty() ? sender : announcement->ip());
  }

  const auto                    now = util::SteadyClock::now();
  std::vector<DiscoveredServer> found;
  {
    std::lock_guard lock(mutex_);
    for (const auto& ip : ips) {
      DiscoveredServer server{ip, announcement->port(), announcement->name(), now};

      auto it = servers_.find(server.Key());
      const bool fresh = it == servers_.end() || now - it->second.last_seen > options_.stale_after;
      servers_[server.Key()] = server;
      if (fresh) {
        found.push_back(std::move(server));
      }
    }
  }

  for (const auto& server : found) {
    GEARLEDGER_LOG_INFO("Discovered server",
                        {observability::StringField("address", server.Key()), observability::StringField("name", server.name)});
    if (on_found_) {
      on_found_(server);
    }
  }
}

void ServerDiscovery::Run() {
  auto& sock = *socket_;

  while (running_.load()) {
    udp::endpoint               sender;
    std::optional<std::size_t>  received;
    boost::system::error_code   receive_error;

    sock.socket.async_receive_from(boost::asio::buffer(sock.buffer), sender,
                                   [&](const boost::system::error_code& ec, std::size_t n) {
                                     receive_error = ec;
                                     received      = n;
                                   });

    sock.io.restart();
    sock.io.run_for(options_.receive_timeout);
    if (!received) {
      boost::system::error_code ignored;
      sock.socket.cancel(ignored);
      sock.io.restart();
      sock.io.run();
    }
    if (!received) {
      continue;
    }

    if (receive_error) {
      if (receive_error == boost::asio::error::operation_aborted) {
        continue;
      }
      if (running_.load()) {
        GEARLEDGER_LOG_WARN("Discovery receive failed", {observability::StringField("error", receive_error.message())});
      }
      break;
    }

    HandleDatagram(std::string_view(sock.buffer.data(), *received), sender.address().to_string());
  }

  GEARLEDGER_LOG_INFO("Discovery listener stopped");
}

} // namespace gearledger::discovery
