#include "network_interfaces.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "internal/observability/logging.hpp"

namespace gearledger::discovery {

namespace {

constexpr const char* kLimitedBroadcast = "255.255.255.255";

std::string FormatIPv4(const sockaddr* addr) {
  char buffer[INET_ADDRSTRLEN] = {};
  const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
  if (::inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

} // namespace

std::vector<InterfaceAddress> ListIPv4Interfaces() {
  std::vector<InterfaceAddress> out;

  ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) {
    GEARLEDGER_LOG_WARN("getifaddrs failed", {observability::IntField("errno", errno)});
    return out;
  }

  for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }

    InterfaceAddress entry;
    entry.name    = it->ifa_name ? it->ifa_name : "";
    entry.address = FormatIPv4(it->ifa_addr);
    if (entry.address.empty()) {
      continue;
    }

    if ((it->ifa_flags & IFF_BROADCAST) != 0 && it->ifa_broadaddr != nullptr) {
      entry.broadcast = FormatIPv4(it->ifa_broadaddr);
    }
    if (entry.broadcast.empty()) {
      entry.broadcast = kLimitedBroadcast;
    }
    out.push_back(std::move(entry));
  }

  ::freeifaddrs(list);
  return out;
}

std::string PrimaryAddress() {
  // Connecting a UDP socket selects the outbound interface without sending.
  boost::asio::io_context        io;
  boost::asio::ip::udp::socket   socket(io);
  boost::system::error_code      ec;
  const boost::asio::ip::udp::endpoint route_target(boost::asio::ip::make_address_v4("8.8.8.8"), 80);

  socket.open(boost::asio::ip::udp::v4(), ec);
  if (!ec) {
    socket.connect(route_target, ec);
  }
  if (!ec) {
    const auto local = socket.local_endpoint(ec);
    if (!ec && !local.address().is_unspecified()) {
      return local.address().to_string();
    }
  }

  const auto interfaces = ListIPv4Interfaces();
  if (!interfaces.empty()) {
    return interfaces.front().address;
  }
  return "127.0.0.1";
}

std::string ServerUrl(const std::string& host, uint32_t port) {
  return "http://" + host + ":" + std::to_string(port);
}

} // namespace gearledger::discovery
