#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gearledger::discovery {

struct InterfaceAddress {
  std::string name;
  std::string address;
  std::string broadcast;
};

// Up, non-loopback IPv4 interfaces. Interfaces without a kernel-provided
// broadcast address get the limited broadcast address.
std::vector<InterfaceAddress> ListIPv4Interfaces();

// Address other LAN hosts should use to reach this machine; 127.0.0.1 when
// no interface is usable.
std::string PrimaryAddress();

std::string ServerUrl(const std::string& host, uint32_t port);

} // namespace gearledger::discovery
