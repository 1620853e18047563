#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "gearledger/sync/v1.hpp"

namespace gearledger::discovery {

inline constexpr uint16_t kDefaultDiscoveryPort = 8888;
inline constexpr uint32_t kDefaultServerPort    = 8080;

std::string EncodeAnnouncement(const v1::Announcement& announcement);

// Returns nullopt for malformed JSON and for datagrams that are not
// GearLedger announcements. Missing port/name fall back to the defaults.
std::optional<v1::Announcement> DecodeAnnouncement(std::string_view datagram);

} // namespace gearledger::discovery
