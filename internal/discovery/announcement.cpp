#include "announcement.hpp"

#include "internal/util/json.hpp"

namespace gearledger::discovery {

std::string EncodeAnnouncement(const v1::Announcement& announcement) {
  v1::Announcement copy = announcement;
  copy.set_type(v1::kAnnouncementType);
  return util::ToJson(copy);
}

std::optional<v1::Announcement> DecodeAnnouncement(std::string_view datagram) {
  v1::Announcement announcement;
  if (!util::TryFromJson(datagram, &announcement)) {
    return std::nullopt;
  }
  if (announcement.type() != v1::kAnnouncementType) {
    return std::nullopt;
  }
  if (announcement.port() == 0) {
    announcement.set_port(kDefaultServerPort);
  }
  if (announcement.name().empty()) {
    announcement.set_name(sync::v1::kServerIdentity);
  }
  return announcement;
}

} // namespace gearledger::discovery
