#include "client/cpp/http_client.h"

#include <httplib.h>

#include <charconv>

namespace gearledger::sync::client {

std::optional<ServerAddress> ParseServerUrl(std::string_view url) {
  constexpr std::string_view kScheme = "http://";
  if (url.substr(0, kScheme.size()) == kScheme) {
    url.remove_prefix(kScheme.size());
  } else if (url.find("://") != std::string_view::npos) {
    return std::nullopt;
  }
  while (!url.empty() && url.back() == '/') {
    url.remove_suffix(1);
  }
  if (url.empty() || url.find('/') != std::string_view::npos) {
    return std::nullopt;
  }

  ServerAddress address;
  const auto    colon = url.rfind(':');
  if (colon == std::string_view::npos) {
    address.host = std::string(url);
    return address;
  }

  address.host    = std::string(url.substr(0, colon));
  const auto port = url.substr(colon + 1);
  const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), address.port);
  if (address.host.empty() || ec != std::errc{} || end != port.data() + port.size() || address.port <= 0 ||
      address.port > 65535) {
    return std::nullopt;
  }
  return address;
}

std::unique_ptr<httplib::Client> MakeHttpClient(const ServerAddress& address, std::chrono::milliseconds connect_timeout,
                                                std::chrono::milliseconds read_timeout) {
  auto http = std::make_unique<httplib::Client>(address.host, address.port);
  http->set_connection_timeout(connect_timeout);
  http->set_read_timeout(read_timeout);
  http->set_write_timeout(read_timeout);
  http->set_keep_alive(false);
  return http;
}

} // namespace gearledger::sync::client
