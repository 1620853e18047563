#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httplib {
class Client;
}

namespace gearledger::sync::client {

struct ServerAddress {
  std::string host;
  int         port = 8080;
};

// Accepts `http://host:port[/]` and `host:port`; port defaults to 8080.
std::optional<ServerAddress> ParseServerUrl(std::string_view url);

// A fresh connection-per-call client with both timeouts applied.
std::unique_ptr<httplib::Client> MakeHttpClient(const ServerAddress& address, std::chrono::milliseconds connect_timeout,
                                                std::chrono::milliseconds read_timeout);

} // namespace gearledger::sync::client
