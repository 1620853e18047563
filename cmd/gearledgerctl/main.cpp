#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/event_stream_client.h"
#include "client/cpp/sync_client.h"
#include "gearledger/sync/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/discovery/listener.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

using namespace gearledger::sync::v1;
using gearledger::sync::client::SyncClient;

static volatile std::sig_atomic_t g_running = 1;

static void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  gearledgerctl [--server http://host:port] [--config <file>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  discover                                   list servers announcing on the LAN\n"
            << "  status\n"
            << "  version\n"
            << "  results [client]\n"
            << "  add <artikul> <client> [qty] [weight] [price]\n"
            << "  clear [client]\n"
            << "  clients\n"
            << "  upload <file>\n"
            << "  download [file]\n"
            << "  watch                                      print server events until interrupted\n";
}

static std::vector<gearledger::discovery::DiscoveredServer> Discover(const gearledger::runtime::config::RuntimeConfig& config,
                                                                     bool first_only) {
  gearledger::discovery::ListenerOptions options;
  options.port        = static_cast<uint16_t>(config.discovery().port());
  options.stale_after = std::chrono::milliseconds(config.discovery().stale_after_ms());
  options.receive_timeout = std::chrono::milliseconds(250);

  gearledger::discovery::ServerDiscovery listener(options);
  listener.Start();

  // Two broadcast intervals plus slack.
  const auto deadline = std::chrono::steady_clock::now() + 2 * std::chrono::milliseconds(config.discovery().interval_ms()) +
                        std::chrono::milliseconds(500);
  std::vector<gearledger::discovery::DiscoveredServer> servers;
  while (g_running && std::chrono::steady_clock::now() < deadline) {
    servers = listener.Servers();
    if (first_only && !servers.empty()) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  listener.Stop();
  return listener.Servers();
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename T>
static int Print(const gearledger::sync::client::Outcome<T>& outcome) {
  if (!outcome.ok) {
    std::cerr << "error: " << outcome.error << "\n";
    return 2;
  }
  std::cout << gearledger::util::ToJson(outcome.value) << "\n";
  return 0;
}

static int Watch(const std::string& server_url) {
  gearledger::sync::client::EventStreamCallbacks callbacks;
  callbacks.on_event        = [](const std::string&, const std::string& json) { std::cout << json << std::endl; };
  callbacks.on_connected    = [] { std::cerr << "connected" << std::endl; };
  callbacks.on_disconnected = [] { std::cerr << "disconnected, retrying" << std::endl; };
  callbacks.on_error        = [](const std::string& error) { std::cerr << "error: " << error << std::endl; };

  gearledger::sync::client::EventStreamClient stream(server_url, std::move(callbacks));
  stream.Start();
  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));
  stream.Stop();
  return 0;
}

int main(int argc, char** argv) {
  std::string              server_url;
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--server" && i + 1 < argc) {
      server_url = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  try {
    auto config = config_path.empty() ? gearledger::config::ConfigLoader::Defaults()
                                      : gearledger::config::ConfigLoader::LoadFromYaml(config_path);
    if (config_path.empty() && std::getenv("GEARLEDGER_LOG_LEVEL") == nullptr) {
      config.mutable_logging()->set_level("warn");
    }
    gearledger::observability::InitializeLogging(config);

    const std::string cmd = args[0];

    if (cmd == "discover") {
      const auto servers = Discover(config, false);
      if (servers.empty()) {
        std::cout << "no servers found\n";
        return 1;
      }
      for (const auto& server : servers) {
        std::cout << server.Url() << "  " << server.name << "\n";
      }
      return 0;
    }

    if (server_url.empty()) {
      const auto servers = Discover(config, true);
      if (servers.empty()) {
        std::cerr << "no server found; pass --server http://host:port\n";
        return 1;
      }
      server_url = servers.front().Url();
      std::cerr << "using " << server_url << " (" << servers.front().name << ")\n";
    }

    SyncClient client(server_url);

    if (cmd == "status") {
      return Print(client.CheckConnection());
    }

    if (cmd == "version") {
      const auto version = client.GetSyncVersion();
      if (version < 0) {
        std::cerr << "error: server unreachable\n";
        return 2;
      }
      std::cout << version << "\n";
      return 0;
    }

    if (cmd == "results") {
      std::optional<std::string> filter;
      if (args.size() >= 2) {
        filter = args[1];
      }
      return Print(client.GetResults(filter));
    }

    if (cmd == "add") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      UpsertResultRequest req;
      req.set_artikul(args[1]);
      req.set_client(args[2]);
      if (args.size() >= 4) req.set_quantity(std::stoi(args[3]));
      if (args.size() >= 5) req.set_weight(std::stod(args[4]));
      if (args.size() >= 6) req.set_sale_price(std::stod(args[5]));
      return Print(client.AddResult(req));
    }

    if (cmd == "clear") {
      std::optional<std::string> filter;
      if (args.size() >= 2) {
        filter = args[1];
      }
      return Print(client.ClearResults(filter));
    }

    if (cmd == "clients") {
      return Print(client.GetClients());
    }

    if (cmd == "upload") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      const auto bytes = ReadFile(args[1]);
      if (!bytes) {
        std::cerr << "cannot read " << args[1] << "\n";
        return 1;
      }
      return Print(client.UploadCatalog(std::filesystem::path(args[1]).filename().string(), *bytes));
    }

    if (cmd == "download") {
      const auto outcome = client.DownloadCatalog();
      if (!outcome.ok) {
        std::cerr << "error: " << outcome.error << "\n";
        return 2;
      }
      const std::string path = args.size() >= 2 ? args[1] : (outcome.value.filename.empty() ? "catalog" : outcome.value.filename);
      std::ofstream     out(path, std::ios::binary | std::ios::trunc);
      out.write(outcome.value.bytes.data(), static_cast<std::streamsize>(outcome.value.bytes.size()));
      if (!out) {
        std::cerr << "cannot write " << path << "\n";
        return 1;
      }
      std::cout << path << " (" << outcome.value.bytes.size() << " bytes)\n";
      return 0;
    }

    if (cmd == "watch") {
      return Watch(server_url);
    }

    std::cerr << "unknown command: " << cmd << "\n";
    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
