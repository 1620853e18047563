#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using gearledger::factory::Build;
using gearledger::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: gearledger-server [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? gearledger::config::ConfigLoader::Defaults()
                                      : gearledger::config::ConfigLoader::LoadFromYaml(config_path);

    gearledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config, std::move(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    std::cout << "Gear Ledger server running at " << server.Url() << std::endl;

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    GEARLEDGER_LOG_INFO("Shutting down sync server");

    server.Stop();
    gearledger::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    GEARLEDGER_LOG_ERROR("Fatal error", {gearledger::observability::StringField("error", e.what())});
    gearledger::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
