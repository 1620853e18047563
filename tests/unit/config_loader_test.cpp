#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "gearledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsCoverEverySection() {
  const auto config = gearledger::config::ConfigLoader::Defaults();

  assert(config.server().bind_address() == "0.0.0.0");
  assert(config.server().port() == 8080);
  assert(config.server().name() == "Gear Ledger Server");
  assert(config.database().sqlite().busy_timeout_ms() == 30000);
  assert(!config.database().sqlite().path().empty());
  assert(config.discovery().enabled());
  assert(config.discovery().port() == 8888);
  assert(config.discovery().interval_ms() == 3000);
  assert(config.discovery().stale_after_ms() == 5000);
  assert(config.sync().client_stale_after_ms() == 10000);
  assert(config.sync().client_sweep_interval_ms() == 2000);
  assert(config.sync().keepalive_interval_ms() == 30000);
  assert(config.logging().level() == "info");
}

void TestPartialFileKeepsDefaultsForMissingFields() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(server:
  port: 9090
  name: "Warehouse 2"
database:
  sqlite:
    path: "/tmp/gearledger/results.db"
discovery:
  broadcast_addresses: ["127.0.0.1", "192.168.1.255"]
)");

  const auto config = gearledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().port() == 9090);
  assert(config.server().name() == "Warehouse 2");
  assert(config.server().bind_address() == "0.0.0.0");
  assert(config.database().sqlite().path() == "/tmp/gearledger/results.db");
  assert(config.database().sqlite().busy_timeout_ms() == 30000);
  assert(config.discovery().enabled());
  assert(config.discovery().broadcast_addresses_size() == 2);
  assert(config.discovery().broadcast_addresses(0) == "127.0.0.1");
  assert(config.sync().max_catalog_bytes() == 64u * 1024u * 1024u);
}

void TestDiscoveryCanBeDisabled() {
  const auto yaml_path = WriteYaml("discovery_off",
                                   R"(discovery:
  enabled: false
  port: 9999
)");

  const auto config = gearledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.discovery().enabled());
  assert(config.discovery().port() == 9999);
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  const auto config = gearledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().port() == 8080);
  assert(config.discovery().enabled());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\gearledger\\\"quoted\"\\db.sqlite"
)");

  auto config = gearledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\gearledger\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  port: 8080
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)gearledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)gearledger::config::ConfigLoader::LoadFromYaml("/nonexistent/gearledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultsCoverEverySection();
  TestPartialFileKeepsDefaultsForMissingFields();
  TestDiscoveryCanBeDisabled();
  TestEmptyFileYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "gearledger_unit_config_loader: pass\n";
  return 0;
}
