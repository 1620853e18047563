#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace gearledger::config {

namespace {

constexpr uint32_t kDefaultPort                    = 8080;
constexpr uint32_t kDefaultBusyTimeoutMs           = 30000;
constexpr uint32_t kDefaultMaxConnections          = 16;
constexpr uint32_t kDefaultDiscoveryPort           = 8888;
constexpr uint32_t kDefaultBroadcastIntervalMs     = 3000;
constexpr uint32_t kDefaultDiscoveryStaleMs        = 5000;
constexpr uint32_t kDefaultClientStaleMs           = 10000;
constexpr uint32_t kDefaultClientSweepMs           = 2000;
constexpr uint32_t kDefaultKeepaliveMs             = 30000;
constexpr uint32_t kDefaultSubscriberQueueCapacity = 64;
constexpr uint32_t kDefaultMaxCatalogBytes         = 64u * 1024u * 1024u;

std::string DefaultDatabasePath() {
  std::filesystem::path base = std::filesystem::temp_directory_path();
  if (const char* home = std::getenv("HOME")) {
    base = home;
  }
  return (base / ".gearledger" / "data" / "gearledger.db").string();
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

bool DiscoveryEnabledSpecified(const YAML::Node& root) {
  if (!root.IsMap()) {
    return false;
  }
  const YAML::Node discovery = root["discovery"];
  return discovery && discovery.IsMap() && discovery["enabled"];
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

gearledger::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  gearledger::runtime::config::RuntimeConfig config;

  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  // Discovery is on unless the file spells out `enabled: false`.
  if (!DiscoveryEnabledSpecified(yaml)) {
    config.mutable_discovery()->set_enabled(true);
  }

  ApplyDefaults(&config);
  return config;
}

gearledger::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  gearledger::runtime::config::RuntimeConfig config;
  config.mutable_discovery()->set_enabled(true);
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(gearledger::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0");
  if (server->port() == 0) server->set_port(kDefaultPort);
  if (server->name().empty()) server->set_name("Gear Ledger Server");

  auto* sqlite = config->mutable_database()->mutable_sqlite();
  if (sqlite->path().empty()) sqlite->set_path(DefaultDatabasePath());
  if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  if (sqlite->max_connections() == 0) sqlite->set_max_connections(kDefaultMaxConnections);

  // `enabled` is a plain bool; an explicit `enabled: false` in YAML is kept.
  auto* discovery = config->mutable_discovery();
  if (discovery->port() == 0) discovery->set_port(kDefaultDiscoveryPort);
  if (discovery->interval_ms() == 0) discovery->set_interval_ms(kDefaultBroadcastIntervalMs);
  if (discovery->stale_after_ms() == 0) discovery->set_stale_after_ms(kDefaultDiscoveryStaleMs);

  auto* sync = config->mutable_sync();
  if (sync->client_stale_after_ms() == 0) sync->set_client_stale_after_ms(kDefaultClientStaleMs);
  if (sync->client_sweep_interval_ms() == 0) sync->set_client_sweep_interval_ms(kDefaultClientSweepMs);
  if (sync->keepalive_interval_ms() == 0) sync->set_keepalive_interval_ms(kDefaultKeepaliveMs);
  if (sync->subscriber_queue_capacity() == 0) sync->set_subscriber_queue_capacity(kDefaultSubscriberQueueCapacity);
  if (sync->max_catalog_bytes() == 0) sync->set_max_catalog_bytes(kDefaultMaxCatalogBytes);

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

} // namespace gearledger::config
