#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "internal/db/api/source_reader.hpp"

namespace dispatcher::config {

using dispatcher::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress       = "0.0.0.0:50061";
constexpr uint32_t    kDefaultAttempts          = 8;
constexpr uint32_t    kDefaultIntervalMs        = 60000;
constexpr uint32_t    kDefaultAssignBatchSize   = 16;
constexpr uint32_t    kDefaultPostgresPoolSize  = 10;
constexpr uint32_t    kDefaultProcessType       = 1;
constexpr int32_t     kMaxDayOffsetMinutes      = 14 * 60;
constexpr uint32_t    kDefaultSourcesPoolSize   = 2;

void RequireIdentifier(const char* field, const std::string& name) {
  if (!db::IsSqlIdentifier(name)) {
    throw std::runtime_error(std::string("Invalid configuration: scheduler.sources_table.") + field +
                             " must be a plain SQL identifier, got '" + name + "'");
  }
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is an empty config
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

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

  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == dispatcher::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(kDefaultPostgresPoolSize);
  }

  auto* registry = config.mutable_registry();
  if (registry->id_generation_attempts() == 0) {
    registry->set_id_generation_attempts(kDefaultAttempts);
  }
  if (registry->update_attempts() == 0) {
    registry->set_update_attempts(kDefaultAttempts);
  }

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->interval_ms() == 0) {
    scheduler->set_interval_ms(kDefaultIntervalMs);
  }
  if (scheduler->process_type() == 0) {
    scheduler->set_process_type(kDefaultProcessType);
  }
  if (scheduler->assign_batch_size() == 0) {
    scheduler->set_assign_batch_size(kDefaultAssignBatchSize);
  }

  if (scheduler->has_sources_table()) {
    const db::SourceQuery defaults;
    auto*                 sources = scheduler->mutable_sources_table();
    if (sources->table().empty()) {
      sources->set_table(defaults.table);
    }
    if (sources->id_column().empty()) {
      sources->set_id_column(defaults.id_column);
    }
    if (sources->status_column().empty()) {
      sources->set_status_column(defaults.status_column);
    }
    if (sources->active_status().empty()) {
      sources->set_active_status(defaults.active_status);
    }
    if (sources->has_postgres() && sources->postgres().max_connections() == 0) {
      sources->mutable_postgres()->set_max_connections(kDefaultSourcesPoolSize);
    }
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& scheduler = config.scheduler();
  if (scheduler.process_type() > std::numeric_limits<uint8_t>::max()) {
    throw std::runtime_error("Invalid configuration: scheduler.process_type must be in 0..255");
  }
  if (scheduler.day_offset_minutes() < -kMaxDayOffsetMinutes || scheduler.day_offset_minutes() > kMaxDayOffsetMinutes) {
    throw std::runtime_error("Invalid configuration: scheduler.day_offset_minutes must be within +/-840");
  }

  if (scheduler.has_sources_table()) {
    const auto& sources = scheduler.sources_table();
    if (scheduler.active_source_ids_size() > 0) {
      throw std::runtime_error(
          "Invalid configuration: scheduler.active_source_ids and scheduler.sources_table are mutually exclusive");
    }
    if (sources.backend_case() == dispatcher::runtime::config::SourcesTableConfig::BACKEND_NOT_SET) {
      throw std::runtime_error("Invalid configuration: scheduler.sources_table needs a sqlite or postgres backend");
    }
    if (sources.has_sqlite() && sources.sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: scheduler.sources_table.sqlite.path is required");
    }
    if (sources.has_postgres() && sources.postgres().connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: scheduler.sources_table.postgres.connection_uri is required");
    }
    RequireIdentifier("table", sources.table());
    RequireIdentifier("id_column", sources.id_column());
    RequireIdentifier("status_column", sources.status_column());
  }
}

} // namespace dispatcher::config
