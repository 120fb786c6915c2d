#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using dispatcher::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "process_dispatcher_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/dispatcher/processes.db"
logging:
  level: debug
  pattern: "[%l] %v"
registry:
  id_generation_attempts: 3
  update_attempts: 5
scheduler:
  enabled: true
  interval_ms: 1500
  process_type: 2
  day_offset_minutes: -300
  assign_batch_size: 4
  active_source_ids: [7, 3, 11]
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/dispatcher/processes.db");
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.registry().id_generation_attempts() == 3);
  assert(config.registry().update_attempts() == 5);
  assert(config.scheduler().enabled());
  assert(config.scheduler().interval_ms() == 1500);
  assert(config.scheduler().process_type() == 2);
  assert(config.scheduler().day_offset_minutes() == -300);
  assert(config.scheduler().assign_batch_size() == 4);
  assert(config.scheduler().active_source_ids_size() == 3);
  assert(config.scheduler().active_source_ids(2) == 11);
}

void TestDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.registry().id_generation_attempts() == 8);
  assert(config.registry().update_attempts() == 8);
  assert(!config.scheduler().enabled());
  assert(config.scheduler().interval_ms() == 60000);
  assert(config.scheduler().process_type() == 1);
  assert(config.scheduler().assign_batch_size() == 16);

  auto defaults = ConfigLoader::Defaults();
  assert(defaults.server().bind_address() == config.server().bind_address());
}

void TestPostgresPoolDefault() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://dispatcher:secret@db:5432/dispatcher"
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 10);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "12345"
)");
  assert(config.database().sqlite().path() == "12345");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejected(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)"));

  assert(Rejected(R"(scheduler:
  enabled: true
  interval: 10
)"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejected(R"(scheduler:
  process_type: 300
)"));

  assert(Rejected(R"(scheduler:
  day_offset_minutes: 900
)"));

  assert(Rejected(R"(database:
  sqlite: {}
)"));

  assert(Rejected(R"(database:
  postgres:
    max_connections: 4
)"));

  assert(Rejected("- just\n- a\n- list\n"));
  assert(Rejected("server: [unterminated"));
}

void TestSourcesTableDefaults() {
  auto config = ConfigLoader::LoadFromYamlString(R"(scheduler:
  enabled: true
  sources_table:
    sqlite:
      path: "/var/lib/sources/sources.db"
)");
  const auto& sources = config.scheduler().sources_table();
  assert(config.scheduler().has_sources_table());
  assert(sources.has_sqlite());
  assert(sources.sqlite().path() == "/var/lib/sources/sources.db");
  assert(sources.table() == "sources");
  assert(sources.id_column() == "id");
  assert(sources.status_column() == "status");
  assert(sources.active_status() == "run");
  assert(config.scheduler().active_source_ids_size() == 0);

  auto pg = ConfigLoader::LoadFromYamlString(R"(scheduler:
  sources_table:
    postgres:
      connection_uri: "postgresql://sources@db:5432/sources"
    table: feeds
    id_column: feed_id
    status_column: lifecycle
    active_status: "active"
)");
  const auto& feeds = pg.scheduler().sources_table();
  assert(feeds.has_postgres());
  assert(feeds.postgres().max_connections() == 2);
  assert(feeds.table() == "feeds");
  assert(feeds.id_column() == "feed_id");
  assert(feeds.status_column() == "lifecycle");
  assert(feeds.active_status() == "active");
}

void TestSourcesTableIsValidated() {
  // a static list and a table cannot both feed the cycle
  assert(Rejected(R"(scheduler:
  active_source_ids: [1, 2]
  sources_table:
    sqlite:
      path: "/tmp/sources.db"
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    table: sources
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    sqlite: {}
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    postgres:
      max_connections: 1
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    sqlite:
      path: "/tmp/sources.db"
    table: "sources; DROP TABLE dispatcher_processes"
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    sqlite:
      path: "/tmp/sources.db"
    id_column: "1id"
)"));

  assert(Rejected(R"(scheduler:
  sources_table:
    sqlite:
      path: "/tmp/sources.db"
    status_column: "state-name"
)"));
}

void TestMissingFileIsReported() {
  bool thrown = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/dispatcher.yaml");
  } catch (const std::runtime_error& e) {
    thrown = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaults();
  TestPostgresPoolDefault();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestSourcesTableDefaults();
  TestSourcesTableIsValidated();
  TestMissingFileIsReported();

  std::cout << "process_dispatcher_unit_config_loader: pass\n";
  return 0;
}
