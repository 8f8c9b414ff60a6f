#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chronicle_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\chronicle\\\"quoted\"\\db.sqlite"
  auto_create: SCHEMA_MODE_CREATE_OR_UPDATE
logging:
  level: "debug"
)");

  auto config = chronicle::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\chronicle\\\"quoted\"\\db.sqlite");
  assert(config.database().auto_create() == chronicle::runtime::config::SCHEMA_MODE_CREATE_OR_UPDATE);
  assert(config.logging().level() == "debug");
}

void TestNumericFieldsAndDefaults() {
  const auto yaml_path = WriteYaml("numeric_fields",
                                   R"(database:
  memory: {}
events:
  fetch_page_size: 64
)");

  auto config = chronicle::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.database().auto_create() == chronicle::runtime::config::SCHEMA_MODE_NONE);
  assert(config.events().fetch_page_size() == 64);
  assert(chronicle::factory::ToSchemaMode(config.database().auto_create()) == chronicle::db::SchemaMode::None);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/chronicle.db"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)chronicle::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnknownLogLevelIsRejected() {
  bool threw = false;
  try {
    (void)chronicle::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\nlogging:\n  level: loud\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("logging.level") != std::string::npos;
  }
  assert(threw);

  auto config = chronicle::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\nlogging:\n  level: warning\n");
  assert(config.logging().level() == "warning");
}

void TestPostgresWithoutConnectionStringIsRejected() {
  ::unsetenv("CHRONICLE_CONN");

  bool threw = false;
  try {
    (void)chronicle::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    max_connections: 4
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "a postgres backend needs a connection string");
}

void TestConnectionEnvironmentOverride() {
  ::setenv("CHRONICLE_CONN", "postgresql://chronicle@localhost/override", 1);

  auto config = chronicle::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://chronicle@localhost/from_file"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://chronicle@localhost/override");

  ::unsetenv("CHRONICLE_CONN");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)chronicle::config::ConfigLoader::LoadFromYaml("/nonexistent/chronicle/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestNumericFieldsAndDefaults();
  TestUnknownFieldsAreRejected();
  TestUnknownLogLevelIsRejected();
  TestPostgresWithoutConnectionStringIsRejected();
  TestConnectionEnvironmentOverride();
  TestMissingFileIsReported();

  std::cout << "chronicle_unit_config_loader: pass\n";
  return 0;
}
