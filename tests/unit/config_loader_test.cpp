#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using settle::config::ConfigLoader;
using settle::runtime::config::DatabaseConfig;
using settle::runtime::config::RuntimeConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "settlement_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  ::unsetenv("SETTLE_DATABASE_URL");
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/settle/settle.db"
logging:
  level: debug
observability:
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
  environment: staging
settlement:
  default_lookback_hours: 24
  explain_by_default: true
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/var/lib/settle/settle.db");
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().environment() == "staging");
  assert(config.settlement().default_lookback_hours() == 24);
  assert(config.settlement().explain_by_default());
}

void TestDefaultsAreFilledIn() {
  ::unsetenv("SETTLE_DATABASE_URL");
  const auto yaml_path = WriteYaml("defaults",
                                   R"(database:
  memory: {}
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.settlement().default_lookback_hours() == 48);
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
}

void TestQuotedScalarsStayStrings() {
  ::unsetenv("SETTLE_DATABASE_URL");
  const auto yaml_path = WriteYaml("quoted",
                                   R"(database:
  sqlite:
    path: "12345"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "12345");
}

void TestUnknownFieldsAreRejected() {
  ::unsetenv("SETTLE_DATABASE_URL");
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
storage:
  ram: 1
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDatabaseUrlOverridesFile() {
  const auto yaml_path = WriteYaml("env_override",
                                   R"(database:
  sqlite:
    path: "/tmp/from-file.db"
)");

  ::setenv("SETTLE_DATABASE_URL", "postgres://settle:secret@db:5432/settle", 1);
  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  ::unsetenv("SETTLE_DATABASE_URL");

  assert(config.database().backend_case() == DatabaseConfig::kPostgres);
  assert(config.database().postgres().connection_uri() == "postgresql://settle:secret@db:5432/settle");
}

void TestDatabaseUrlForms() {
  RuntimeConfig config;

  ConfigLoader::ApplyDatabaseUrl("sqlite:///var/data/settle.db", config);
  assert(config.database().sqlite().path() == "/var/data/settle.db");

  ConfigLoader::ApplyDatabaseUrl("sqlite:relative.db", config);
  assert(config.database().sqlite().path() == "relative.db");

  ConfigLoader::ApplyDatabaseUrl("memory", config);
  assert(config.database().backend_case() == DatabaseConfig::kMemory);

  ConfigLoader::ApplyDatabaseUrl("postgresql://localhost/settle", config);
  assert(config.database().postgres().connection_uri() == "postgresql://localhost/settle");

  bool threw = false;
  try {
    ConfigLoader::ApplyDatabaseUrl("mysql://localhost/settle", config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::ApplyDatabaseUrl("sqlite:", config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "A sqlite URL needs a path.");
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsAreFilledIn();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestDatabaseUrlOverridesFile();
  TestDatabaseUrlForms();

  std::cout << "settle_unit_config_loader: pass\n";
  return 0;
}
