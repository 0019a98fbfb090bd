#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestMinimalConfigReceivesDefaults() {
  const auto yaml_path = WriteYaml("minimal", R"(server:
  bind_address: "127.0.0.1:7000"
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.keystore().cache_ttl().seconds() == 300);
  assert(config.dispatcher().command_timeout().seconds() == 60);
  assert(config.scripts().catalog_dir() == "tools-standalone");
  assert(!config.agents().require_credential());
  assert(config.network().pools_size() == 3);
  assert(config.network().control_plane_cidrs(2) == "172.31.0.0/24");
  assert(config.network().relay_container() == "tools-relay");
  assert(config.network().driver() == "docker");
  assert(!config.database().has_sqlite());
}

void TestExplicitSectionsOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit", R"(database:
  sqlite:
    path: "/var/lib/relay/relay.db"
    wal_mode: true
logging:
  level: debug
keystore:
  cache_ttl: "2.5s"
dispatcher:
  command_timeout: "45s"
agents:
  require_credential: true
network:
  driver: memory
  pools:
    - "10.20.0.0/16"
  control_plane_cidrs: []
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().sqlite().path() == "/var/lib/relay/relay.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.keystore().cache_ttl().seconds() == 2);
  assert(config.keystore().cache_ttl().nanos() == 500000000);
  assert(config.dispatcher().command_timeout().seconds() == 45);
  assert(config.agents().require_credential());
  assert(config.network().driver() == "memory");
  assert(config.network().pools_size() == 1);
  assert(config.network().pools(0) == "10.20.0.0/16");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(scripts:
  catalog_dir: "C:\\relay\\\"quoted\"\\tools"
network:
  relay_container: "007"
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.scripts().catalog_dir() == "C:\\relay\\\"quoted\"\\tools");
  // Quoted numerals stay strings.
  assert(config.network().relay_container() == "007");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(server:
  bind_address: "0.0.0.0:50051"
websocket_port: 8080
)");

  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml("/nonexistent/relay.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigReceivesDefaults();
  TestExplicitSectionsOverrideDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "relay_unit_config_loader: pass\n";
  return 0;
}
