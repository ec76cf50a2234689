#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using blueshare::config::ConfigLoader;

constexpr const char* kConfig = R"(
logging:
  level: debug
consent:
  parallel: true
  request_type: tethering
session:
  id: "007"
  devices:
    - id: alice
      name: Alice Phone
      role: host
      rssi_dbm: -65
      bytes_sent: 5242880
      bytes_received: 2097152
      bandwidth_mbps: 10.5
    - id: bob
      role: client
      rssi_dbm: -60
      mtu: 185
)";

void TestLoadsEveryField() {
  const auto config = ConfigLoader::LoadFromYamlString(kConfig);

  assert(config.logging().level() == "debug");
  assert(config.consent().parallel());
  assert(config.consent().request_type() == "tethering");
  assert(config.session().id() == "007");
  assert(config.session().devices_size() == 2);

  const auto& alice = config.session().devices(0);
  assert(alice.id() == "alice");
  assert(alice.name() == "Alice Phone");
  assert(alice.role() == "host");
  assert(alice.rssi_dbm() == -65);
  assert(alice.bytes_sent() == 5242880);
  assert(alice.bytes_received() == 2097152);
  assert(alice.bandwidth_mbps() == 10.5);

  const auto& bob = config.session().devices(1);
  assert(bob.mtu() == 185);
  assert(bob.bandwidth_mbps() == 0.0);
}

void TestLoadsFromFile() {
  const auto path = std::filesystem::temp_directory_path() / "blueshare_config_loader_test.yaml";
  {
    std::ofstream out(path);
    out << kConfig;
  }

  const auto config = ConfigLoader::LoadFromYaml(path.string());
  std::filesystem::remove(path);

  assert(config.session().devices_size() == 2);
  assert(config.session().devices(1).id() == "bob");
}

void TestUnknownFieldRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("session:\n  id: s1\n  colour: blue\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownLogLevelRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("logging:\n  level: verbose\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n").logging().level() == "warn");
}

void TestNonFiniteSpellingsStayText() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(
session:
  id: inf
  devices:
    - id: NaN
      name: Nan
      role: host
    - id: Infinity
      name: -INF
      role: client
)");

  assert(config.session().id() == "inf");
  assert(config.session().devices(0).id() == "NaN");
  assert(config.session().devices(0).name() == "Nan");
  assert(config.session().devices(1).id() == "Infinity");
  assert(config.session().devices(1).name() == "-INF");
}

void TestMissingFileRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/blueshare.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptySectionsDefault() {
  const auto config = ConfigLoader::LoadFromYamlString("session:\n  id: only-id\n");

  assert(config.session().id() == "only-id");
  assert(config.session().devices_size() == 0);
  assert(!config.consent().parallel());
  assert(config.logging().level().empty());
}

} // namespace

int main() {
  TestLoadsEveryField();
  TestLoadsFromFile();
  TestUnknownFieldRejected();
  TestUnknownLogLevelRejected();
  TestNonFiniteSpellingsStayText();
  TestMissingFileRejected();
  TestEmptySectionsDefault();

  std::cout << "blueshare_unit_config_loader: pass\n";
  return 0;
}
