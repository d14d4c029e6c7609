#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "loadplan/v1.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "loadplan_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
logging:
  level: "debug"
engine:
  pallet_layout: PALLET_LAYOUT_FLOOR_GRID
  allow_footprint_rotation: true
  epsilon_cm: 0.0001
  success_message: "Plan ready"
  default_pallet:
    name: "EUR"
    dimensions: {length: 120, width: 100, height: 15, unit: LENGTH_UNIT_CENTIMETERS}
    tare_weight: 20
    max_weight: 1000
cache:
  max_entries: 25
  ttl_ms: 60000
)");

  auto config = loadplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.logging().level() == "debug");
  assert(config.engine().pallet_layout() == loadplan::runtime::config::PALLET_LAYOUT_FLOOR_GRID);
  assert(config.engine().allow_footprint_rotation());
  assert(config.engine().epsilon_cm() == 0.0001);
  assert(config.engine().success_message() == "Plan ready");
  assert(config.engine().has_default_pallet());
  assert(config.engine().default_pallet().dimensions().length() == 120.0);
  assert(config.engine().default_pallet().has_max_weight());
  assert(config.cache().max_entries() == 25);
  assert(config.cache().ttl_ms() == 60000);
}

void TestScalarEscapingForQuotedValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
engine:
  success_message: "Loaded \"as planned\"\\ok"
)");

  auto config = loadplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.engine().success_message() == "Loaded \"as planned\"\\ok");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(engine:
  success_message: "12345"
)");

  auto config = loadplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.engine().success_message() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)loadplan::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)loadplan::config::ConfigLoader::LoadFromYaml("/nonexistent/loadplan.yaml");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

void TestRequestMessagesShareTheSyntax() {
  loadplan::services::v1::OptimizeRequest request;
  loadplan::config::ConfigLoader::ParseMessageFromYamlString(R"(products:
  - product:
      id: "p-1"
      name: "Cube"
      dimensions: {length: 10, width: 10, height: 10, unit: LENGTH_UNIT_INCHES}
      weight: 1.5
    quantity: 4
container:
  dimensions: {length: 100, width: 100, height: 100, unit: LENGTH_UNIT_CENTIMETERS}
  max_weight: 800
success_message: "done"
)",
                                                             &request);

  assert(request.products_size() == 1);
  assert(request.products(0).quantity() == 4);
  assert(request.products(0).product().has_weight());
  assert(request.products(0).product().dimensions().unit() == loadplan::core::v1::LENGTH_UNIT_INCHES);
  assert(request.container().max_weight() == 800.0);
  assert(!request.has_pallet());
  assert(request.success_message() == "done");
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestRequestMessagesShareTheSyntax();

  std::cout << "loadplan_unit_config_loader: pass\n";
  return 0;
}
