#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/catalog_seeder.hpp"
#include "internal/util/errors.hpp"

namespace {

using tablebook::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tablebook_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestRuntimeConfigFromFile() {
  const auto yaml_path = WriteYaml("runtime",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/tablebook/bookings.db"
    wal_mode: true
    busy_timeout_ms: 2500
logging:
  level: debug
locking:
  ttl_ms: 10000
  max_wait_ms: 5000
  backoff_multiplier: 1.5
  key_prefix: "booking-lock:"
availability:
  default_turn_time_minutes: 105
  max_alternatives: 3
catalog_path: "/etc/tablebook/catalog.yaml"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/tablebook/bookings.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.locking().ttl_ms() == 10000);
  assert(config.locking().backoff_multiplier() == 1.5);
  assert(config.locking().key_prefix() == "booking-lock:");
  assert(config.availability().default_turn_time_minutes() == 105);
  assert(config.availability().max_alternatives() == 3);
  assert(config.catalog_path() == "/etc/tablebook/catalog.yaml");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::ParseYaml(R"(database:
  sqlite:
    path: "C:\\tablebook\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");
  assert(config.database().sqlite().path() == "C:\\tablebook\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::ParseYaml(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::ParseYaml(R"(locking:
  key_prefix: "12"
)");
  assert(config.locking().key_prefix() == "12");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::ParseYaml("");
  assert(config.server().bind_address().empty());
  assert(!config.database().has_sqlite());
  assert(config.catalog_path().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/tablebook/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("/nonexistent/tablebook/config.yaml") != std::string::npos;
  }
  assert(threw);
}

void TestCatalogParsesAndValidates() {
  const auto yaml_path = WriteYaml("catalog",
                                   R"(restaurants:
  - restaurant:
      id: "12"
      name: "Corner Bistro"
      schedule:
        friday:
          open: true
          periods:
            - name: lunch
              start_time: "12:00"
              end_time: "14:30"
            - name: dinner
              start_time: "18:00"
              end_time: "22:00"
              slot_interval_minutes: 15
      pacing:
        max_covers_per_slot: 20
      settings:
        slot_interval_minutes: 30
        max_party_size: 10
        utc_offset_minutes: -300
        allow_table_combinations: true
    tables:
      - id: "1"
        number: "1"
        min_capacity: 2
        max_capacity: 4
        active: true
        combinable: true
        adjacent_table_ids: ["2"]
      - id: "2"
        number: "2"
        min_capacity: 1
        max_capacity: 2
        active: true
    turn_time_rules:
      - id: "pairs"
        name: "Parties of two"
        min_party_size: 1
        max_party_size: 2
        duration_minutes: 75
        active: true
)");

  auto catalog = ConfigLoader::LoadCatalogFromYaml(yaml_path.string());
  assert(catalog.restaurants_size() == 1);

  const auto& entry = catalog.restaurants(0);
  assert(entry.restaurant().id() == "12");
  assert(entry.restaurant().schedule().friday().periods_size() == 2);
  assert(entry.restaurant().schedule().friday().periods(1).start_time() == "18:00");
  assert(entry.restaurant().schedule().friday().periods(1).slot_interval_minutes() == 15);
  assert(entry.restaurant().pacing().max_covers_per_slot() == 20);
  assert(entry.restaurant().settings().utc_offset_minutes() == -300);
  assert(entry.restaurant().settings().allow_table_combinations());
  assert(entry.tables_size() == 2);
  assert(entry.tables(0).adjacent_table_ids(0) == "2");
  assert(entry.turn_time_rules(0).duration_minutes() == 75);

  tablebook::core::CatalogSeeder::Validate(catalog);
}

void TestCatalogValidationRejectsBadEntries() {
  auto catalog = ConfigLoader::ParseCatalogYaml(R"(restaurants:
  - restaurant:
      id: "bistro"
    tables:
      - id: "t1"
        min_capacity: 6
        max_capacity: 4
)");

  bool threw = false;
  try {
    tablebook::core::CatalogSeeder::Validate(catalog);
  } catch (const tablebook::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  catalog = ConfigLoader::ParseCatalogYaml(R"(restaurants:
  - restaurant:
      id: "bistro"
      schedule:
        monday:
          open: true
          periods:
            - name: dinner
              start_time: "22:00"
              end_time: "18:00"
)");
  threw = false;
  try {
    tablebook::core::CatalogSeeder::Validate(catalog);
  } catch (const tablebook::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRuntimeConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestCatalogParsesAndValidates();
  TestCatalogValidationRejectsBadEntries();

  std::cout << "tablebook_unit_config_loader: pass\n";
  return 0;
}
