#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"

namespace {

using freight::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "freight_exchange_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/freight/exchange.db"
logging:
  level: debug
auction:
  default_duration_ms: 600000
  min_price_floor: 75.5
  max_bids_per_window: 12
  timer_tick_ms: 250
ranking:
  price_weight: 0.6
  reputation_weight: 0.2
  proximity_weight: 0.1
  backhaul_weight: 0.1
  eta_half_life_minutes: 45
backhaul:
  radius_km: 200
  max_results: 5
reputation:
  post_pickup_penalty: 0.3
dispatch:
  no_show_grace_ms: 900000
observability:
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/freight/exchange.db");
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == freight::runtime::config::OTLP_TRANSPORT_HTTP);

  const auto auction = freight::config::AuctionOptionsFrom(config);
  assert(auction.default_duration_ms == 600000);
  assert(auction.min_price_floor == 75.5);
  assert(auction.max_bids_per_window == 12);
  assert(auction.timer_tick_ms == 250);

  const auto weights = freight::config::RankingWeightsFrom(config);
  assert(weights.price == 0.6);
  assert(weights.backhaul == 0.1);
  assert(weights.eta_half_life_minutes == 45.0);

  const auto backhaul = freight::config::BackhaulOptionsFrom(config);
  assert(backhaul.radius_km == 200.0);
  assert(backhaul.max_results == 5);
  assert(backhaul.grid_cell_degrees == 0.5);

  const auto reputation = freight::config::ReputationOptionsFrom(config);
  assert(reputation.post_pickup_penalty == 0.3);
  assert(reputation.neutral_default == 0.5);

  const auto dispatch = freight::config::DispatchOptionsFrom(config);
  assert(dispatch.no_show_grace_ms == 900000);
  assert(dispatch.sweep_interval_ms == 60000);
}

void TestEmptyDocumentUsesDefaults() {
  const auto config = ConfigLoader::LoadFromString("");
  assert(!config.has_server());
  assert(!config.database().has_sqlite());

  const auto auction = freight::config::AuctionOptionsFrom(config);
  assert(auction.default_duration_ms == 15 * 60 * 1000);
  assert(auction.max_bids_per_window == 0);

  const auto weights = freight::config::RankingWeightsFrom(config);
  assert(weights.price == 0.50);
  assert(weights.reputation == 0.25);
  assert(weights.proximity == 0.15);
  assert(weights.backhaul == 0.10);
}

void TestZeroDurationMeansExplicitClose() {
  const auto config = ConfigLoader::LoadFromString(R"(auction:
  default_duration_ms: 0
)");
  assert(config.auction().has_default_duration_ms());
  assert(freight::config::AuctionOptionsFrom(config).default_duration_ms == 0);

  // Without the key the built-in duration stays.
  const auto unset = ConfigLoader::LoadFromString(R"(auction:
  min_price_floor: 10
)");
  assert(freight::config::AuctionOptionsFrom(unset).default_duration_ms == 15 * 60 * 1000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\freight\\\"quoted\"\\db.sqlite"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\freight\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "50061"
database:
  memory: {}
)");
  assert(config.server().bind_address() == "50061");
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
auction:
  default_duration: 1000
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileAndMalformedYaml() {
  bool missing = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/freight-exchange.yaml");
  } catch (const std::runtime_error&) {
    missing = true;
  }
  assert(missing);

  bool malformed = false;
  try {
    (void)ConfigLoader::LoadFromString("server: [unterminated");
  } catch (const std::runtime_error&) {
    malformed = true;
  }
  assert(malformed);

  bool not_a_map = false;
  try {
    (void)ConfigLoader::LoadFromString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    not_a_map = true;
  }
  assert(not_a_map);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyDocumentUsesDefaults();
  TestZeroDurationMeansExplicitClose();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileAndMalformedYaml();

  std::cout << "freight_exchange_unit_config_loader: pass\n";
  return 0;
}
