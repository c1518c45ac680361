// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for bracket::ConfigLoader.
//
// Validates:
//   - Required keys, defaults for optional keys
//   - Range validation names the offending key
//   - Malformed JSON and missing files are reported as exceptions
// =============================================================================

#include "bracket/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

using bracket::ConfigLoader;
using bracket::EngineConfig;

namespace {

const char* kMinimal = R"({
  "instrument": { "point_value": 50.0 },
  "risk": { "max_risk_per_trade": 500.0 }
})";

std::string messageOf(const std::string& json) {
  try {
    ConfigLoader::parse(json);
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return {};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Minimal config: every optional key takes its default.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MinimalConfigUsesDefaults) {
  const EngineConfig config = ConfigLoader::parse(kMinimal);
  const EngineConfig defaults;

  EXPECT_DOUBLE_EQ(config.instrument.point_value, 50.0);
  EXPECT_EQ(config.instrument.symbol, defaults.instrument.symbol);
  EXPECT_DOUBLE_EQ(config.risk.max_risk_per_trade, 500.0);
  EXPECT_EQ(config.risk.trade_lots, defaults.risk.trade_lots);
  EXPECT_DOUBLE_EQ(config.risk.stop_multiplier, defaults.risk.stop_multiplier);
  EXPECT_FALSE(config.risk.trailing_enabled);
  EXPECT_EQ(config.signal_endpoint, defaults.signal_endpoint);
  EXPECT_EQ(config.order_id_prefix, "BRK");
  EXPECT_FALSE(config.paper_oco);
}

// -----------------------------------------------------------------------------
// 2. Full config: every section is read.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, FullConfigOverridesEverything) {
  const EngineConfig config = ConfigLoader::parse(R"({
    "instrument": { "symbol": "NQ", "point_value": 20.0, "quantity_step": 2 },
    "risk": {
      "max_risk_per_trade": 800.0,
      "position_size_factor": 2,
      "trade_lots": 3,
      "stop_multiplier": 1.5,
      "target_multiplier": 3.0,
      "min_stop_points": 4.0,
      "max_stop_points": 30.0,
      "trailing_enabled": true
    },
    "endpoints": {
      "signals": "ipc:///tmp/sig",
      "commands": "",
      "telemetry": ""
    },
    "execution": { "order_id_prefix": "NQB", "paper_oco": true }
  })");

  EXPECT_EQ(config.instrument.symbol, "NQ");
  EXPECT_EQ(config.instrument.quantity_step, 2);
  EXPECT_EQ(config.risk.position_size_factor, 2);
  EXPECT_EQ(config.risk.trade_lots, 3);
  EXPECT_DOUBLE_EQ(config.risk.stop_multiplier, 1.5);
  EXPECT_DOUBLE_EQ(config.risk.target_multiplier, 3.0);
  EXPECT_DOUBLE_EQ(config.risk.min_stop_points, 4.0);
  EXPECT_DOUBLE_EQ(config.risk.max_stop_points, 30.0);
  EXPECT_TRUE(config.risk.trailing_enabled);
  EXPECT_EQ(config.signal_endpoint, "ipc:///tmp/sig");
  EXPECT_TRUE(config.command_endpoint.empty());
  EXPECT_TRUE(config.telemetry_endpoint.empty());
  EXPECT_EQ(config.order_id_prefix, "NQB");
  EXPECT_TRUE(config.paper_oco);
}

// -----------------------------------------------------------------------------
// 3. Missing required keys and malformed JSON.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MissingRequiredKeyThrows) {
  EXPECT_THROW(ConfigLoader::parse(R"({"risk": {"max_risk_per_trade": 1}})"),
               std::invalid_argument);
  EXPECT_THROW(
      ConfigLoader::parse(R"({"instrument": {"point_value": 50}, "risk": {}})"),
      std::invalid_argument);
}

TEST(ConfigLoaderTest, MalformedJsonThrows) {
  EXPECT_THROW(ConfigLoader::parse("{ not json"), std::invalid_argument);
  EXPECT_THROW(ConfigLoader::parse(R"({"instrument": {"point_value": "x"},
                                       "risk": {"max_risk_per_trade": 1}})"),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. Range validation reports the key.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ValidationNamesOffendingKey) {
  EXPECT_NE(messageOf(R"({"instrument": {"point_value": 0},
                          "risk": {"max_risk_per_trade": 500}})")
                .find("instrument.point_value"),
            std::string::npos);
  EXPECT_NE(messageOf(R"({"instrument": {"point_value": 50},
                          "risk": {"max_risk_per_trade": -1}})")
                .find("risk.max_risk_per_trade"),
            std::string::npos);
  EXPECT_NE(messageOf(R"({"instrument": {"point_value": 50},
                          "risk": {"max_risk_per_trade": 500,
                                   "min_stop_points": 50,
                                   "max_stop_points": 10}})")
                .find("risk.min_stop_points"),
            std::string::npos);
  EXPECT_NE(messageOf(R"({"instrument": {"point_value": 50},
                          "risk": {"max_risk_per_trade": 500,
                                   "trade_lots": 0}})")
                .find("risk.trade_lots"),
            std::string::npos);
}

TEST(ConfigLoaderTest, ZeroRiskBudgetIsAllowed) {
  const EngineConfig config = ConfigLoader::parse(
      R"({"instrument": {"point_value": 50}, "risk": {"max_risk_per_trade": 0}})");
  EXPECT_DOUBLE_EQ(config.risk.max_risk_per_trade, 0.0);
}

// -----------------------------------------------------------------------------
// 5. File loading.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "bracket_config_test.json";
  {
    std::ofstream out(path);
    out << kMinimal;
  }

  const EngineConfig config = ConfigLoader::loadFromFile(path);
  EXPECT_DOUBLE_EQ(config.instrument.point_value, 50.0);
}

TEST(ConfigLoaderTest, MissingFileThrowsRuntimeError) {
  EXPECT_THROW(ConfigLoader::loadFromFile("/nonexistent/bracket.json"),
               std::runtime_error);
}
